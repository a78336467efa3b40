#pragma once
/**
 * @file json_file.hpp
 * @brief Small JSON documents on disk: the trust store, device registry,
 *        transfer checkpoints and the config file all go through here.
 *
 * @details
 * Writes are crash-safe: the document is written to `<path>.tmp`, flushed,
 * then renamed over `<path>`. A crash leaves either the old file or the new
 * one, never a torn mix. Reads report a missing file separately from a
 * corrupt one so callers can start empty on first run but refuse to
 * overwrite a file they could not parse.
 */

#include <string>

#include <nlohmann/json.hpp>

#include "kdc/status.hpp"

namespace kdc {

enum class JsonReadResult : uint8_t { Ok = 0, Missing, Error };

/**
 * @brief Read and parse @p path.
 * @param err filled on Error (Config for bad JSON, PermissionDenied/Io for file errors)
 */
JsonReadResult read_json_file(const std::string& path, nlohmann::json& out, Status& err);

/// Atomically replace @p path with @p doc (pretty-printed, 0600 when @p secret).
Status write_json_file(const std::string& path, const nlohmann::json& doc, bool secret = false);

/// `$XDG_CONFIG_HOME/kdeconnect-core`, falling back to `$HOME/.config/kdeconnect-core`.
std::string default_state_dir();

} // namespace kdc
