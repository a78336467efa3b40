// ============================================================================
// json_file.cpp — implementation for json_file.hpp
// ============================================================================

#include "kdc/json_file.hpp"

#include <cerrno>
#include <cstdio>       // std::rename
#include <cstdlib>      // getenv
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace kdc {

JsonReadResult read_json_file(const std::string& path, nlohmann::json& out, Status& err) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return JsonReadResult::Missing;

  std::ifstream in(path);
  if (!in) {
    err = Status(ErrorKind::PermissionDenied, "cannot open " + path + ": " + std::strerror(errno));
    return JsonReadResult::Error;
  }
  std::stringstream ss;
  ss << in.rdbuf();

  nlohmann::json doc = nlohmann::json::parse(ss.str(), nullptr, /*allow_exceptions*/false);
  if (doc.is_discarded()) {
    err = Status(ErrorKind::Config, path + " is not valid JSON");
    return JsonReadResult::Error;
  }
  out = std::move(doc);
  return JsonReadResult::Ok;
}

// ---------------------------------------------------------------------------
// write_json_file()
// -----------------
// tmp + rename. Parent directories are created on demand; secret files get
// their mode fixed before the rename so the final name is never world-readable.
// ---------------------------------------------------------------------------
Status write_json_file(const std::string& path, const nlohmann::json& doc, bool secret) {
  std::error_code ec;
  const fs::path target(path);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) return Status(ErrorKind::PermissionDenied, "mkdir " + target.parent_path().string() + ": " + ec.message());
  }

  const std::string tmp = path + ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::trunc);
    if (!ofs) return Status(ErrorKind::PermissionDenied, "open " + tmp + ": " + std::strerror(errno));
    ofs << doc.dump(2) << "\n";
    ofs.flush();
    if (!ofs) return Status(ErrorKind::Io, "write " + tmp + " failed");
  }
  if (secret) {
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) return Status(ErrorKind::PermissionDenied, "chmod " + tmp + ": " + ec.message());
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0)
    return Status(ErrorKind::Io, "rename " + tmp + ": " + std::strerror(errno));
  return Status();
}

std::string default_state_dir() {
  if (const char* x = std::getenv("XDG_CONFIG_HOME"); x && *x)
    return (fs::path(x) / "kdeconnect-core").string();
  const char* home = std::getenv("HOME");
  return (fs::path(home ? home : ".") / ".config" / "kdeconnect-core").string();
}

} // namespace kdc
