/**
 * @file packet.hpp
 * @brief Packet model and the newline-delimited JSON codec.
 *
 * @details
 * ## Field Brief
 * Every byte that crosses a KDE Connect control channel is one JSON object
 * followed by `\n`:
 *
 * @code
 * {"id":1718000000000,"type":"kdeconnect.ping","body":{},"payloadSize":1024,"payloadTransferInfo":{"port":1739}}\n
 * @endcode
 *
 * `Packet` is the in-memory form. It is a value type: the sender owns it until
 * it is handed to a transport, after which the transport's outbound path owns
 * its encoded bytes.
 *
 * ## Codec contract
 * - `encode()` emits exactly one trailing newline and nothing else.
 * - `decode()` is pure. It refuses oversized input before handing it to the
 *   JSON parser, rejects non-objects, a missing/empty `type`, a non-object
 *   `body`, and documents nested deeper than `CodecLimits::max_depth`.
 * - Round trip: `decode(encode(p)) == p` for every packet whose body is a
 *   JSON object.
 *
 * JSON is nlohmann::json. Parse errors are reported through `CodecError`,
 * never thrown.
 */
#ifndef KDC_PACKET_HPP
#define KDC_PACKET_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kdc {

/// Capability / packet type names used by the core itself.
namespace packet_type {
static constexpr const char* IDENTITY = "kdeconnect.identity";
static constexpr const char* PAIR     = "kdeconnect.pair";
} // namespace packet_type

struct PayloadTransferInfo {
  uint16_t port{0};

  bool operator==(const PayloadTransferInfo& o) const { return port == o.port; }
  bool operator!=(const PayloadTransferInfo& o) const { return !(*this == o); }
};

/**
 * @brief One control-channel packet.
 *
 * `id` is a millisecond timestamp; it need not be unique but is non-decreasing
 * for packets built with `make_packet()` in this process.
 */
struct Packet {
  uint64_t       id{0};
  std::string    type;
  nlohmann::json body = nlohmann::json::object();
  std::optional<uint64_t>            payload_size;
  std::optional<PayloadTransferInfo> payload_transfer_info;

  bool has_payload() const { return payload_size.has_value() && payload_transfer_info.has_value(); }

  bool operator==(const Packet& o) const;
  bool operator!=(const Packet& o) const { return !(*this == o); }
};

enum class CodecError : uint8_t {
  None = 0,
  Empty,          ///< blank line
  TooLarge,       ///< input longer than CodecLimits::max_packet_bytes
  InvalidJson,    ///< parser rejected the text
  NotAnObject,    ///< top level is not a JSON object
  MissingType,    ///< `type` absent, empty or not a string
  InvalidId,      ///< `id` present but not an unsigned integer (or numeric string)
  InvalidBody,    ///< `body` present but not an object
  InvalidPayload, ///< payloadSize / payloadTransferInfo malformed
  TooDeep,        ///< nesting exceeds CodecLimits::max_depth
};

const char* to_string(CodecError e);

struct CodecLimits {
  std::size_t max_packet_bytes{1024 * 1024};  ///< whole line, terminator excluded
  std::size_t max_depth{32};
};

/// Next non-decreasing millisecond id for locally built packets.
uint64_t next_packet_id();

/// Build a packet with a fresh id.
Packet make_packet(const std::string& type, nlohmann::json body = nlohmann::json::object());

/// Serialise to one newline-terminated line.
std::string encode(const Packet& p);

/// Size of `encode(p)` in bytes (terminator included).
std::size_t encoded_size(const Packet& p);

/**
 * @brief Parse one line into a packet.
 * @param line   text with or without the trailing `\n` (a trailing `\r` is tolerated)
 * @param out    filled only on success
 * @param limits size/depth caps applied before and during parsing
 * @return CodecError::None on success.
 */
CodecError decode(const std::string& line, Packet& out, const CodecLimits& limits = CodecLimits{});

} // namespace kdc

#endif // KDC_PACKET_HPP
