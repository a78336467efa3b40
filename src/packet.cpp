// ============================================================================
// packet.cpp — implementation for packet.hpp
// API contract lives in the header; this file covers parse guards and the
// field-by-field mapping to the wire names.
// ============================================================================

#include "kdc/packet.hpp"

#include <atomic>
#include <cstdlib>

#include "kdc/clock.hpp"

using nlohmann::json;

namespace kdc {

namespace {

constexpr const char* K_ID        = "id";
constexpr const char* K_TYPE      = "type";
constexpr const char* K_BODY      = "body";
constexpr const char* K_PSIZE     = "payloadSize";
constexpr const char* K_PINFO     = "payloadTransferInfo";
constexpr const char* K_PORT      = "port";

std::atomic<uint64_t> g_last_id{0};

// Accept an unsigned number or a string of digits (older peers send the id as text).
bool read_u64(const json& v, uint64_t& out) {
  if (v.is_number_unsigned()) { out = v.get<uint64_t>(); return true; }
  if (v.is_number_integer()) {
    auto s = v.get<int64_t>();
    if (s < 0) return false;
    out = static_cast<uint64_t>(s);
    return true;
  }
  if (v.is_string()) {
    const auto& s = v.get_ref<const std::string&>();
    if (s.empty() || s.size() > 20) return false;
    char* end = nullptr;
    unsigned long long n = std::strtoull(s.c_str(), &end, 10);
    if (!end || *end) return false;
    out = static_cast<uint64_t>(n);
    return true;
  }
  return false;
}

} // namespace

bool Packet::operator==(const Packet& o) const {
  return id == o.id && type == o.type && body == o.body &&
         payload_size == o.payload_size &&
         payload_transfer_info == o.payload_transfer_info;
}

const char* to_string(CodecError e) {
  switch (e) {
    case CodecError::None:           return "ok";
    case CodecError::Empty:          return "empty";
    case CodecError::TooLarge:       return "too_large";
    case CodecError::InvalidJson:    return "invalid_json";
    case CodecError::NotAnObject:    return "not_an_object";
    case CodecError::MissingType:    return "missing_type";
    case CodecError::InvalidId:      return "invalid_id";
    case CodecError::InvalidBody:    return "invalid_body";
    case CodecError::InvalidPayload: return "invalid_payload";
    case CodecError::TooDeep:        return "too_deep";
  }
  return "unknown";
}

uint64_t next_packet_id() {
  uint64_t now  = static_cast<uint64_t>(wall_ms());
  uint64_t prev = g_last_id.load(std::memory_order_relaxed);
  // never go backwards, even if the wall clock does
  while (true) {
    uint64_t next = now > prev ? now : prev;
    if (g_last_id.compare_exchange_weak(prev, next, std::memory_order_relaxed)) return next;
  }
}

Packet make_packet(const std::string& type, json body) {
  Packet p;
  p.id   = next_packet_id();
  p.type = type;
  p.body = body.is_object() ? std::move(body) : json::object();
  return p;
}

std::string encode(const Packet& p) {
  json j;
  j[K_ID]   = p.id;
  j[K_TYPE] = p.type;
  j[K_BODY] = p.body.is_object() ? p.body : json::object();
  if (p.payload_size) j[K_PSIZE] = *p.payload_size;
  if (p.payload_transfer_info) j[K_PINFO] = json{{K_PORT, p.payload_transfer_info->port}};

  std::string out = j.dump();
  out.push_back('\n');
  return out;
}

std::size_t encoded_size(const Packet& p) {
  return encode(p).size();
}

CodecError decode(const std::string& line, Packet& out, const CodecLimits& limits) {
  // Size guard first: nothing is handed to the parser beyond the cap.
  std::size_t n = line.size();
  while (n > 0 && (line[n - 1] == '\n' || line[n - 1] == '\r')) --n;
  if (n == 0) return CodecError::Empty;
  if (n > limits.max_packet_bytes) return CodecError::TooLarge;

  bool too_deep = false;
  const std::size_t max_depth = limits.max_depth;
  json::parser_callback_t guard =
      [&too_deep, max_depth](int depth, json::parse_event_t, json&) {
        if (static_cast<std::size_t>(depth) > max_depth) too_deep = true;
        return !too_deep;
      };

  json j = json::parse(line.begin(), line.begin() + static_cast<std::ptrdiff_t>(n),
                       guard, /*allow_exceptions*/ false);
  if (too_deep) return CodecError::TooDeep;
  if (j.is_discarded()) return CodecError::InvalidJson;
  if (!j.is_object()) return CodecError::NotAnObject;

  auto t = j.find(K_TYPE);
  if (t == j.end() || !t->is_string() || t->get_ref<const std::string&>().empty())
    return CodecError::MissingType;

  Packet p;
  p.type = t->get<std::string>();

  auto id = j.find(K_ID);
  if (id != j.end() && !read_u64(*id, p.id)) return CodecError::InvalidId;

  auto body = j.find(K_BODY);
  if (body != j.end()) {
    if (!body->is_object()) return CodecError::InvalidBody;
    p.body = std::move(*body);
  }

  auto psize = j.find(K_PSIZE);
  if (psize != j.end() && !psize->is_null()) {
    uint64_t v = 0;
    if (!read_u64(*psize, v)) return CodecError::InvalidPayload;
    p.payload_size = v;
  }

  auto pinfo = j.find(K_PINFO);
  if (pinfo != j.end() && !pinfo->is_null()) {
    if (!pinfo->is_object()) return CodecError::InvalidPayload;
    auto port = pinfo->find(K_PORT);
    uint64_t v = 0;
    if (port == pinfo->end() || !read_u64(*port, v) || v == 0 || v > 65535)
      return CodecError::InvalidPayload;
    p.payload_transfer_info = PayloadTransferInfo{static_cast<uint16_t>(v)};
  }

  out = std::move(p);
  return CodecError::None;
}

} // namespace kdc
