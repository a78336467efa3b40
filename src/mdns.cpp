// ============================================================================
// mdns.cpp — implementation for mdns.hpp
// DNS wire format: 12-byte header, questions, then resource records.
// ============================================================================

#include "kdc/mdns.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>

namespace kdc::mdns {

namespace {

constexpr uint16_t TYPE_A    = 1;
constexpr uint16_t TYPE_PTR  = 12;
constexpr uint16_t TYPE_TXT  = 16;
constexpr uint16_t TYPE_SRV  = 33;
constexpr uint16_t TYPE_ANY  = 255;
constexpr uint16_t CLASS_IN  = 1;
constexpr uint16_t CACHE_FLUSH = 0x8000;
constexpr uint16_t FLAG_RESPONSE = 0x8400;   // QR + AA
constexpr uint32_t TTL_HOST  = 120;
constexpr uint32_t TTL_PTR   = 4500;
constexpr int      MAX_POINTER_HOPS = 16;
constexpr std::size_t MAX_NAME = 255;

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

// -------- writer --------

void put16(std::string& b, uint16_t v) { b.push_back(char(v >> 8)); b.push_back(char(v & 0xFF)); }
void put32(std::string& b, uint32_t v) { put16(b, uint16_t(v >> 16)); put16(b, uint16_t(v & 0xFFFF)); }

void put_name(std::string& b, const std::string& name) {
  std::size_t start = 0;
  while (start < name.size()) {
    std::size_t dot = name.find('.', start);
    if (dot == std::string::npos) dot = name.size();
    std::size_t len = std::min<std::size_t>(dot - start, 63);
    b.push_back(char(len));
    b.append(name, start, len);
    start = dot + 1;
  }
  b.push_back('\0');
}

void put_header(std::string& b, uint16_t flags, uint16_t qd, uint16_t an) {
  put16(b, 0);       // id is always 0 in mDNS
  put16(b, flags);
  put16(b, qd);
  put16(b, an);
  put16(b, 0);
  put16(b, 0);
}

void put_rr(std::string& b, const std::string& name, uint16_t type, uint16_t cls, uint32_t ttl,
            const std::string& rdata) {
  put_name(b, name);
  put16(b, type);
  put16(b, cls);
  put32(b, ttl);
  put16(b, uint16_t(rdata.size()));
  b += rdata;
}

// -------- reader --------

struct Reader {
  const std::string& d;
  std::size_t        off{0};

  bool u8(uint8_t& v) {
    if (off + 1 > d.size()) return false;
    v = uint8_t(d[off++]);
    return true;
  }
  bool u16(uint16_t& v) {
    if (off + 2 > d.size()) return false;
    v = uint16_t((uint8_t(d[off]) << 8) | uint8_t(d[off + 1]));
    off += 2;
    return true;
  }
  bool u32(uint32_t& v) {
    uint16_t hi, lo;
    if (!u16(hi) || !u16(lo)) return false;
    v = (uint32_t(hi) << 16) | lo;
    return true;
  }

  // Follows compression pointers; off ends just past the name as stored here.
  bool name(std::string& out) {
    out.clear();
    std::size_t pos = off;
    std::size_t resume = 0;
    int hops = 0;
    while (true) {
      if (pos >= d.size()) return false;
      uint8_t len = uint8_t(d[pos]);
      if ((len & 0xC0) == 0xC0) {
        if (pos + 1 >= d.size() || ++hops > MAX_POINTER_HOPS) return false;
        if (resume == 0) resume = pos + 2;
        pos = std::size_t(((len & 0x3F) << 8) | uint8_t(d[pos + 1]));
        continue;
      }
      if (len & 0xC0) return false;
      if (len == 0) { pos += 1; break; }
      if (pos + 1 + len > d.size()) return false;
      if (!out.empty()) out.push_back('.');
      out.append(d, pos + 1, len);
      if (out.size() > MAX_NAME) return false;
      pos += 1 + len;
    }
    off = resume ? resume : pos;
    out = lower(out);
    return true;
  }
};

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string build_query() {
  std::string b;
  put_header(b, 0, 1, 0);
  put_name(b, SERVICE_TYPE);
  put16(b, TYPE_PTR);
  put16(b, CLASS_IN);
  return b;
}

std::string build_announcement(const DeviceIdentity& self, const std::string& ipv4, uint16_t tcp_port) {
  const std::string instance = self.device_id + "." + SERVICE_TYPE;
  const std::string host     = self.device_id + ".local";

  std::string ptr;
  put_name(ptr, instance);

  std::string srv;
  put16(srv, 0);         // priority
  put16(srv, 0);         // weight
  put16(srv, tcp_port);
  put_name(srv, host);

  std::string txt;
  auto add_txt = [&txt](const std::string& kv) {
    std::size_t n = std::min<std::size_t>(kv.size(), 255);
    txt.push_back(char(n));
    txt.append(kv, 0, n);
  };
  add_txt("id=" + self.device_id);
  add_txt("name=" + self.name);
  add_txt(std::string("type=") + to_string(self.type));
  add_txt("protocol=" + std::to_string(self.protocol_version));

  in_addr addr{};
  const bool have_a = ::inet_pton(AF_INET, ipv4.c_str(), &addr) == 1;

  std::string b;
  put_header(b, FLAG_RESPONSE, 0, have_a ? 4 : 3);
  put_rr(b, SERVICE_TYPE, TYPE_PTR, CLASS_IN, TTL_PTR, ptr);
  put_rr(b, instance, TYPE_SRV, uint16_t(CLASS_IN | CACHE_FLUSH), TTL_HOST, srv);
  put_rr(b, instance, TYPE_TXT, uint16_t(CLASS_IN | CACHE_FLUSH), TTL_PTR, txt);
  if (have_a) {
    std::string a(reinterpret_cast<const char*>(&addr.s_addr), 4);   // already network order
    put_rr(b, host, TYPE_A, uint16_t(CLASS_IN | CACHE_FLUSH), TTL_HOST, a);
  }
  return b;
}

bool is_service_query(const std::string& datagram) {
  Reader r{datagram};
  uint16_t id, flags, qd, an, ns, ar;
  if (!r.u16(id) || !r.u16(flags) || !r.u16(qd) || !r.u16(an) || !r.u16(ns) || !r.u16(ar)) return false;
  if (flags & 0x8000) return false;   // a response
  for (uint16_t i = 0; i < qd; ++i) {
    std::string name;
    uint16_t type, cls;
    if (!r.name(name) || !r.u16(type) || !r.u16(cls)) return false;
    if (name == SERVICE_TYPE && (type == TYPE_PTR || type == TYPE_ANY)) return true;
  }
  return false;
}

// ---------------------------------------------------------------------------
// parse_response()
// ----------------
// Collect PTR targets, SRV, TXT and A records in one pass, then join them by
// instance and host name. A service known only through SRV/TXT (no PTR) is
// still reported.
// ---------------------------------------------------------------------------
bool parse_response(const std::string& datagram, std::vector<MdnsService>& out) {
  Reader r{datagram};
  uint16_t id, flags, qd, an, ns, ar;
  if (!r.u16(id) || !r.u16(flags) || !r.u16(qd) || !r.u16(an) || !r.u16(ns) || !r.u16(ar)) return false;
  if (!(flags & 0x8000)) return false;

  for (uint16_t i = 0; i < qd; ++i) {
    std::string name;
    uint16_t type, cls;
    if (!r.name(name) || !r.u16(type) || !r.u16(cls)) return false;
  }

  std::map<std::string, MdnsService> services;   // by instance
  std::map<std::string, std::string> srv_host;   // instance -> host
  std::map<std::string, std::string> host_ip;

  const std::string suffix = std::string(".") + SERVICE_TYPE;
  const uint32_t total = uint32_t(an) + ns + ar;
  for (uint32_t i = 0; i < total; ++i) {
    std::string name;
    uint16_t type, cls, rdlen;
    uint32_t ttl;
    if (!r.name(name) || !r.u16(type) || !r.u16(cls) || !r.u32(ttl) || !r.u16(rdlen)) return false;
    if (r.off + rdlen > datagram.size()) return false;
    const std::size_t rdata_end = r.off + rdlen;

    if (type == TYPE_PTR && name == SERVICE_TYPE) {
      std::string target;
      if (!r.name(target)) return false;
      if (ends_with(target, suffix)) services[target].instance = target;
    } else if (type == TYPE_SRV && ends_with(name, suffix)) {
      uint16_t prio, weight, port;
      std::string target;
      if (!r.u16(prio) || !r.u16(weight) || !r.u16(port) || !r.name(target)) return false;
      services[name].instance = name;
      services[name].port     = port;
      srv_host[name]          = target;
    } else if (type == TYPE_TXT && ends_with(name, suffix)) {
      MdnsService& svc = services[name];
      svc.instance = name;
      while (r.off < rdata_end) {
        uint8_t len;
        if (!r.u8(len) || r.off + len > rdata_end) return false;
        std::string kv = datagram.substr(r.off, len);
        r.off += len;
        std::size_t eq = kv.find('=');
        if (eq != std::string::npos && eq > 0) svc.txt[lower(kv.substr(0, eq))] = kv.substr(eq + 1);
      }
    } else if (type == TYPE_A && rdlen == 4) {
      char text[INET_ADDRSTRLEN] = {0};
      ::inet_ntop(AF_INET, datagram.data() + r.off, text, sizeof(text));
      host_ip[name] = text;
    }
    r.off = rdata_end;
  }

  for (auto& [instance, svc] : services) {
    auto h = srv_host.find(instance);
    if (h != srv_host.end()) {
      auto ip = host_ip.find(h->second);
      if (ip != host_ip.end()) svc.ipv4 = ip->second;
    }
    out.push_back(svc);
  }
  return true;
}

bool identity_from_txt(const MdnsService& svc, DeviceIdentity& out) {
  auto get = [&svc](const char* k) {
    auto it = svc.txt.find(k);
    return it == svc.txt.end() ? std::string() : it->second;
  };
  DeviceIdentity id;
  id.device_id = get("id");
  if (!is_valid_device_id(id.device_id)) return false;
  id.name = get("name");
  id.type = device_type_from_string(get("type"));
  const std::string proto = get("protocol");
  if (!proto.empty() && std::all_of(proto.begin(), proto.end(), [](unsigned char c) { return std::isdigit(c) != 0; }) && proto.size() < 6)
    id.protocol_version = static_cast<uint32_t>(std::stoul(proto));
  if (svc.port != 0) id.tcp_port = svc.port;
  out = std::move(id);
  return true;
}

} // namespace kdc::mdns
