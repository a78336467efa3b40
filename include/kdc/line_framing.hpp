#pragma once

/**
 * @file line_framing.hpp
 * @brief Newline framing for byte streams (TCP/TLS control channel, BLE notifications).
 *
 * @details
 * PURPOSE
 * -------
 * Control-channel packets are JSON lines. Bytes arrive in arbitrary chunks; this
 * decoder re-cuts them into complete lines without ever buffering more than
 * `max_line` bytes for a single frame.
 *
 * OVERSIZE POLICY
 * ---------------
 * A line that grows past `max_line` is not kept. The decoder drops what it has,
 * reports one overflow, and ignores everything up to the next `\n`, then
 * resynchronises. Memory stays bounded no matter what a peer sends.
 *
 * USAGE
 * -----
 * @code
 *   kdc::LineDecoder dec(1024 * 1024);
 *   std::vector<std::string> lines;
 *   size_t overflows = dec.feed(buf, n, lines);
 *   for (auto& l : lines) kdc::decode(l, pkt);
 * @endcode
 */

#include <cstddef>
#include <string>
#include <vector>

namespace kdc {

class LineDecoder {
public:
  explicit LineDecoder(std::size_t max_line) : max_line_(max_line) {}

  /**
   * @brief Feed a chunk; append completed lines (without `\n`) to @p lines.
   * @return number of lines dropped for exceeding the cap in this chunk.
   */
  std::size_t feed(const char* data, std::size_t n, std::vector<std::string>& lines) {
    std::size_t overflows = 0;
    for (std::size_t i = 0; i < n; ++i) {
      char c = data[i];
      if (c == '\n') {
        if (discarding_) {
          discarding_ = false;         // resynchronised on this terminator
        } else if (!buf_.empty()) {
          lines.push_back(std::move(buf_));
          buf_.clear();
        }
        continue;
      }
      if (discarding_) continue;
      if (buf_.size() >= max_line_) {
        buf_.clear();
        buf_.shrink_to_fit();          // give the oversized buffer back
        discarding_ = true;
        ++overflows;
        continue;
      }
      buf_.push_back(c);
    }
    return overflows;
  }

  /// Bytes held for the line in progress.
  std::size_t pending() const { return buf_.size(); }

  void reset() { buf_.clear(); discarding_ = false; }

private:
  std::size_t max_line_;
  std::string buf_;
  bool        discarding_{false};
};

} // namespace kdc
