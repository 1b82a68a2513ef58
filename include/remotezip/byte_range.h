// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace remotezip {

/**
 * @brief Request descriptor for a ranged fetch
 *
 * Three shapes are representable:
 *   closed(a, b)  bytes a..b inclusive
 *   from(a)       bytes a..end of resource
 *   suffix(n)     the last n bytes (start = -n, no end)
 */
struct ByteRange {
  int64_t start = 0;
  std::optional<int64_t> end;

  static ByteRange closed(int64_t first, int64_t last);
  static ByteRange from(int64_t first);
  static ByteRange suffix(int64_t count);

  bool is_suffix() const { return start < 0 && !end; }
  bool is_closed() const { return end.has_value(); }

  /// Number of bytes covered by a closed range
  int64_t length() const;

  /// Value for the HTTP Range header ("bytes=a-b", "bytes=-n", "bytes=a-")
  std::string to_header_value() const;
};

/// Window actually served, as echoed by the server
struct ContentRange {
  int64_t first = 0;
  int64_t last = 0;
  std::optional<int64_t> total; ///< Absent for "bytes a-b/*"

  int64_t length() const { return last - first + 1; }
};

/**
 * @brief Parse a Content-Range response header value
 * @throws RangeUnsupportedError when the value does not describe a byte window
 */
ContentRange parse_content_range(const std::string &value);

} // namespace remotezip
