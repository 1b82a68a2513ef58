// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include "remotezip/byte_range.h"
#include "remotezip/transport.h"
#include "remotezip/window_buffer.h"

#include <cstdint>
#include <memory>
#include <string>

namespace remotezip {

struct FetcherOptions {
  bool support_suffix_range = true; ///< Server understands "bytes=-N"
  TransportOptions transport;       ///< Forwarded verbatim to every request
};

/**
 * @brief Issues byte-range requests against one URL
 *
 * Every successful fetch yields a WindowBuffer describing exactly the window
 * the server reports in Content-Range, which may be narrower than requested.
 *
 * Error translation happens here: callers only ever see TransportError,
 * RangeUnsupportedError or MetadataMissingError, plus OutOfBoundError when a
 * suffix is requested from a resource of size zero.
 */
class RangeFetcher {
public:
  RangeFetcher(std::string url, std::shared_ptr<ITransport> transport, FetcherOptions options = {});

  /**
   * @brief Fetch a byte range
   * @param range Closed, open-tail or suffix range
   * @param stream true for a lazily consumed forward-only window, false to
   *               materialize the body so in-window backward seeks work
   */
  std::unique_ptr<WindowBuffer> fetch(const ByteRange &range, bool stream);

  /// Total resource length from a metadata-only request
  uint64_t get_size();

  const std::string &url() const { return _url; }
  const FetcherOptions &options() const { return _options; }

  /// Number of requests sent so far (ranged fetches and size queries)
  uint64_t requests_issued() const { return _requests_issued; }

private:
  HeaderList request_headers(const ByteRange *range) const;

  std::string _url;
  std::shared_ptr<ITransport> _transport;
  FetcherOptions _options;
  uint64_t _requests_issued = 0;
};

} // namespace remotezip
