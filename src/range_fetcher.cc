// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "remotezip/range_fetcher.h"
#include "remotezip/remote_error.h"

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string>
#include <utility>

namespace remotezip {

namespace {

void discard(TransportResponse &response) {
  if (response.body) {
    response.body->close();
  }
}

std::string describe_status(const std::string &url, long status) { return "HTTP status " + std::to_string(status) + " for " + url; }

// Runs a transport call and funnels foreign exception types into TransportError.
template <typename Fn> auto guarded_transport_call(const std::string &what, Fn &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const RemoteZipError &) {
    throw;
  } catch (const std::exception &ex) {
    throw TransportError(what + ": " + ex.what());
  }
}

} // namespace

RangeFetcher::RangeFetcher(std::string url, std::shared_ptr<ITransport> transport, FetcherOptions options)
    : _url(std::move(url))
    , _transport(std::move(transport))
    , _options(std::move(options)) {
  if (_url.empty()) {
    throw std::invalid_argument("RangeFetcher requires a URL");
  }
  if (!_transport) {
    throw std::invalid_argument("RangeFetcher requires a transport");
  }
}

HeaderList RangeFetcher::request_headers(const ByteRange *range) const {
  HeaderList headers = _options.transport.headers;
  if (range) {
    headers.emplace_back("Range", range->to_header_value());
  }
  return headers;
}

std::unique_ptr<WindowBuffer> RangeFetcher::fetch(const ByteRange &range, bool stream) {
  ByteRange effective = range;
  if (range.is_suffix() && !_options.support_suffix_range) {
    const uint64_t size = get_size();
    if (size == 0) {
      throw OutOfBoundError("Cannot fetch the tail of an empty resource: " + _url);
    }
    const int64_t first = std::max<int64_t>(0, static_cast<int64_t>(size) + range.start);
    effective = ByteRange::closed(first, static_cast<int64_t>(size) - 1);
  }

  const HeaderList headers = request_headers(&effective);
  ++_requests_issued;
  TransportResponse response = guarded_transport_call("Ranged request failed for " + _url, [&] { return _transport->get(_url, headers, _options.transport); });

  if (response.status >= 400) {
    discard(response);
    throw TransportError(describe_status(_url, response.status), response.status);
  }

  const auto content_range = response.headers.find("Content-Range");
  if (!content_range) {
    discard(response);
    throw RangeUnsupportedError("The server doesn't support range requests: " + _url);
  }
  if (!response.body) {
    throw TransportError("Ranged response carried no body: " + _url);
  }

  ContentRange served;
  try {
    served = parse_content_range(*content_range);
  } catch (const RangeUnsupportedError &) {
    discard(response);
    throw;
  }

  const auto offset = static_cast<uint64_t>(served.first);
  const auto size = static_cast<uint64_t>(served.length());
  return guarded_transport_call("Failed to read ranged response for " + _url, [&]() -> std::unique_ptr<WindowBuffer> {
    if (stream) {
      return std::make_unique<StreamingWindow>(offset, size, std::move(response.body));
    }
    return std::make_unique<BufferedWindow>(offset, size, std::move(response.body));
  });
}

uint64_t RangeFetcher::get_size() {
  const HeaderList headers = request_headers(nullptr);
  ++_requests_issued;
  TransportResponse response = guarded_transport_call("Size request failed for " + _url, [&] { return _transport->head(_url, headers, _options.transport); });
  discard(response);

  if (response.status >= 400) {
    throw TransportError(describe_status(_url, response.status), response.status);
  }

  const auto length = response.headers.find("Content-Length");
  if (!length) {
    throw MetadataMissingError("Cannot get file size: Content-Length header missing for " + _url);
  }

  uint64_t size = 0;
  const char *first = length->data();
  const char *last = length->data() + length->size();
  const auto result = std::from_chars(first, last, size);
  if (result.ec != std::errc() || result.ptr != last) {
    throw MetadataMissingError("Cannot get file size: malformed Content-Length '" + *length + "' for " + _url);
  }
  return size;
}

} // namespace remotezip
