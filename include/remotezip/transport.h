// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace remotezip {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Transport configuration passed through untouched by the core
 *
 * `headers` are added to every request. `settings` are interpreted only by the
 * transport implementation; the curl transport treats each key as a libcurl
 * easy-option name without the CURLOPT_ prefix (e.g. "TIMEOUT_MS", "PROXY").
 */
struct TransportOptions {
  HeaderList headers;
  std::map<std::string, std::string> settings;
};

/// Response headers with case-insensitive lookup
class ResponseHeaders {
public:
  void set(const std::string &name, std::string value);
  std::optional<std::string> find(const std::string &name) const;
  bool contains(const std::string &name) const { return find(name).has_value(); }

private:
  std::map<std::string, std::string> _values; ///< Keyed by lower-cased name
};

/**
 * @brief Forward-only body of a response whose headers already arrived
 *
 * read() blocks until at least one byte is available or the body ended
 * (returns 0). close() releases the underlying connection and is idempotent.
 */
class IResponseBody {
public:
  virtual ~IResponseBody() = default;

  virtual size_t read(void *buffer, size_t size) = 0;
  virtual void close() = 0;
  virtual bool closed() const = 0;
};

struct TransportResponse {
  long status = 0;
  ResponseHeaders headers;
  std::unique_ptr<IResponseBody> body; ///< Null for metadata-only requests
};

/**
 * @brief Request/response transport used by RangeFetcher
 *
 * Implementations report connection-level failures by throwing TransportError.
 * HTTP error statuses are returned, not thrown; interpretation is left to the
 * caller.
 */
class ITransport {
public:
  virtual ~ITransport() = default;

  /// GET returning once the response headers are complete; the body is pulled lazily
  virtual TransportResponse get(const std::string &url, const HeaderList &headers, const TransportOptions &options) = 0;

  /// Metadata-only request (HEAD)
  virtual TransportResponse head(const std::string &url, const HeaderList &headers, const TransportOptions &options) = 0;
};

/// Default transport backed by libcurl
std::shared_ptr<ITransport> make_curl_transport();

} // namespace remotezip
