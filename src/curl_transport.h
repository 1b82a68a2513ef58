// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include "remotezip/transport.h"

namespace remotezip {

/**
 * @brief ITransport implementation over libcurl
 *
 * GET requests run on a private multi handle so that get() can return as soon
 * as the final response headers arrived while the body keeps flowing on demand.
 * Each response body owns its easy handle; closing the body tears the
 * connection down.
 */
class CurlTransport final : public ITransport {
public:
  CurlTransport();

  TransportResponse get(const std::string &url, const HeaderList &headers, const TransportOptions &options) override;
  TransportResponse head(const std::string &url, const HeaderList &headers, const TransportOptions &options) override;
};

} // namespace remotezip
