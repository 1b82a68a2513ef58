// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include "remotezip/transport.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace remotezip_test {

using namespace remotezip;

/// Shared accounting for every body a MemoryTransport hands out
struct BodyLedger {
  uint64_t opened = 0;
  uint64_t closed = 0;
  uint64_t max_open = 0;

  uint64_t open() const { return opened - closed; }
};

class MemoryBody final : public IResponseBody {
public:
  MemoryBody(std::shared_ptr<BodyLedger> ledger, std::vector<uint8_t> bytes)
      : _ledger(std::move(ledger))
      , _bytes(std::move(bytes)) {
    ++_ledger->opened;
    _ledger->max_open = std::max(_ledger->max_open, _ledger->open());
  }

  size_t read(void *buffer, size_t size) override {
    if (_closed) {
      throw std::logic_error("read on a closed memory body");
    }
    const size_t count = std::min(size, _bytes.size() - _position);
    if (count > 0) {
      std::memcpy(buffer, _bytes.data() + _position, count);
      _position += count;
    }
    return count;
  }

  void close() override {
    if (_closed) {
      return;
    }
    _closed = true;
    ++_ledger->closed;
  }

  bool closed() const override { return _closed; }

private:
  std::shared_ptr<BodyLedger> _ledger;
  std::vector<uint8_t> _bytes;
  size_t _position = 0;
  bool _closed = false;
};

/**
 * @brief ITransport serving a byte vector the way a range-capable HTTP server would
 *
 * Behavior switches emulate less capable servers; counters record every call.
 */
class MemoryTransport final : public ITransport {
public:
  explicit MemoryTransport(std::vector<uint8_t> data)
      : _data(std::move(data))
      , _ledger(std::make_shared<BodyLedger>()) {}

  bool honor_ranges = true;        ///< false: answer 200 with the full body and no Content-Range
  bool honor_suffix = true;        ///< false: suffix ranges are answered like honor_ranges == false
  bool send_content_length = true; ///< on HEAD responses
  long forced_status = 0;          ///< non-zero: every request answers with this status
  bool throw_on_request = false;   ///< raise std::runtime_error instead of answering
  size_t max_window = 0;           ///< non-zero: serve at most this many bytes per range

  TransportResponse get(const std::string &url, const HeaderList &headers, const TransportOptions &options) override {
    record(url, headers, options);
    ++gets;

    TransportResponse response;
    if (forced_status != 0) {
      response.status = forced_status;
      response.body = std::make_unique<MemoryBody>(_ledger, std::vector<uint8_t>());
      return response;
    }

    const std::string *range = find_header(headers, "Range");
    if (range) {
      ranges.push_back(*range);
    }
    const bool suffix = range && range->compare(0, 7, "bytes=-") == 0;
    if (!range || !honor_ranges || (suffix && !honor_suffix)) {
      response.status = 200;
      response.headers.set("Content-Length", std::to_string(_data.size()));
      response.body = std::make_unique<MemoryBody>(_ledger, _data);
      return response;
    }

    int64_t first = 0;
    int64_t last = 0;
    if (!resolve(*range, first, last)) {
      response.status = 416;
      response.headers.set("Content-Range", "bytes */" + std::to_string(_data.size()));
      response.body = std::make_unique<MemoryBody>(_ledger, std::vector<uint8_t>());
      return response;
    }

    response.status = 206;
    response.headers.set("Content-Range", "bytes " + std::to_string(first) + "-" + std::to_string(last) + "/" + std::to_string(_data.size()));
    response.headers.set("Content-Length", std::to_string(last - first + 1));
    response.body = std::make_unique<MemoryBody>(_ledger, std::vector<uint8_t>(_data.begin() + first, _data.begin() + last + 1));
    return response;
  }

  TransportResponse head(const std::string &url, const HeaderList &headers, const TransportOptions &options) override {
    record(url, headers, options);
    ++heads;

    TransportResponse response;
    response.status = forced_status != 0 ? forced_status : 200;
    if (send_content_length) {
      response.headers.set("Content-Length", std::to_string(_data.size()));
    }
    return response;
  }

  const std::vector<uint8_t> &data() const { return _data; }
  const BodyLedger &ledger() const { return *_ledger; }

  uint64_t gets = 0;
  uint64_t heads = 0;
  std::vector<std::string> ranges; ///< Range header of every GET, in order
  HeaderList last_headers;
  TransportOptions last_options;
  std::string last_url;

private:
  static const std::string *find_header(const HeaderList &headers, const std::string &name) {
    for (const auto &header : headers) {
      if (header.first == name) {
        return &header.second;
      }
    }
    return nullptr;
  }

  void record(const std::string &url, const HeaderList &headers, const TransportOptions &options) {
    if (throw_on_request) {
      throw std::runtime_error("simulated connection reset");
    }
    last_url = url;
    last_headers = headers;
    last_options = options;
  }

  bool resolve(const std::string &range, int64_t &first, int64_t &last) const {
    const auto size = static_cast<int64_t>(_data.size());
    const std::string bounds = range.substr(6);
    const auto dash = bounds.find('-');
    if (size == 0 || dash == std::string::npos) {
      return false;
    }
    if (dash == 0) {
      const int64_t count = std::stoll(bounds.substr(1));
      first = std::max<int64_t>(0, size - count);
      last = size - 1;
    } else {
      first = std::stoll(bounds.substr(0, dash));
      last = dash + 1 < bounds.size() ? std::stoll(bounds.substr(dash + 1)) : size - 1;
      if (first >= size) {
        return false;
      }
      last = std::min(last, size - 1);
    }
    if (max_window != 0) {
      last = std::min<int64_t>(last, first + static_cast<int64_t>(max_window) - 1);
    }
    return true;
  }

  std::vector<uint8_t> _data;
  std::shared_ptr<BodyLedger> _ledger;
};

/// Deterministic, poorly compressible filler
inline std::vector<uint8_t> patterned_bytes(size_t size, uint32_t seed = 1) {
  std::vector<uint8_t> bytes(size);
  uint32_t state = seed * 2654435761u + 1;
  for (auto &byte : bytes) {
    state = state * 1103515245u + 12345u;
    byte = static_cast<uint8_t>(state >> 16);
  }
  return bytes;
}

} // namespace remotezip_test
