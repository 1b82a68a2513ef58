// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "remotezip/window_buffer.h"
#include "remotezip/remote_error.h"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

namespace remotezip {

// ============================================================================
// WindowBuffer
// ============================================================================

WindowBuffer::WindowBuffer(uint64_t offset, uint64_t size, std::unique_ptr<IResponseBody> body)
    : _offset(offset)
    , _size(size)
    , _body(std::move(body)) {
  if (!_body) {
    throw std::invalid_argument("WindowBuffer requires a response body");
  }
}

WindowBuffer::~WindowBuffer() { close(); }

bool WindowBuffer::contains(int64_t position) const {
  if (position < 0) {
    return false;
  }
  const auto absolute = static_cast<uint64_t>(position);
  return absolute >= _offset && absolute < _offset + _size;
}

std::vector<uint8_t> WindowBuffer::read(size_t size) {
  if (size == 0 || size > remaining()) {
    size = static_cast<size_t>(remaining());
  }
  std::vector<uint8_t> content(size);
  size_t total = 0;
  while (total < size) {
    const size_t chunk = read_into(content.data() + total, size - total);
    if (chunk == 0) {
      break;
    }
    total += chunk;
  }
  content.resize(total);
  return content;
}

size_t WindowBuffer::read_into(void *buffer, size_t size) {
  if (_closed) {
    throw std::logic_error("read on a closed window buffer");
  }
  size = static_cast<size_t>(std::min<uint64_t>(size, remaining()));
  if (size == 0) {
    return 0;
  }
  size_t count = 0;
  try {
    count = read_source(buffer, size);
  } catch (const RemoteZipError &) {
    throw;
  } catch (const std::exception &ex) {
    throw TransportError(std::string("Failed to read response body: ") + ex.what());
  }
  _relative += count;
  return count;
}

int64_t WindowBuffer::seek(int64_t offset, int whence) {
  if (_closed) {
    throw std::logic_error("seek on a closed window buffer");
  }

  int64_t target = 0;
  switch (whence) {
  case SEEK_SET:
    target = offset;
    break;
  case SEEK_CUR:
    target = tell() + offset;
    break;
  case SEEK_END:
    target = static_cast<int64_t>(end()) + offset;
    break;
  default:
    throw std::invalid_argument("invalid whence: " + std::to_string(whence));
  }

  if (!contains(target)) {
    throw OutOfBoundError("Position " + std::to_string(target) + " out of window [" + std::to_string(_offset) + ", " + std::to_string(end()) + ")");
  }

  const uint64_t relative = static_cast<uint64_t>(target) - _offset;
  if (relative != _relative) {
    try {
      reposition(relative);
    } catch (const RemoteZipError &) {
      throw;
    } catch (const std::exception &ex) {
      throw TransportError(std::string("Failed to advance response body: ") + ex.what());
    }
    _relative = relative;
  }
  return target;
}

void WindowBuffer::close() {
  if (_closed) {
    return;
  }
  _closed = true;
  _body->close();
}

// ============================================================================
// BufferedWindow
// ============================================================================

BufferedWindow::BufferedWindow(uint64_t offset, uint64_t size, std::unique_ptr<IResponseBody> body)
    : WindowBuffer(offset, size, std::move(body)) {
  _data.resize(static_cast<size_t>(size));
  size_t total = 0;
  while (total < _data.size()) {
    const size_t chunk = this->body().read(_data.data() + total, _data.size() - total);
    if (chunk == 0) {
      break;
    }
    total += chunk;
  }
  if (total != _data.size()) {
    throw TransportError("Response body ended after " + std::to_string(total) + " of " + std::to_string(size) + " bytes");
  }
}

size_t BufferedWindow::read_source(void *buffer, size_t size) {
  std::memcpy(buffer, _data.data() + _relative, size);
  return size;
}

void BufferedWindow::reposition(uint64_t relative) { (void)relative; }

// ============================================================================
// StreamingWindow
// ============================================================================

StreamingWindow::StreamingWindow(uint64_t offset, uint64_t size, std::unique_ptr<IResponseBody> body)
    : WindowBuffer(offset, size, std::move(body)) {}

size_t StreamingWindow::read_source(void *buffer, size_t size) { return body().read(buffer, size); }

void StreamingWindow::reposition(uint64_t relative) {
  if (relative < _relative) {
    throw NonRewindableError("Negative seek not supported on a streaming window");
  }

  std::array<uint8_t, 16 * 1024> scratch;
  uint64_t to_skip = relative - _relative;
  while (to_skip > 0) {
    const size_t chunk = body().read(scratch.data(), static_cast<size_t>(std::min<uint64_t>(to_skip, scratch.size())));
    if (chunk == 0) {
      throw TransportError("Response body ended before the requested position");
    }
    to_skip -= chunk;
    _relative += chunk;
  }
}

} // namespace remotezip
