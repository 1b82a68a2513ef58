// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include "remotezip/transport.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace remotezip {

/**
 * @brief Bounded, file-like view over one fetched byte window
 *
 * Positions are absolute offsets into the full remote resource. A window
 * covers [offset(), offset() + size()); seeking outside it raises
 * OutOfBoundError instead of clamping, which is the signal VirtualStream uses
 * to schedule a new fetch.
 *
 * The window owns the transport body it was built from and releases it
 * exactly once, on close() or destruction, whichever comes first.
 *
 * Two variants exist:
 *   - BufferedWindow: body materialized at construction, any in-window seek
 *   - StreamingWindow: forward cursor over the live body, no rewinding
 */
class WindowBuffer {
public:
  virtual ~WindowBuffer();

  WindowBuffer(const WindowBuffer &) = delete;
  WindowBuffer &operator=(const WindowBuffer &) = delete;

  uint64_t offset() const { return _offset; }
  uint64_t size() const { return _size; }
  uint64_t end() const { return _offset + _size; }
  int64_t tell() const { return static_cast<int64_t>(_offset + _relative); }
  uint64_t remaining() const { return _size - _relative; }
  bool contains(int64_t position) const;

  virtual bool is_streaming() const = 0;

  /**
   * @brief Read from the current position
   * @param size Number of bytes wanted; 0 reads to the end of the window
   */
  std::vector<uint8_t> read(size_t size = 0);

  /// Read at most size bytes into buffer; returns bytes copied (0 at window end)
  size_t read_into(void *buffer, size_t size);

  /**
   * @brief Move the position inside the window
   * @param whence SEEK_SET (absolute), SEEK_CUR (relative) or SEEK_END (relative to window end)
   * @return New absolute position
   * @throws OutOfBoundError when the target lies outside the window
   * @throws NonRewindableError when a streaming window would move backward
   */
  int64_t seek(int64_t offset, int whence);

  /// Release the transport body; safe to call repeatedly
  void close();
  bool closed() const { return _closed; }

protected:
  WindowBuffer(uint64_t offset, uint64_t size, std::unique_ptr<IResponseBody> body);

  IResponseBody &body() { return *_body; }

  /// Copy up to size bytes starting at the current relative position
  virtual size_t read_source(void *buffer, size_t size) = 0;

  /// Make `relative` the next byte read_source() delivers; validated by seek()
  virtual void reposition(uint64_t relative) = 0;

  uint64_t _relative = 0; ///< Position relative to _offset

private:
  uint64_t _offset;
  uint64_t _size;
  std::unique_ptr<IResponseBody> _body;
  bool _closed = false;
};

/// Window whose bytes were read into memory when it was created
class BufferedWindow final : public WindowBuffer {
public:
  BufferedWindow(uint64_t offset, uint64_t size, std::unique_ptr<IResponseBody> body);

  bool is_streaming() const override { return false; }

private:
  size_t read_source(void *buffer, size_t size) override;
  void reposition(uint64_t relative) override;

  std::vector<uint8_t> _data;
};

/// Window consumed lazily from the live response body
class StreamingWindow final : public WindowBuffer {
public:
  StreamingWindow(uint64_t offset, uint64_t size, std::unique_ptr<IResponseBody> body);

  bool is_streaming() const override { return true; }

private:
  size_t read_source(void *buffer, size_t size) override;
  void reposition(uint64_t relative) override;
};

} // namespace remotezip
