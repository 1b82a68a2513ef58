// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include "remotezip/data_stream.h"
#include "remotezip/member_size_map.h"
#include "remotezip/range_fetcher.h"
#include "remotezip/window_buffer.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace remotezip {

struct VirtualStreamOptions {
  size_t initial_buffer_size = 64 * 1024; ///< Tail fetched by the first end-relative seek
};

/**
 * @brief Seekable stream over a remote resource, backed by one window at a time
 *
 * Seeks never fetch. A seek that lands outside the current window only records
 * the target and marks the stream unresolved; the next read() decides what to
 * fetch:
 *
 *   1. the position starts a known member     -> fetch exactly that member
 *   2. the position is inside the last member -> fetch the rest of it
 *   3. no member map installed yet (bootstrap) -> fetch the bytes requested
 *
 * A read that runs off the end of one member into the start of the next one
 * (a parser looking ahead for a data descriptor) fetches only the requested
 * bytes of that member, buffered, so a later seek to the member start is
 * served from that window and the rest of the member is a continuation.
 *
 * With a member map installed, positions outside the member region are also
 * served by a plain fetch of the requested size: anything before the first
 * member, and the trailer region (from the index start, or from the lowest
 * window fetched after the resource size became known, if that began
 * earlier). Any other position raises OutOfBoundError.
 *
 * The first end-relative seek fetches a suffix of initial_buffer_size bytes and
 * derives resource_size() from the window the server returned.
 *
 * Not thread-safe: state is mutated in place on every call.
 */
class VirtualStream final : public IDataStream {
public:
  explicit VirtualStream(RangeFetcher &fetcher, VirtualStreamOptions options = {});
  ~VirtualStream() override;

  VirtualStream(const VirtualStream &) = delete;
  VirtualStream &operator=(const VirtualStream &) = delete;

  ssize_t read(void *buffer, size_t size) override;

  /// Read up to size bytes; 0 reads to the end of the resource
  std::vector<uint8_t> read(size_t size = 0);

  int64_t seek(int64_t offset, int whence) override;
  int64_t tell() const override;
  void close() override;

  /**
   * @brief Switch from bootstrap to member-exact fetching
   * @throws std::logic_error when a map was already installed
   */
  void install_member_map(MemberSizeMap map);
  bool has_member_map() const { return _member_map.has_value(); }
  const MemberSizeMap *member_map() const { return _member_map ? &*_member_map : nullptr; }

  std::optional<uint64_t> resource_size() const { return _resource_size; }

  /// First offset served by plain fetches once a member map is installed
  uint64_t trailer_start() const;
  bool seek_resolved() const { return _seek_resolved; }
  const WindowBuffer *current_buffer() const { return _current.get(); }

  /// Windows installed so far
  uint64_t fetch_count() const { return _fetch_count; }
  /// Windows retired (closed) because a replacement was installed
  uint64_t buffer_swaps() const { return _buffer_swaps; }

private:
  void fetch_tail();
  void resolve_read(int64_t position, size_t size, bool ran_off);
  void retire_current();
  void install(std::unique_ptr<WindowBuffer> buffer);
  void note_trailer_window();
  int64_t absolute_target(int64_t offset, int whence) const;
  void ensure_open() const;

  RangeFetcher &_fetcher;
  VirtualStreamOptions _options;
  std::unique_ptr<WindowBuffer> _current;
  std::optional<uint64_t> _resource_size;
  std::optional<MemberSizeMap> _member_map;
  std::optional<uint64_t> _last_member_start;
  std::optional<uint64_t> _trailer_floor; ///< Lowest bootstrap window start once the size was known
  bool _seek_resolved = false;
  bool _closed = false;
  int64_t _pending_position = 0; ///< Valid while !_seek_resolved
  uint64_t _fetch_count = 0;
  uint64_t _buffer_swaps = 0;
};

} // namespace remotezip
