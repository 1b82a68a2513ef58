// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "remotezip/virtual_stream.h"
#include "remotezip/remote_error.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>

namespace remotezip {

VirtualStream::VirtualStream(RangeFetcher &fetcher, VirtualStreamOptions options)
    : _fetcher(fetcher)
    , _options(options) {
  if (_options.initial_buffer_size == 0) {
    throw std::invalid_argument("VirtualStream requires a non-zero initial buffer size");
  }
}

VirtualStream::~VirtualStream() { close(); }

void VirtualStream::ensure_open() const {
  if (_closed) {
    throw std::logic_error("VirtualStream is closed");
  }
}

int64_t VirtualStream::tell() const {
  if (_seek_resolved && _current) {
    return _current->tell();
  }
  return _pending_position;
}

int64_t VirtualStream::absolute_target(int64_t offset, int whence) const {
  switch (whence) {
  case SEEK_SET:
    return offset;
  case SEEK_CUR:
    return tell() + offset;
  case SEEK_END:
    return static_cast<int64_t>(*_resource_size) + offset;
  default:
    throw std::invalid_argument("invalid whence: " + std::to_string(whence));
  }
}

int64_t VirtualStream::seek(int64_t offset, int whence) {
  ensure_open();
  if (whence == SEEK_END && !_resource_size) {
    fetch_tail();
  }

  const int64_t target = absolute_target(offset, whence);
  if (target < 0) {
    throw OutOfBoundError("Negative stream position " + std::to_string(target));
  }

  if (_current && _current->contains(target)) {
    try {
      _current->seek(target, SEEK_SET);
      _seek_resolved = true;
      return target;
    } catch (const NonRewindableError &) {
      // falls through: the next read re-fetches from target
    }
  }

  _seek_resolved = false;
  _pending_position = target;
  return target;
}

ssize_t VirtualStream::read(void *buffer, size_t size) {
  ensure_open();
  if (size == 0) {
    return 0;
  }

  const int64_t position = tell();
  if (_resource_size && static_cast<uint64_t>(position) >= *_resource_size) {
    return 0;
  }

  if (!_seek_resolved || !_current) {
    resolve_read(position, size, false);
  } else if (_current->remaining() == 0) {
    resolve_read(position, size, true);
  }
  return static_cast<ssize_t>(_current->read_into(buffer, size));
}

std::vector<uint8_t> VirtualStream::read(size_t size) {
  ensure_open();
  if (size == 0) {
    if (!_resource_size) {
      throw std::logic_error("reading to the end requires a known resource size");
    }
    const auto position = static_cast<uint64_t>(tell());
    size = position >= *_resource_size ? 0 : static_cast<size_t>(*_resource_size - position);
  }

  std::vector<uint8_t> content(size);
  size_t total = 0;
  while (total < size) {
    const ssize_t chunk = read(content.data() + total, size - total);
    if (chunk <= 0) {
      break;
    }
    total += static_cast<size_t>(chunk);
  }
  content.resize(total);
  return content;
}

void VirtualStream::fetch_tail() {
  _seek_resolved = false;
  retire_current();
  install(_fetcher.fetch(ByteRange::suffix(static_cast<int64_t>(_options.initial_buffer_size)), false));
  _resource_size = _current->size() + _current->offset();
  note_trailer_window();
  _seek_resolved = true;
}

uint64_t VirtualStream::trailer_start() const {
  if (!_member_map) {
    return 0;
  }
  if (_trailer_floor) {
    return std::min(*_trailer_floor, _member_map->index_start());
  }
  return _member_map->index_start();
}

void VirtualStream::note_trailer_window() {
  if (_member_map || !_resource_size || !_current) {
    return;
  }
  _trailer_floor = _trailer_floor ? std::min(*_trailer_floor, _current->offset()) : _current->offset();
}

void VirtualStream::resolve_read(int64_t position, size_t size, bool ran_off) {
  const auto start = static_cast<uint64_t>(position);
  uint64_t length = size;
  bool stream = false;

  if (_member_map) {
    if (const auto member = _member_map->find(start)) {
      _last_member_start = start;
      if (ran_off) {
        // Look-ahead past the previous member: a rewindable window of what was
        // asked, so opening this member later starts from it.
        length = std::min<uint64_t>(size, *member);
      } else {
        length = *member;
        stream = true;
      }
    } else if (_last_member_start && *_last_member_start < start && start < *_last_member_start + *_member_map->find(*_last_member_start)) {
      length = *_last_member_start + *_member_map->find(*_last_member_start) - start;
      stream = true;
    } else if (start >= _member_map->first_offset() && start < trailer_start()) {
      throw OutOfBoundError("Attempt to seek outside boundary of current zip member (position " + std::to_string(start) + ")");
    }
  }

  if (_resource_size) {
    length = std::min<uint64_t>(length, *_resource_size - start);
  }

  _pending_position = position;
  _seek_resolved = false;
  retire_current();
  install(_fetcher.fetch(ByteRange::closed(position, position + static_cast<int64_t>(length) - 1), stream));

  note_trailer_window();

  if (!_current->contains(position)) {
    throw OutOfBoundError("Server returned window [" + std::to_string(_current->offset()) + ", " + std::to_string(_current->end()) + ") not covering position " + std::to_string(position));
  }
  if (_current->tell() != position) {
    _current->seek(position, SEEK_SET);
  }
  _seek_resolved = true;
}

void VirtualStream::retire_current() {
  if (!_current) {
    return;
  }
  _current->close();
  _current.reset();
  ++_buffer_swaps;
}

void VirtualStream::install(std::unique_ptr<WindowBuffer> buffer) {
  _current = std::move(buffer);
  ++_fetch_count;
}

void VirtualStream::install_member_map(MemberSizeMap map) {
  if (_member_map) {
    throw std::logic_error("member map already installed");
  }
  _member_map = std::move(map);
}

void VirtualStream::close() {
  if (_closed) {
    return;
  }
  _closed = true;
  if (_current) {
    _current->close();
    _current.reset();
  }
  _seek_resolved = false;
}

} // namespace remotezip
