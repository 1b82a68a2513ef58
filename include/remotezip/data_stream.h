// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/types.h>

#if defined(_WIN32) && !defined(_SSIZE_T_DEFINED)
#  include <BaseTsd.h>
using ssize_t = SSIZE_T;
#  define _SSIZE_T_DEFINED
#endif

namespace remotezip {

/**
 * @brief Seekable byte source as seen by an archive parser
 *
 * Mirrors the POSIX file calls a parser expects: read() returns the number of
 * bytes copied (0 at end of data), seek() takes SEEK_SET / SEEK_CUR / SEEK_END
 * and returns the new absolute position.
 */
class IDataStream {
public:
  virtual ~IDataStream() = default;

  virtual ssize_t read(void *buffer, size_t size) = 0;
  virtual int64_t seek(int64_t offset, int whence) = 0;
  virtual int64_t tell() const = 0;
  virtual bool can_seek() const { return true; }
  virtual void close() = 0;
};

} // namespace remotezip
