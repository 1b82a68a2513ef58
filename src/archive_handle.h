// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include "remotezip/data_stream.h"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace remotezip {

struct archive_deleter {
  void operator()(struct archive *ar) const {
    if (ar) {
      archive_read_free(ar);
    }
  }
};

using archive_ptr = std::unique_ptr<struct archive, archive_deleter>;

enum class ZipReaderKind {
  Seekable,  ///< Reads the end record and index first; needs a seek callback
  Streaming, ///< Reads local headers front to back from wherever the stream stands
};

/**
 * @brief Create a libarchive reader restricted to one ZIP reading strategy
 * @param passphrases Passphrases offered for encrypted members
 * @param opener Installs the client callbacks and opens the archive; returns an ARCHIVE_* status
 * @throws ArchiveError if setup or opening fails
 */
archive_ptr new_zip_reader(ZipReaderKind kind, const std::vector<std::string> &passphrases, const std::function<int(struct archive *)> &opener);

/// libarchive's last error text, or a fallback when none is set
std::string archive_error_text(struct archive *ar);

/**
 * @brief Client callbacks that let libarchive read an IDataStream
 *
 * Exceptions thrown by the stream inside the read or seek callback are kept
 * and handed back through take_error() once libarchive has returned. A failed
 * skip is reported to libarchive as "nothing skipped", which makes it read
 * through instead; the read reports any real failure on its own.
 */
class ArchiveStreamBridge {
public:
  ArchiveStreamBridge(IDataStream &stream, size_t block_size);

  ArchiveStreamBridge(const ArchiveStreamBridge &) = delete;
  ArchiveStreamBridge &operator=(const ArchiveStreamBridge &) = delete;

  /// Install the callbacks on ar; the seek callback only when seekable is set
  void attach(struct archive *ar, bool seekable);

  bool has_error() const { return static_cast<bool>(_error); }
  /// Rethrow and clear the kept callback exception, if any
  void rethrow_error();
  void clear_error() { _error = nullptr; }

  static la_ssize_t read_callback(struct archive *a, void *client_data, const void **buff);
  static la_int64_t seek_callback(struct archive *a, void *client_data, la_int64_t request, int whence);
  static la_int64_t skip_callback(struct archive *a, void *client_data, la_int64_t request);

private:
  IDataStream &_stream;
  std::vector<uint8_t> _buffer;
  std::exception_ptr _error;
};

} // namespace remotezip
