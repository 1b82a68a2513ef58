// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "archive_handle.h"
#include "remotezip/remote_error.h"

#include <cstdio>
#include <stdexcept>
#include <utility>

namespace remotezip {

std::string archive_error_text(struct archive *ar) {
  const char *detail = ar ? archive_error_string(ar) : nullptr;
  return detail ? std::string(detail) : std::string("unknown libarchive error");
}

archive_ptr new_zip_reader(ZipReaderKind kind, const std::vector<std::string> &passphrases, const std::function<int(struct archive *)> &opener) {
  archive_ptr ar(archive_read_new());
  if (!ar) {
    throw ArchiveError("Failed to allocate libarchive reader");
  }

  const int status = kind == ZipReaderKind::Seekable ? archive_read_support_format_zip_seekable(ar.get()) : archive_read_support_format_zip_streamable(ar.get());
  if (status != ARCHIVE_OK) {
    throw ArchiveError("ZIP reader unavailable: " + archive_error_text(ar.get()));
  }

  for (const auto &passphrase : passphrases) {
    if (archive_read_add_passphrase(ar.get(), passphrase.c_str()) != ARCHIVE_OK) {
      throw ArchiveError("Failed to register passphrase: " + archive_error_text(ar.get()));
    }
  }

  if (opener(ar.get()) != ARCHIVE_OK) {
    throw ArchiveError("Failed to open archive: " + archive_error_text(ar.get()));
  }
  return ar;
}

ArchiveStreamBridge::ArchiveStreamBridge(IDataStream &stream, size_t block_size)
    : _stream(stream) {
  if (block_size == 0) {
    throw std::invalid_argument("read block size must be non-zero");
  }
  _buffer.resize(block_size);
}

void ArchiveStreamBridge::attach(struct archive *ar, bool seekable) {
  archive_read_set_callback_data(ar, this);
  archive_read_set_read_callback(ar, read_callback);
  archive_read_set_skip_callback(ar, skip_callback);
  if (seekable) {
    archive_read_set_seek_callback(ar, seek_callback);
  }
}

void ArchiveStreamBridge::rethrow_error() {
  if (_error) {
    std::rethrow_exception(std::exchange(_error, nullptr));
  }
}

la_ssize_t ArchiveStreamBridge::read_callback(struct archive *, void *client_data, const void **buff) {
  auto *bridge = static_cast<ArchiveStreamBridge *>(client_data);
  ssize_t bytes_read = 0;
  try {
    bytes_read = bridge->_stream.read(bridge->_buffer.data(), bridge->_buffer.size());
  } catch (...) {
    bridge->_error = std::current_exception();
    return -1;
  }
  *buff = bridge->_buffer.data();
  return static_cast<la_ssize_t>(bytes_read);
}

la_int64_t ArchiveStreamBridge::seek_callback(struct archive *, void *client_data, la_int64_t request, int whence) {
  auto *bridge = static_cast<ArchiveStreamBridge *>(client_data);
  try {
    return bridge->_stream.seek(request, whence);
  } catch (...) {
    bridge->_error = std::current_exception();
    return ARCHIVE_FATAL;
  }
}

la_int64_t ArchiveStreamBridge::skip_callback(struct archive *, void *client_data, la_int64_t request) {
  auto *bridge = static_cast<ArchiveStreamBridge *>(client_data);
  try {
    const int64_t current = bridge->_stream.tell();
    return bridge->_stream.seek(request, SEEK_CUR) - current;
  } catch (const std::exception &) {
    return 0;
  }
}

} // namespace remotezip
