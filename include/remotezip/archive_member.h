// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include <cstdint>
#include <string>

namespace remotezip {

/// One member as listed in the archive's central directory
struct ArchiveMember {
  std::string name;
  uint64_t header_offset = 0;   ///< Absolute offset of the local file header
  uint64_t compressed_size = 0; ///< Payload bytes on the wire
  uint64_t size = 0;            ///< Decoded payload bytes
  uint32_t crc32 = 0;
  uint16_t method = 0;          ///< 0 = stored, 8 = deflate, ...
  uint16_t flags = 0;           ///< General purpose bit flags

  bool is_directory() const { return !name.empty() && name.back() == '/'; }
  bool is_encrypted() const { return (flags & 0x0001) != 0; }
};

} // namespace remotezip
