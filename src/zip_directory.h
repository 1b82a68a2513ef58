// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include "remotezip/archive_member.h"
#include "remotezip/data_stream.h"

#include <cstdint>
#include <string>
#include <vector>

namespace remotezip {

struct ZipDirectory {
  std::vector<ArchiveMember> members; ///< Central directory order
  uint64_t index_offset = 0;          ///< Start of the central directory
  uint64_t index_size = 0;
  uint64_t resource_size = 0;
  std::string comment;
};

/**
 * @brief Walk the ZIP end record and central directory through a seekable stream
 *
 * Only seek()/read() are used, so the caller decides how bytes are fetched.
 * ZIP64 end records and extended-information extra fields are honored.
 *
 * @throws ArchiveError on malformed or truncated structures
 */
ZipDirectory read_zip_directory(IDataStream &stream);

} // namespace remotezip
