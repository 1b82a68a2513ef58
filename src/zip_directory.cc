// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "zip_directory.h"
#include "remotezip/remote_error.h"

#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>

namespace remotezip {

namespace {

constexpr uint32_t kEndRecordSignature = 0x06054b50;
constexpr uint32_t kZip64EndRecordSignature = 0x06064b50;
constexpr uint32_t kZip64LocatorSignature = 0x07064b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;

constexpr size_t kEndRecordSize = 22;
constexpr size_t kZip64LocatorSize = 20;
constexpr size_t kZip64EndRecordSize = 56;
constexpr size_t kCentralHeaderSize = 46;

constexpr uint16_t kZip64ExtraId = 0x0001;

// The end record normally sits in the last few bytes; a maximal comment
// pushes it up to 22 + 65535 bytes from the end.
constexpr uint64_t kInitialSearchSpan = 4 * 1024;
constexpr uint64_t kMaxSearchSpan = kEndRecordSize + 0xFFFF;

uint16_t le16(const uint8_t *p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }

uint32_t le32(const uint8_t *p) { return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24); }

uint64_t le64(const uint8_t *p) { return static_cast<uint64_t>(le32(p)) | (static_cast<uint64_t>(le32(p + 4)) << 32); }

std::vector<uint8_t> read_exact(IDataStream &stream, uint64_t offset, size_t size, const char *what) {
  if (stream.seek(static_cast<int64_t>(offset), SEEK_SET) != static_cast<int64_t>(offset)) {
    throw ArchiveError(std::string("Failed to seek to ") + what);
  }

  std::vector<uint8_t> data(size);
  size_t total = 0;
  while (total < size) {
    const ssize_t chunk = stream.read(data.data() + total, size - total);
    if (chunk <= 0) {
      throw ArchiveError(std::string("Truncated ") + what + ": " + std::to_string(total) + " of " + std::to_string(size) + " bytes");
    }
    total += static_cast<size_t>(chunk);
  }
  return data;
}

std::optional<size_t> find_end_record(const std::vector<uint8_t> &tail) {
  if (tail.size() < kEndRecordSize) {
    return std::nullopt;
  }
  for (size_t pos = tail.size() - kEndRecordSize + 1; pos-- > 0;) {
    if (le32(&tail[pos]) != kEndRecordSignature) {
      continue;
    }
    const size_t comment_length = le16(&tail[pos + 20]);
    if (pos + kEndRecordSize + comment_length <= tail.size()) {
      return pos;
    }
  }
  return std::nullopt;
}

void apply_zip64_extra(ArchiveMember &member, const uint8_t *extra, size_t extra_length, bool need_size, bool need_compressed, bool need_offset) {
  size_t pos = 0;
  while (pos + 4 <= extra_length) {
    const uint16_t id = le16(extra + pos);
    const uint16_t length = le16(extra + pos + 2);
    pos += 4;
    if (pos + length > extra_length) {
      throw ArchiveError("Corrupt extra field for member '" + member.name + "'");
    }
    if (id == kZip64ExtraId) {
      const uint8_t *field = extra + pos;
      const uint8_t *field_end = field + length;
      auto take = [&](uint64_t &target) {
        if (field + 8 > field_end) {
          throw ArchiveError("Truncated ZIP64 extra field for member '" + member.name + "'");
        }
        target = le64(field);
        field += 8;
      };
      if (need_size) {
        take(member.size);
      }
      if (need_compressed) {
        take(member.compressed_size);
      }
      if (need_offset) {
        take(member.header_offset);
      }
      return;
    }
    pos += length;
  }
  if (need_size || need_compressed || need_offset) {
    throw ArchiveError("Missing ZIP64 extra field for member '" + member.name + "'");
  }
}

} // namespace

ZipDirectory read_zip_directory(IDataStream &stream) {
  const int64_t end = stream.seek(0, SEEK_END);
  if (end < static_cast<int64_t>(kEndRecordSize)) {
    throw ArchiveError("Resource too small to be a ZIP archive (" + std::to_string(end) + " bytes)");
  }

  ZipDirectory directory;
  directory.resource_size = static_cast<uint64_t>(end);

  uint64_t span = std::min(directory.resource_size, kInitialSearchSpan);
  std::vector<uint8_t> tail = read_exact(stream, directory.resource_size - span, static_cast<size_t>(span), "archive trailer");
  std::optional<size_t> found = find_end_record(tail);
  if (!found && span < std::min(directory.resource_size, kMaxSearchSpan)) {
    span = std::min(directory.resource_size, kMaxSearchSpan);
    tail = read_exact(stream, directory.resource_size - span, static_cast<size_t>(span), "archive trailer");
    found = find_end_record(tail);
  }
  if (!found) {
    throw ArchiveError("End of central directory record not found");
  }

  const uint8_t *record = &tail[*found];
  const uint64_t record_offset = directory.resource_size - span + *found;
  uint64_t entry_count = le16(record + 10);
  directory.index_size = le32(record + 12);
  directory.index_offset = le32(record + 16);
  directory.comment.assign(reinterpret_cast<const char *>(record + kEndRecordSize), le16(record + 20));

  if (entry_count == 0xFFFF || directory.index_size == 0xFFFFFFFF || directory.index_offset == 0xFFFFFFFF) {
    if (record_offset < kZip64LocatorSize) {
      throw ArchiveError("ZIP64 end of central directory locator missing");
    }
    const auto locator = read_exact(stream, record_offset - kZip64LocatorSize, kZip64LocatorSize, "ZIP64 locator");
    if (le32(locator.data()) != kZip64LocatorSignature) {
      throw ArchiveError("ZIP64 end of central directory locator missing");
    }
    const auto zip64_record = read_exact(stream, le64(locator.data() + 8), kZip64EndRecordSize, "ZIP64 end record");
    if (le32(zip64_record.data()) != kZip64EndRecordSignature) {
      throw ArchiveError("Corrupt ZIP64 end of central directory record");
    }
    entry_count = le64(zip64_record.data() + 32);
    directory.index_size = le64(zip64_record.data() + 40);
    directory.index_offset = le64(zip64_record.data() + 48);
  }

  if (directory.index_offset > directory.resource_size || directory.index_size > directory.resource_size - directory.index_offset) {
    throw ArchiveError("Central directory lies outside the archive");
  }

  const auto index = read_exact(stream, directory.index_offset, static_cast<size_t>(directory.index_size), "central directory");
  size_t pos = 0;
  directory.members.reserve(static_cast<size_t>(std::min<uint64_t>(entry_count, index.size() / kCentralHeaderSize)));
  for (uint64_t i = 0; i < entry_count; ++i) {
    if (pos + kCentralHeaderSize > index.size() || le32(&index[pos]) != kCentralHeaderSignature) {
      throw ArchiveError("Corrupt central directory at entry " + std::to_string(i));
    }
    const uint8_t *header = &index[pos];
    const size_t name_length = le16(header + 28);
    const size_t extra_length = le16(header + 30);
    const size_t comment_length = le16(header + 32);
    if (pos + kCentralHeaderSize + name_length + extra_length + comment_length > index.size()) {
      throw ArchiveError("Truncated central directory at entry " + std::to_string(i));
    }

    ArchiveMember member;
    member.flags = le16(header + 8);
    member.method = le16(header + 10);
    member.crc32 = le32(header + 16);
    member.compressed_size = le32(header + 20);
    member.size = le32(header + 24);
    member.header_offset = le32(header + 42);
    member.name.assign(reinterpret_cast<const char *>(header + kCentralHeaderSize), name_length);

    apply_zip64_extra(member, header + kCentralHeaderSize + name_length, extra_length, member.size == 0xFFFFFFFF, member.compressed_size == 0xFFFFFFFF,
                      member.header_offset == 0xFFFFFFFF);

    if (member.header_offset >= directory.index_offset) {
      throw ArchiveError("Member '" + member.name + "' starts inside the central directory");
    }

    directory.members.push_back(std::move(member));
    pos += kCentralHeaderSize + name_length + extra_length + comment_length;
  }

  return directory;
}

} // namespace remotezip
