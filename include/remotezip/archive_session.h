// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include "remotezip/archive_member.h"
#include "remotezip/transport.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace remotezip {

class VirtualStream;
class RangeFetcher;

struct SessionOptions {
  size_t initial_buffer_size = 64 * 1024; ///< Tail window fetched to locate the index
  size_t read_block_size = 16 * 1024;     ///< Bytes requested per parser read callback
  bool support_suffix_range = true;
  TransportOptions transport;
  std::vector<std::string> passphrases; ///< Offered to libarchive for encrypted members
};

class ArchiveSession;

/**
 * @brief Streams the decoded bytes of one member
 *
 * Valid until another member is opened on the same session or the session is
 * closed; using it afterwards raises std::logic_error.
 */
class MemberReader {
public:
  MemberReader(MemberReader &&) noexcept = default;
  MemberReader &operator=(MemberReader &&) noexcept = default;

  /// @return bytes copied, 0 at the end of the member
  size_t read(void *buffer, size_t size);
  std::vector<uint8_t> read_all();

  const ArchiveMember &member() const { return _member; }

private:
  friend class ArchiveSession;
  MemberReader(ArchiveSession &session, ArchiveMember member, uint64_t generation);

  ArchiveSession *_session;
  ArchiveMember _member;
  uint64_t _generation;
};

/**
 * @brief Random-access reader for a ZIP archive served over HTTP byte ranges
 *
 * Opening the session fetches the tail of the resource, lets libarchive and
 * the index walker read the central directory, then switches the underlying
 * VirtualStream to member-exact fetching. Each member read afterwards costs
 * about one ranged request.
 *
 * Failures are reported to the registered fault callback and then thrown.
 * A session is not thread-safe.
 */
class ArchiveSession {
public:
  /**
   * @param transport Transport to use; nullptr selects the libcurl transport
   * @throws TransportError, RangeUnsupportedError, MetadataMissingError, ArchiveError
   */
  explicit ArchiveSession(std::string url, SessionOptions options = {}, std::shared_ptr<ITransport> transport = nullptr);
  ~ArchiveSession();

  ArchiveSession(const ArchiveSession &) = delete;
  ArchiveSession &operator=(const ArchiveSession &) = delete;

  /// Members in index order
  const std::vector<ArchiveMember> &members() const;
  std::optional<ArchiveMember> find_member(const std::string &name) const;
  std::vector<std::string> namelist() const;

  /**
   * @brief Position libarchive on a member and return a reader for its payload
   * @throws MemberNotFoundError if name is not in the index
   */
  MemberReader open_member(const std::string &name);

  /// Whole decoded payload of a member
  std::vector<uint8_t> read_member(const std::string &name);

  /// Write a member's payload to a local file
  void extract(const std::string &name, const std::string &path);

  void close();
  bool closed() const;

  const std::string &url() const;
  uint64_t resource_size() const;
  uint64_t index_offset() const;

  /// Underlying stream, for fetch accounting
  const VirtualStream &stream() const;
  const RangeFetcher &fetcher() const;

private:
  friend class MemberReader;
  size_t read_member_data(uint64_t generation, void *buffer, size_t size);

  class Impl;
  std::unique_ptr<Impl> _impl;
};

} // namespace remotezip
