// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "remotezip/archive_session.h"

#include "archive_handle.h"
#include "remotezip/member_size_map.h"
#include "remotezip/range_fetcher.h"
#include "remotezip/remote_error.h"
#include "remotezip/session_fault.h"
#include "remotezip/virtual_stream.h"
#include "zip_directory.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace remotezip {

namespace {

// Upper bound on the up-front allocation trusted from an index size field
constexpr uint64_t kReserveLimit = 4 * 1024 * 1024;

FaultKind classify_fault(const RemoteZipError &error, long &code) {
  code = 0;
  if (dynamic_cast<const RangeUnsupportedError *>(&error)) {
    return FaultKind::RangeUnsupported;
  }
  if (dynamic_cast<const OutOfBoundError *>(&error)) {
    return FaultKind::OutOfBound;
  }
  if (const auto *transport = dynamic_cast<const TransportError *>(&error)) {
    code = transport->code();
    return FaultKind::Transport;
  }
  if (dynamic_cast<const MetadataMissingError *>(&error)) {
    return FaultKind::MetadataMissing;
  }
  if (dynamic_cast<const ArchiveError *>(&error)) {
    return FaultKind::Archive;
  }
  if (dynamic_cast<const MemberNotFoundError *>(&error)) {
    return FaultKind::MemberNotFound;
  }
  return FaultKind::Other;
}

void report_fault(const RemoteZipError &error, const std::string &url) {
  SessionFault fault;
  fault.kind = classify_fault(error, fault.code);
  fault.message = error.what();
  fault.url = url;
  dispatch_registered_fault(fault);
}

struct file_closer {
  void operator()(FILE *handle) const {
    if (handle) {
      std::fclose(handle);
    }
  }
};

/// Run fn, reporting any remotezip error to the fault callback before it propagates
template <typename Fn> auto guarded(const std::string &url, Fn &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const RemoteZipError &error) {
    report_fault(error, url);
    throw;
  }
}

} // namespace

// ============================================================================
// ArchiveSession::Impl
// ============================================================================

class ArchiveSession::Impl {
public:
  Impl(std::string url, SessionOptions options, std::shared_ptr<ITransport> transport);

  const ArchiveMember &lookup(const std::string &name) const;
  void position_on(const ArchiveMember &member);
  size_t read_data(void *buffer, size_t size);
  void close();
  void ensure_open() const;

  std::string url;
  SessionOptions options;
  RangeFetcher fetcher;
  VirtualStream stream;
  ZipDirectory directory;
  uint64_t generation = 0;
  bool closed = false;

private:
  archive_ptr open_reader(ZipReaderKind kind);
  void probe_format();
  void install_member_map();
  [[noreturn]] void fail(const std::string &message);

  ArchiveStreamBridge _bridge;
  archive_ptr _member_archive; ///< Streaming reader positioned on the open member
};

ArchiveSession::Impl::Impl(std::string url_, SessionOptions options_, std::shared_ptr<ITransport> transport)
    : url(std::move(url_))
    , options(std::move(options_))
    , fetcher(url, transport ? std::move(transport) : make_curl_transport(), FetcherOptions{ options.support_suffix_range, options.transport })
    , stream(fetcher, VirtualStreamOptions{ options.initial_buffer_size })
    , _bridge(stream, options.read_block_size) {
  probe_format();
  install_member_map();
}

archive_ptr ArchiveSession::Impl::open_reader(ZipReaderKind kind) {
  _bridge.clear_error();
  try {
    return new_zip_reader(kind, options.passphrases, [this, kind](struct archive *ar) -> int {
      _bridge.attach(ar, kind == ZipReaderKind::Seekable);
      return archive_read_open1(ar);
    });
  } catch (const ArchiveError &) {
    _bridge.rethrow_error();
    throw;
  }
}

void ArchiveSession::Impl::probe_format() {
  // The seekable reader's bid locates the end record: an end-relative seek
  // (tail fetch) followed by reads near the end of the resource.
  archive_ptr probe = open_reader(ZipReaderKind::Seekable);
  probe.reset();
}

void ArchiveSession::Impl::install_member_map() {
  directory = read_zip_directory(stream);

  std::vector<uint64_t> offsets;
  offsets.reserve(directory.members.size());
  for (const auto &member : directory.members) {
    offsets.push_back(member.header_offset);
  }

  try {
    stream.install_member_map(MemberSizeMap::build(std::move(offsets), directory.index_offset));
  } catch (const std::invalid_argument &error) {
    throw ArchiveError(std::string("Inconsistent archive index: ") + error.what());
  }
}

void ArchiveSession::Impl::ensure_open() const {
  if (closed) {
    throw std::logic_error("ArchiveSession is closed");
  }
}

const ArchiveMember &ArchiveSession::Impl::lookup(const std::string &name) const {
  const auto it = std::find_if(directory.members.begin(), directory.members.end(), [&](const ArchiveMember &member) { return member.name == name; });
  if (it == directory.members.end()) {
    throw MemberNotFoundError("No member named '" + name + "' in " + url);
  }
  return *it;
}

void ArchiveSession::Impl::position_on(const ArchiveMember &member) {
  ++generation;
  _member_archive.reset();

  stream.seek(static_cast<int64_t>(member.header_offset), SEEK_SET);
  archive_ptr reader = open_reader(ZipReaderKind::Streaming);

  struct archive_entry *entry = nullptr;
  _bridge.clear_error();
  const int result = archive_read_next_header(reader.get(), &entry);
  _member_archive = std::move(reader);
  if (result == ARCHIVE_EOF) {
    throw ArchiveError("No local header at offset " + std::to_string(member.header_offset) + " for member '" + member.name + "'");
  }
  if (result < ARCHIVE_WARN) {
    fail("Failed to read header of member '" + member.name + "'");
  }

  const char *pathname = archive_entry_pathname(entry);
  if (pathname && member.name != pathname) {
    _member_archive.reset();
    throw ArchiveError("Local header at offset " + std::to_string(member.header_offset) + " names '" + pathname + "', index names '" + member.name + "'");
  }
}

size_t ArchiveSession::Impl::read_data(void *buffer, size_t size) {
  if (!_member_archive) {
    throw std::logic_error("no member is open");
  }
  _bridge.clear_error();
  const la_ssize_t bytes = archive_read_data(_member_archive.get(), buffer, size);
  if (bytes < 0) {
    fail("Failed to read member data");
  }
  return static_cast<size_t>(bytes);
}

void ArchiveSession::Impl::fail(const std::string &message) {
  const std::string detail = archive_error_text(_member_archive.get());
  _member_archive.reset();
  _bridge.rethrow_error();
  throw ArchiveError(message + ": " + detail);
}

void ArchiveSession::Impl::close() {
  if (closed) {
    return;
  }
  closed = true;
  ++generation;
  _member_archive.reset();
  stream.close();
}

// ============================================================================
// MemberReader
// ============================================================================

MemberReader::MemberReader(ArchiveSession &session, ArchiveMember member, uint64_t generation)
    : _session(&session)
    , _member(std::move(member))
    , _generation(generation) {}

size_t MemberReader::read(void *buffer, size_t size) { return _session->read_member_data(_generation, buffer, size); }

std::vector<uint8_t> MemberReader::read_all() {
  std::vector<uint8_t> content;
  content.reserve(static_cast<size_t>(std::min(_member.size, kReserveLimit)));
  uint8_t chunk[16 * 1024];
  while (true) {
    const size_t bytes = read(chunk, sizeof(chunk));
    if (bytes == 0) {
      break;
    }
    content.insert(content.end(), chunk, chunk + bytes);
  }
  return content;
}

// ============================================================================
// ArchiveSession
// ============================================================================

ArchiveSession::ArchiveSession(std::string url, SessionOptions options, std::shared_ptr<ITransport> transport) {
  const std::string where = url;
  _impl = guarded(where, [&] { return std::make_unique<Impl>(std::move(url), std::move(options), std::move(transport)); });
}

ArchiveSession::~ArchiveSession() {
  if (_impl) {
    _impl->close();
  }
}

const std::vector<ArchiveMember> &ArchiveSession::members() const { return _impl->directory.members; }

std::optional<ArchiveMember> ArchiveSession::find_member(const std::string &name) const {
  for (const auto &member : _impl->directory.members) {
    if (member.name == name) {
      return member;
    }
  }
  return std::nullopt;
}

std::vector<std::string> ArchiveSession::namelist() const {
  std::vector<std::string> names;
  names.reserve(_impl->directory.members.size());
  for (const auto &member : _impl->directory.members) {
    names.push_back(member.name);
  }
  return names;
}

MemberReader ArchiveSession::open_member(const std::string &name) {
  _impl->ensure_open();
  return guarded(_impl->url, [&] {
    const ArchiveMember &member = _impl->lookup(name);
    _impl->position_on(member);
    return MemberReader(*this, member, _impl->generation);
  });
}

size_t ArchiveSession::read_member_data(uint64_t generation, void *buffer, size_t size) {
  if (_impl->closed || generation != _impl->generation) {
    throw std::logic_error("MemberReader is no longer valid");
  }
  return guarded(_impl->url, [&] { return _impl->read_data(buffer, size); });
}

std::vector<uint8_t> ArchiveSession::read_member(const std::string &name) { return open_member(name).read_all(); }

void ArchiveSession::extract(const std::string &name, const std::string &path) {
  MemberReader reader = open_member(name);

  errno = 0;
  FILE *handle = std::fopen(path.c_str(), "wb");
  if (!handle) {
    throw std::system_error(errno, std::generic_category(), "Failed to open output file " + path);
  }
  std::unique_ptr<FILE, file_closer> output(handle);

  uint8_t chunk[16 * 1024];
  while (true) {
    const size_t bytes = reader.read(chunk, sizeof(chunk));
    if (bytes == 0) {
      break;
    }
    if (std::fwrite(chunk, 1, bytes, output.get()) != bytes) {
      throw std::system_error(errno, std::generic_category(), "Failed to write output file " + path);
    }
  }
  if (std::fclose(output.release()) != 0) {
    throw std::system_error(errno, std::generic_category(), "Failed to close output file " + path);
  }
}

void ArchiveSession::close() { _impl->close(); }

bool ArchiveSession::closed() const { return _impl->closed; }

const std::string &ArchiveSession::url() const { return _impl->url; }

uint64_t ArchiveSession::resource_size() const { return _impl->directory.resource_size; }

uint64_t ArchiveSession::index_offset() const { return _impl->directory.index_offset; }

const VirtualStream &ArchiveSession::stream() const { return _impl->stream; }

const RangeFetcher &ArchiveSession::fetcher() const { return _impl->fetcher; }

} // namespace remotezip
