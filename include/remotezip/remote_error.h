// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include <stdexcept>
#include <string>

namespace remotezip {

/**
 * @brief Root of every error raised by remotezip
 *
 * Transport exceptions never escape the library in their raw form; they are
 * translated into one of the subclasses below at the fetch boundary.
 */
class RemoteZipError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Server did not honor or echo a ranged request
class RangeUnsupportedError : public RemoteZipError {
public:
  using RemoteZipError::RemoteZipError;
};

/// Seek or read target outside every recoverable window
class OutOfBoundError : public RemoteZipError {
public:
  using RemoteZipError::RemoteZipError;
};

/// Backward seek on a forward-only (streaming) window
class NonRewindableError : public OutOfBoundError {
public:
  using OutOfBoundError::OutOfBoundError;
};

/**
 * @brief Connection, protocol or HTTP status failure
 *
 * code() holds the HTTP status when the server answered with an error status,
 * or the transport library error code otherwise (0 when unknown).
 */
class TransportError : public RemoteZipError {
public:
  explicit TransportError(const std::string &message, long code = 0)
      : RemoteZipError(message)
      , _code(code) {}

  long code() const noexcept { return _code; }

private:
  long _code;
};

/// Size query succeeded but the response carried no usable length
class MetadataMissingError : public RemoteZipError {
public:
  using RemoteZipError::RemoteZipError;
};

/// Malformed archive structure or libarchive failure
class ArchiveError : public RemoteZipError {
public:
  using RemoteZipError::RemoteZipError;
};

/// Requested member is not listed in the archive index
class MemberNotFoundError : public RemoteZipError {
public:
  using RemoteZipError::RemoteZipError;
};

} // namespace remotezip
