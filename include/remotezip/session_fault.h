// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include <functional>
#include <string>

namespace remotezip {

enum class FaultKind {
  RangeUnsupported,
  OutOfBound,
  Transport,
  MetadataMissing,
  Archive,
  MemberNotFound,
  Other,
};

/**
 * @brief Describes a failure surfacing from an ArchiveSession operation
 *
 * Faults are dispatched to the registered callback right before the matching
 * exception is thrown to the caller.
 */
struct SessionFault {
  FaultKind kind = FaultKind::Other;
  std::string message; ///< Same text as the thrown exception's what()
  std::string url;     ///< Remote resource the session was bound to
  long code = 0;       ///< HTTP status or transport error code, when known
};

using FaultCallback = std::function<void(const SessionFault &)>;

/**
 * @brief Register the process-wide fault callback
 * @param callback Callback to invoke; an empty callback clears the registration
 *
 * Thread-safe. The callback runs on the thread that hit the failure.
 */
void register_fault_callback(FaultCallback callback);

/// Invoke the registered callback, if any
void dispatch_registered_fault(const SessionFault &fault);

/// Stable lower-case name ("transport", "out_of_bound", ...)
const char *fault_kind_name(FaultKind kind);

} // namespace remotezip
