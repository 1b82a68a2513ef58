// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "remotezip/session_fault.h"

#include <mutex>
#include <utility>

namespace remotezip {

namespace {

std::mutex &fault_callback_mutex() {
  static std::mutex mutex;
  return mutex;
}

FaultCallback &fault_callback_slot() {
  static FaultCallback callback;
  return callback;
}

} // namespace

void register_fault_callback(FaultCallback callback) {
  std::lock_guard<std::mutex> lock(fault_callback_mutex());
  fault_callback_slot() = std::move(callback);
}

void dispatch_registered_fault(const SessionFault &fault) {
  FaultCallback callback;
  {
    std::lock_guard<std::mutex> lock(fault_callback_mutex());
    callback = fault_callback_slot();
  }
  if (callback) {
    callback(fault);
  }
}

const char *fault_kind_name(FaultKind kind) {
  switch (kind) {
  case FaultKind::RangeUnsupported:
    return "range_unsupported";
  case FaultKind::OutOfBound:
    return "out_of_bound";
  case FaultKind::Transport:
    return "transport";
  case FaultKind::MetadataMissing:
    return "metadata_missing";
  case FaultKind::Archive:
    return "archive";
  case FaultKind::MemberNotFound:
    return "member_not_found";
  case FaultKind::Other:
    break;
  }
  return "other";
}

} // namespace remotezip
