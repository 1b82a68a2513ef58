// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "remotezip/member_size_map.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace remotezip {

MemberSizeMap MemberSizeMap::build(std::vector<uint64_t> start_offsets, uint64_t index_start) {
  std::sort(start_offsets.begin(), start_offsets.end());
  start_offsets.erase(std::unique(start_offsets.begin(), start_offsets.end()), start_offsets.end());

  if (!start_offsets.empty() && start_offsets.back() >= index_start) {
    throw std::invalid_argument("member offset " + std::to_string(start_offsets.back()) + " is not before index start " + std::to_string(index_start));
  }

  MemberSizeMap map;
  map._index_start = index_start;
  start_offsets.push_back(index_start);
  for (size_t i = 0; i + 1 < start_offsets.size(); ++i) {
    map._sizes.emplace(start_offsets[i], start_offsets[i + 1] - start_offsets[i]);
  }
  return map;
}

std::optional<uint64_t> MemberSizeMap::find(uint64_t offset) const {
  const auto it = _sizes.find(offset);
  if (it == _sizes.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemberSizeMap::is_consistent() const {
  uint64_t total = first_offset();
  for (const auto &[offset, length] : _sizes) {
    (void)offset;
    total += length;
  }
  return total == _index_start;
}

} // namespace remotezip
