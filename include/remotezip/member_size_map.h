// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace remotezip {

/**
 * @brief Exact on-wire length of every archive member, keyed by start offset
 *
 * Built once from the local-header offsets listed in the index plus the
 * index's own start offset: the offsets are sorted and consecutive deltas
 * become the member lengths (header + payload + any trailing descriptor).
 *
 *   build({0, 120, 340}, 600) == {0: 120, 120: 220, 340: 260}
 *
 * Immutable once built.
 */
class MemberSizeMap {
public:
  using const_iterator = std::map<uint64_t, uint64_t>::const_iterator;

  MemberSizeMap() = default;

  /**
   * @throws std::invalid_argument if any offset is at or past index_start
   */
  static MemberSizeMap build(std::vector<uint64_t> start_offsets, uint64_t index_start);

  /// Length of the member starting exactly at offset
  std::optional<uint64_t> find(uint64_t offset) const;

  uint64_t index_start() const { return _index_start; }
  uint64_t first_offset() const { return _sizes.empty() ? _index_start : _sizes.begin()->first; }
  size_t size() const { return _sizes.size(); }
  bool empty() const { return _sizes.empty(); }

  /// first_offset() + sum of all lengths == index_start()
  bool is_consistent() const;

  const_iterator begin() const { return _sizes.begin(); }
  const_iterator end() const { return _sizes.end(); }

private:
  std::map<uint64_t, uint64_t> _sizes;
  uint64_t _index_start = 0;
};

} // namespace remotezip
