// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "memory_transport.h"
#include "remotezip/remote_error.h"
#include "remotezip/virtual_stream.h"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace remotezip;
using namespace remotezip_test;

namespace {

const std::string kUrl = "https://example.test/blob.bin";
constexpr size_t kResourceSize = 10000;

bool expect(bool condition, const std::string &message) {
  if (!condition) {
    std::cerr << "  " << message << std::endl;
    return false;
  }
  return true;
}

void report_result(const std::string &name, bool success) { std::cout << "[" << (success ? "PASS" : "FAIL") << "] " << name << std::endl; }

std::vector<uint8_t> slice(const std::vector<uint8_t> &bytes, size_t first, size_t count) { return std::vector<uint8_t>(bytes.begin() + first, bytes.begin() + first + count); }

/// Transport, fetcher and stream wired together over a synthetic resource
struct Harness {
  explicit Harness(size_t tail = 1024, size_t size = kResourceSize)
      : transport(std::make_shared<MemoryTransport>(patterned_bytes(size, 11)))
      , fetcher(kUrl, transport)
      , stream(fetcher, VirtualStreamOptions{ tail }) {}

  const std::vector<uint8_t> &data() const { return transport->data(); }

  std::shared_ptr<MemoryTransport> transport;
  RangeFetcher fetcher;
  VirtualStream stream;
};

bool test_tail_bootstrap() {
  Harness h;
  bool ok = true;

  ok &= expect(h.stream.seek(0, SEEK_END) == static_cast<int64_t>(kResourceSize), "end-relative seek lands on the resource end");
  ok &= expect(h.stream.resource_size() == uint64_t{ kResourceSize }, "size derived from the tail window");
  ok &= expect(h.transport->gets == 1 && h.transport->ranges.back() == "bytes=-1024", "one suffix fetch");

  ok &= expect(h.stream.seek(-22, SEEK_END) == static_cast<int64_t>(kResourceSize - 22), "seek inside the tail window");
  ok &= expect(h.stream.read(22) == slice(h.data(), kResourceSize - 22, 22), "tail bytes served from the tail window");
  ok &= expect(h.stream.read(5).empty(), "read at the resource end returns nothing");
  ok &= expect(h.transport->gets == 1, "no fetch for reads inside the tail window or at the end");
  return ok;
}

bool test_deferred_seeks() {
  Harness h;
  h.stream.seek(0, SEEK_END);
  bool ok = true;

  ok &= expect(h.stream.seek(100, SEEK_SET) == 100, "optimistic position returned");
  ok &= expect(!h.stream.seek_resolved() && h.stream.tell() == 100, "seek outside the window is deferred");
  ok &= expect(h.stream.seek(5000, SEEK_SET) == 5000 && h.stream.seek(-1000, SEEK_CUR) == 4000, "speculative seeks chain");
  ok &= expect(h.transport->gets == 1, "seeks alone never fetch");

  ok &= expect(h.stream.read(50) == slice(h.data(), 4000, 50), "read resolves the last seek");
  ok &= expect(h.transport->gets == 2 && h.transport->ranges.back() == "bytes=4000-4049", "bootstrap fetch sized to the request");
  ok &= expect(h.stream.seek_resolved() && h.stream.tell() == 4050, "resolved after the read");

  ok &= expect(h.stream.read(50) == slice(h.data(), 4050, 50), "exhausted window continues with a new fetch");
  ok &= expect(h.transport->gets == 3, "one more fetch for the continuation");

  h.stream.seek(9000, SEEK_SET);
  ok &= expect(h.stream.read() == slice(h.data(), 9000, 1000), "read(0) returns the rest of the resource");
  return ok;
}

bool test_read_before_any_seek() {
  Harness h;
  bool ok = expect(h.stream.read(64) == slice(h.data(), 0, 64), "head probe");
  ok &= expect(h.transport->ranges.back() == "bytes=0-63", "head probe fetches what was asked");
  ok &= expect(!h.stream.resource_size(), "size still unknown");

  try {
    (void)h.stream.read();
    ok &= expect(false, "read-to-end without a known size must raise");
  } catch (const std::logic_error &) {
  }
  return ok;
}

bool test_member_map_hits_and_continuation() {
  Harness h;
  h.stream.seek(0, SEEK_END);
  h.stream.install_member_map(MemberSizeMap::build({ 0, 3000, 5000 }, 8000));
  bool ok = expect(h.stream.trailer_start() == 8000, "trailer starts at the index");

  h.stream.seek(3000, SEEK_SET);
  ok &= expect(h.stream.read(100) == slice(h.data(), 3000, 100), "member start served");
  ok &= expect(h.transport->ranges.back() == "bytes=3000-4999", "whole member fetched");
  ok &= expect(h.stream.current_buffer()->is_streaming(), "member windows stream");

  ok &= expect(h.stream.read(100) == slice(h.data(), 3100, 100), "sequential read from the same window");
  h.stream.seek(3500, SEEK_SET);
  ok &= expect(h.stream.read(10) == slice(h.data(), 3500, 10), "forward skip inside the member");
  const uint64_t before = h.transport->gets;
  ok &= expect(before == 2, "no extra fetch for in-window access");

  h.stream.seek(3200, SEEK_SET);
  ok &= expect(h.stream.read(10) == slice(h.data(), 3200, 10), "rewind inside the member refetches");
  ok &= expect(h.transport->ranges.back() == "bytes=3200-4999", "continuation fetches the rest of the member");

  h.stream.seek(8500, SEEK_SET);
  ok &= expect(h.stream.read(100) == slice(h.data(), 8500, 100), "trailer region served");
  ok &= expect(h.transport->ranges.back() == "bytes=8500-8599", "trailer fetch sized to the request");
  return ok;
}

bool test_out_of_bound_in_optimized_mode() {
  Harness h;
  h.stream.seek(0, SEEK_END);
  h.stream.install_member_map(MemberSizeMap::build({ 1000, 3000, 5000 }, 8000));
  h.stream.seek(3000, SEEK_SET);
  (void)h.stream.read(10);
  bool ok = true;

  ok &= expect(h.stream.seek(100 + 1000, SEEK_SET) == 1100, "arbitrary seek does not raise");
  const uint64_t gets = h.transport->gets;
  try {
    (void)h.stream.read(10);
    ok &= expect(false, "read at an unmapped member offset must raise");
  } catch (const OutOfBoundError &) {
  }
  ok &= expect(h.transport->gets == gets, "no fetch for an unresolvable position");

  h.stream.seek(10, SEEK_SET);
  ok &= expect(h.stream.read(16) == slice(h.data(), 10, 16), "bytes before the first member are served");
  return ok;
}

bool test_one_fetch_per_member() {
  Harness h;
  h.stream.seek(0, SEEK_END);
  const std::vector<uint64_t> starts = { 0, 1200, 2900, 4100, 7600 };
  h.stream.install_member_map(MemberSizeMap::build(starts, 8000));
  const uint64_t fetches_before = h.stream.fetch_count();
  bool ok = true;

  for (size_t i = 0; i < starts.size(); ++i) {
    const uint64_t length = (i + 1 < starts.size() ? starts[i + 1] : 8000) - starts[i];
    h.stream.seek(static_cast<int64_t>(starts[i]), SEEK_SET);
    std::vector<uint8_t> collected;
    while (collected.size() < length) {
      const auto chunk = h.stream.read(static_cast<size_t>(std::min<uint64_t>(512, length - collected.size())));
      if (chunk.empty()) {
        break;
      }
      collected.insert(collected.end(), chunk.begin(), chunk.end());
    }
    ok &= expect(collected == slice(h.data(), static_cast<size_t>(starts[i]), static_cast<size_t>(length)), "member " + std::to_string(i) + " content");
    ok &= expect(h.stream.fetch_count() == fetches_before + i + 1, "exactly one fetch for member " + std::to_string(i));
  }
  return ok;
}

bool test_look_ahead_into_next_member() {
  Harness h(1024, 100000);
  h.stream.seek(0, SEEK_END);
  h.stream.install_member_map(MemberSizeMap::build({ 0, 30000, 60000 }, 90000));
  bool ok = true;

  h.stream.seek(0, SEEK_SET);
  ok &= expect(h.stream.read(29984) == slice(h.data(), 0, 29984), "first member read up to its trailing bytes");
  ok &= expect(h.stream.read(24) == slice(h.data(), 29984, 24), "read runs 8 bytes into the next member");
  ok &= expect(h.transport->ranges.back() == "bytes=30000-30007", "look-ahead fetches only the bytes asked for");
  ok &= expect(!h.stream.current_buffer()->is_streaming(), "look-ahead window can rewind");

  ok &= expect(h.stream.seek(30000, SEEK_SET) == 30000 && h.stream.seek_resolved(), "member start served by the look-ahead window");
  ok &= expect(h.stream.read(30000) == slice(h.data(), 30000, 30000), "next member content");
  ok &= expect(h.transport->ranges.back() == "bytes=30008-59999", "rest of the member continues after the look-ahead");

  size_t member_fetches = 0;
  for (const auto &range : h.transport->ranges) {
    if (range.rfind("bytes=30000-", 0) == 0) {
      ++member_fetches;
    }
  }
  ok &= expect(member_fetches == 1, "next member start fetched once");
  ok &= expect(h.transport->gets == 4, "tail, first member, look-ahead, continuation");
  return ok;
}

bool test_continuation_over_clamped_windows() {
  Harness h;
  h.stream.seek(0, SEEK_END);
  h.stream.install_member_map(MemberSizeMap::build({ 0, 3000, 5000 }, 8000));
  h.transport->max_window = 700;
  const uint64_t fetches_before = h.stream.fetch_count();

  h.stream.seek(3000, SEEK_SET);
  bool ok = expect(h.stream.read(2000) == slice(h.data(), 3000, 2000), "member assembled from clamped windows");
  ok &= expect(h.stream.fetch_count() == fetches_before + 3, "one fetch per clamped window");
  const auto &ranges = h.transport->ranges;
  ok &= expect(ranges.size() >= 3, "continuation requests issued");
  if (ranges.size() >= 3) {
    ok &= expect(ranges[ranges.size() - 3] == "bytes=3000-4999", "member requested whole");
    ok &= expect(ranges[ranges.size() - 2] == "bytes=3700-4999", "continuation from the clamped end");
    ok &= expect(ranges[ranges.size() - 1] == "bytes=4400-4999", "second continuation");
  }
  ok &= expect(h.transport->ledger().max_open == 1, "never more than one open connection");
  return ok;
}

bool test_buffer_release_accounting() {
  Harness h(512);
  h.stream.seek(0, SEEK_END);
  const uint64_t targets[] = { 10, 4000, 20, 9000, 2500, 7000, 1 };
  for (uint64_t target : targets) {
    h.stream.seek(static_cast<int64_t>(target), SEEK_SET);
    (void)h.stream.read(32);
  }
  const BodyLedger &ledger = h.transport->ledger();
  bool ok = expect(h.stream.buffer_swaps() == 7, "every miss swaps the window");
  ok &= expect(ledger.closed == h.stream.buffer_swaps(), "each swap closes exactly one connection");
  ok &= expect(ledger.max_open == 1, "never more than one open connection");

  h.stream.close();
  ok &= expect(ledger.open() == 0, "close releases the last connection");
  ok &= expect(ledger.closed == ledger.opened, "every body closed exactly once");
  return ok;
}

bool test_argument_errors() {
  Harness h;
  bool ok = true;
  try {
    h.stream.seek(-1, SEEK_SET);
    ok &= expect(false, "negative target must raise");
  } catch (const OutOfBoundError &) {
  }
  try {
    h.stream.seek(0, 9);
    ok &= expect(false, "unknown whence must raise");
  } catch (const std::invalid_argument &) {
  }

  h.stream.seek(0, SEEK_END);
  h.stream.install_member_map(MemberSizeMap::build({ 0 }, 9000));
  try {
    h.stream.install_member_map(MemberSizeMap::build({ 0 }, 9000));
    ok &= expect(false, "second map must raise");
  } catch (const std::logic_error &) {
  }

  h.stream.close();
  try {
    h.stream.seek(0, SEEK_SET);
    ok &= expect(false, "seek on a closed stream must raise");
  } catch (const std::logic_error &) {
  }
  return ok;
}

} // namespace

int main() {
  bool all_passed = true;

  const bool tail = test_tail_bootstrap();
  report_result("tail_bootstrap", tail);
  all_passed = all_passed && tail;

  const bool deferred = test_deferred_seeks();
  report_result("deferred_seeks", deferred);
  all_passed = all_passed && deferred;

  const bool head = test_read_before_any_seek();
  report_result("read_before_any_seek", head);
  all_passed = all_passed && head;

  const bool hits = test_member_map_hits_and_continuation();
  report_result("member_map_hits_and_continuation", hits);
  all_passed = all_passed && hits;

  const bool bounds = test_out_of_bound_in_optimized_mode();
  report_result("out_of_bound_in_optimized_mode", bounds);
  all_passed = all_passed && bounds;

  const bool per_member = test_one_fetch_per_member();
  report_result("one_fetch_per_member", per_member);
  all_passed = all_passed && per_member;

  const bool look_ahead = test_look_ahead_into_next_member();
  report_result("look_ahead_into_next_member", look_ahead);
  all_passed = all_passed && look_ahead;

  const bool clamped = test_continuation_over_clamped_windows();
  report_result("continuation_over_clamped_windows", clamped);
  all_passed = all_passed && clamped;

  const bool release = test_buffer_release_accounting();
  report_result("buffer_release_accounting", release);
  all_passed = all_passed && release;

  const bool arguments = test_argument_errors();
  report_result("argument_errors", arguments);
  all_passed = all_passed && arguments;

  return all_passed ? 0 : 1;
}
