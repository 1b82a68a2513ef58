// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "remotezip/byte_range.h"
#include "remotezip/remote_error.h"

#include <iostream>
#include <stdexcept>
#include <string>

using namespace remotezip;

namespace {

bool expect(bool condition, const std::string &message) {
  if (!condition) {
    std::cerr << "  " << message << std::endl;
    return false;
  }
  return true;
}

void report_result(const std::string &name, bool success) { std::cout << "[" << (success ? "PASS" : "FAIL") << "] " << name << std::endl; }

bool test_header_rendering() {
  bool ok = true;
  ok &= expect(ByteRange::closed(0, 99).to_header_value() == "bytes=0-99", "closed range header");
  ok &= expect(ByteRange::suffix(500).to_header_value() == "bytes=-500", "suffix range header");
  ok &= expect(ByteRange::from(1024).to_header_value() == "bytes=1024-", "open range header");
  ok &= expect(ByteRange::closed(7, 7).length() == 1, "single byte range has length 1");
  ok &= expect(ByteRange::closed(100, 199).length() == 100, "closed range length");
  ok &= expect(ByteRange::suffix(10).is_suffix() && !ByteRange::suffix(10).is_closed(), "suffix shape");
  ok &= expect(!ByteRange::from(3).is_suffix() && !ByteRange::from(3).is_closed(), "open range shape");
  return ok;
}

bool test_invalid_ranges() {
  bool ok = true;
  try {
    (void)ByteRange::closed(10, 9);
    ok &= expect(false, "end before start should throw");
  } catch (const std::invalid_argument &) {
  }
  try {
    (void)ByteRange::closed(-1, 9);
    ok &= expect(false, "negative closed start should throw");
  } catch (const std::invalid_argument &) {
  }
  try {
    (void)ByteRange::suffix(0);
    ok &= expect(false, "empty suffix should throw");
  } catch (const std::invalid_argument &) {
  }
  try {
    (void)ByteRange::from(5).length();
    ok &= expect(false, "length of an open range should throw");
  } catch (const std::logic_error &) {
  }
  return ok;
}

bool test_content_range_parsing() {
  bool ok = true;

  const ContentRange full = parse_content_range("bytes 100-199/1000");
  ok &= expect(full.first == 100 && full.last == 199, "window bounds parsed");
  ok &= expect(full.total && *full.total == 1000, "total parsed");
  ok &= expect(full.length() == 100, "window length");

  const ContentRange unknown_total = parse_content_range("bytes 0-0/*");
  ok &= expect(unknown_total.first == 0 && unknown_total.last == 0, "single byte window");
  ok &= expect(!unknown_total.total, "unknown total stays empty");

  const ContentRange spaced = parse_content_range("  bytes   5-9/10 ");
  ok &= expect(spaced.first == 5 && spaced.last == 9 && spaced.total == 10, "surrounding whitespace tolerated");
  return ok;
}

bool test_malformed_content_range() {
  const char *samples[] = { "", "bytes", "items 0-9/10", "bytes 0-9", "bytes 9-0/10", "bytes a-9/10", "bytes 0-9/5", "bytes */100", "bytes 0-9/x" };
  bool ok = true;
  for (const char *sample : samples) {
    try {
      (void)parse_content_range(sample);
      ok &= expect(false, std::string("accepted malformed value '") + sample + "'");
    } catch (const RangeUnsupportedError &) {
    }
  }
  return ok;
}

} // namespace

int main() {
  bool all_passed = true;

  const bool rendering = test_header_rendering();
  report_result("header_rendering", rendering);
  all_passed = all_passed && rendering;

  const bool invalid = test_invalid_ranges();
  report_result("invalid_ranges", invalid);
  all_passed = all_passed && invalid;

  const bool parsing = test_content_range_parsing();
  report_result("content_range_parsing", parsing);
  all_passed = all_passed && parsing;

  const bool malformed = test_malformed_content_range();
  report_result("malformed_content_range", malformed);
  all_passed = all_passed && malformed;

  return all_passed ? 0 : 1;
}
