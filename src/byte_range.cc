// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "remotezip/byte_range.h"
#include "remotezip/remote_error.h"

#include <cctype>
#include <charconv>
#include <stdexcept>
#include <string_view>

namespace remotezip {

namespace {

bool parse_integer(std::string_view text, int64_t &out) {
  if (text.empty()) {
    return false;
  }
  const char *first = text.data();
  const char *last = text.data() + text.size();
  const auto result = std::from_chars(first, last, out);
  return result.ec == std::errc() && result.ptr == last && out >= 0;
}

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

[[noreturn]] void throw_malformed(const std::string &value) { throw RangeUnsupportedError("Malformed Content-Range header: '" + value + "'"); }

} // namespace

ByteRange ByteRange::closed(int64_t first, int64_t last) {
  if (first < 0) {
    throw std::invalid_argument("closed byte range requires a non-negative start");
  }
  if (last < first) {
    throw std::invalid_argument("byte range end precedes its start");
  }
  return ByteRange{ first, last };
}

ByteRange ByteRange::from(int64_t first) {
  if (first < 0) {
    throw std::invalid_argument("open byte range requires a non-negative start");
  }
  return ByteRange{ first, std::nullopt };
}

ByteRange ByteRange::suffix(int64_t count) {
  if (count <= 0) {
    throw std::invalid_argument("suffix byte range requires a positive length");
  }
  return ByteRange{ -count, std::nullopt };
}

int64_t ByteRange::length() const {
  if (!end) {
    throw std::logic_error("length() is only defined for closed byte ranges");
  }
  return *end - start + 1;
}

std::string ByteRange::to_header_value() const {
  if (end) {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(*end);
  }
  if (start < 0) {
    return "bytes=" + std::to_string(start);
  }
  return "bytes=" + std::to_string(start) + "-";
}

ContentRange parse_content_range(const std::string &value) {
  std::string_view text = trim(value);
  constexpr std::string_view unit = "bytes";
  if (text.substr(0, unit.size()) != unit) {
    throw_malformed(value);
  }
  text = trim(text.substr(unit.size()));

  const auto slash = text.find('/');
  if (slash == std::string_view::npos) {
    throw_malformed(value);
  }
  const std::string_view window = trim(text.substr(0, slash));
  const std::string_view total = trim(text.substr(slash + 1));

  const auto dash = window.find('-');
  if (dash == std::string_view::npos) {
    throw_malformed(value);
  }

  ContentRange range;
  if (!parse_integer(window.substr(0, dash), range.first) || !parse_integer(window.substr(dash + 1), range.last) || range.last < range.first) {
    throw_malformed(value);
  }

  if (total != "*") {
    int64_t parsed_total = 0;
    if (!parse_integer(total, parsed_total) || parsed_total <= range.last) {
      throw_malformed(value);
    }
    range.total = parsed_total;
  }
  return range;
}

} // namespace remotezip
