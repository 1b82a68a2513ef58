// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "remotezip/transport.h"

#include <algorithm>
#include <cctype>

namespace remotezip {

namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return text;
}

} // namespace

void ResponseHeaders::set(const std::string &name, std::string value) { _values[lowercase(name)] = std::move(value); }

std::optional<std::string> ResponseHeaders::find(const std::string &name) const {
  const auto it = _values.find(lowercase(name));
  if (it == _values.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace remotezip
