// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "remotezip/archive_session.h"
#include "remotezip/remote_error.h"
#include "remotezip/range_fetcher.h"
#include "remotezip/session_fault.h"
#include "remotezip/virtual_stream.h"

#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct FetchConfig {
  std::string url;
  std::string member;
  std::string output;
  remotezip::SessionOptions session;
};

void print_usage(const char *argv0) {
  std::cerr << "Usage: " << (argv0 ? argv0 : "remotezip_fetch") << " <url> [member] [--output PATH] [--no-suffix-range]\n"
            << "       [--header \"Name: value\"]... [--option NAME=value]... [--buffer-size BYTES]\n";
}

bool parse_size(std::string_view value, std::size_t &out) {
  if (value.empty()) {
    return false;
  }
  std::size_t result = 0;
  for (char ch : value) {
    if (ch < '0' || ch > '9') {
      return false;
    }
    result = result * 10 + static_cast<std::size_t>(ch - '0');
  }
  out = result;
  return true;
}

bool split_pair(std::string_view value, char separator, std::string &name, std::string &rest) {
  const auto pos = value.find(separator);
  if (pos == std::string_view::npos || pos == 0) {
    return false;
  }
  name = std::string(value.substr(0, pos));
  std::string_view tail = value.substr(pos + 1);
  while (!tail.empty() && tail.front() == ' ') {
    tail.remove_prefix(1);
  }
  rest = std::string(tail);
  return true;
}

void list_members(const remotezip::ArchiveSession &session) {
  std::cout << "url: " << session.url() << "\n";
  std::cout << "size: " << session.resource_size() << "\n";
  std::cout << "index offset: " << session.index_offset() << "\n";
  std::cout << "members: " << session.members().size() << "\n";
  for (const auto &member : session.members()) {
    std::cout << std::setw(12) << member.size << " " << std::setw(12) << member.compressed_size << " " << std::setw(12) << member.header_offset << "  " << member.name << "\n";
  }
}

int write_member(remotezip::ArchiveSession &session, const FetchConfig &cfg) {
  if (!cfg.output.empty()) {
    session.extract(cfg.member, cfg.output);
    return 0;
  }

  remotezip::MemberReader reader = session.open_member(cfg.member);
  std::vector<char> chunk(64 * 1024);
  while (true) {
    const size_t bytes = reader.read(chunk.data(), chunk.size());
    if (bytes == 0) {
      break;
    }
    if (std::fwrite(chunk.data(), 1, bytes, stdout) != bytes) {
      std::cerr << "Error: failed to write to stdout\n";
      return 1;
    }
  }
  std::fflush(stdout);
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  FetchConfig cfg;

  if (argc < 2) {
    print_usage(argv[0]);
    return 2;
  }

  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--output") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --output requires PATH\n";
        return 2;
      }
      cfg.output = argv[++i];
      continue;
    }
    if (arg == "--no-suffix-range") {
      cfg.session.support_suffix_range = false;
      continue;
    }
    if (arg == "--header") {
      std::string name;
      std::string value;
      if (i + 1 >= argc || !split_pair(argv[++i], ':', name, value)) {
        std::cerr << "Error: --header requires \"Name: value\"\n";
        return 2;
      }
      cfg.session.transport.headers.emplace_back(name, value);
      continue;
    }
    if (arg == "--option") {
      std::string name;
      std::string value;
      if (i + 1 >= argc || !split_pair(argv[++i], '=', name, value)) {
        std::cerr << "Error: --option requires NAME=value\n";
        return 2;
      }
      cfg.session.transport.settings[name] = value;
      continue;
    }
    if (arg == "--buffer-size") {
      std::size_t value = 0;
      if (i + 1 >= argc || !parse_size(argv[++i], value) || value == 0) {
        std::cerr << "Error: invalid --buffer-size value\n";
        return 2;
      }
      cfg.session.initial_buffer_size = value;
      continue;
    }
    if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
      std::cerr << "Error: unknown arg: " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    }
    positional.push_back(arg);
  }

  if (positional.empty() || positional.size() > 2) {
    print_usage(argv[0]);
    return 2;
  }
  cfg.url = positional[0];
  if (positional.size() == 2) {
    cfg.member = positional[1];
  }
  if (!cfg.output.empty() && cfg.member.empty()) {
    std::cerr << "Error: --output requires a member name\n";
    return 2;
  }

  remotezip::register_fault_callback([](const remotezip::SessionFault &fault) {
    std::cerr << "[fault] " << remotezip::fault_kind_name(fault.kind) << " " << fault.url;
    if (fault.code != 0) {
      std::cerr << " (code " << fault.code << ")";
    }
    std::cerr << ": " << fault.message << "\n";
  });

  try {
    remotezip::ArchiveSession session(cfg.url, cfg.session);
    int status = 0;
    if (cfg.member.empty()) {
      list_members(session);
    } else {
      status = write_member(session, cfg);
    }
    std::cerr << "requests: " << session.fetcher().requests_issued() << ", windows: " << session.stream().fetch_count() << "\n";
    return status;
  } catch (const remotezip::RemoteZipError &) {
    // already reported through the fault callback
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
