// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "remotezip/archive_session.h"
#include <algorithm>
#include <iostream>
#include <string>

using namespace remotezip;

// List every member of a remote archive, then print the first few bytes of one of them
int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <url> [member]\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << argv[0] << " https://example.com/data.zip\n";
    std::cerr << "  " << argv[0] << " https://example.com/data.zip tables/summary.csv\n";
    return 1;
  }

  try {
    ArchiveSession session(argv[1]);

    std::cout << "=== " << session.url() << " (" << session.resource_size() << " bytes) ===\n";
    for (const auto &member : session.members()) {
      std::cout << member.name;
      if (member.is_directory()) {
        std::cout << " (dir)";
      } else {
        std::cout << " (" << member.size << " bytes, " << member.compressed_size << " on the wire)";
      }
      std::cout << "\n";
    }
    std::cout << "\nTotal members: " << session.members().size() << "\n";

    if (argc >= 3) {
      const auto content = session.read_member(argv[2]);
      std::cout << "\n--- " << argv[2] << " (" << content.size() << " bytes) ---\n";
      std::cout.write(reinterpret_cast<const char *>(content.data()), static_cast<std::streamsize>(std::min<size_t>(content.size(), 512)));
      std::cout << "\n";
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
