// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/files.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace kvmrelay {
namespace util {

std::string read_file_string(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return {};
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  if (!file && !file.eof()) {
    return {};
  }
  return contents.str();
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".kvmrelay";
  }

  // Fallback to current directory
  return std::filesystem::current_path() / ".kvmrelay";
}

} // namespace util
} // namespace kvmrelay
