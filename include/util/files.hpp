// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KVMRELAY_UTIL_FILES_HPP
#define KVMRELAY_UTIL_FILES_HPP

#include <filesystem>
#include <string>

namespace kvmrelay {
namespace util {

/**
 * Read entire file into string
 * Returns empty string on failure
 */
std::string read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Get default data directory for the relay
 * Returns ~/.kvmrelay on Unix
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace kvmrelay

#endif // KVMRELAY_UTIL_FILES_HPP
