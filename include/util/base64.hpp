// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KVMRELAY_UTIL_BASE64_HPP
#define KVMRELAY_UTIL_BASE64_HPP

#include <optional>
#include <string>
#include <string_view>

namespace kvmrelay {
namespace util {

// Standard alphabet, padded output
std::string EncodeBase64(std::string_view input);

// Accepts padded or unpadded input; nullopt on any invalid character
std::optional<std::string> DecodeBase64(std::string_view input);

} // namespace util
} // namespace kvmrelay

#endif // KVMRELAY_UTIL_BASE64_HPP
