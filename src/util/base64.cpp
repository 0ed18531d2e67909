// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/base64.hpp"
#include <cstdint>

namespace kvmrelay {
namespace util {

namespace {
constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int DecodeChar(char c) {
  if (c >= 'A' && c <= 'Z')
    return c - 'A';
  if (c >= 'a' && c <= 'z')
    return c - 'a' + 26;
  if (c >= '0' && c <= '9')
    return c - '0' + 52;
  if (c == '+')
    return 62;
  if (c == '/')
    return 63;
  return -1;
}
} // namespace

std::string EncodeBase64(std::string_view input) {
  std::string out;
  out.reserve(((input.size() + 2) / 3) * 4);

  uint32_t acc = 0;
  int bits = 0;
  for (unsigned char c : input) {
    acc = (acc << 8) | c;
    bits += 8;
    while (bits >= 6) {
      bits -= 6;
      out.push_back(ALPHABET[(acc >> bits) & 0x3F]);
    }
  }
  if (bits > 0) {
    out.push_back(ALPHABET[(acc << (6 - bits)) & 0x3F]);
  }
  while (out.size() % 4 != 0) {
    out.push_back('=');
  }
  return out;
}

std::optional<std::string> DecodeBase64(std::string_view input) {
  while (!input.empty() && input.back() == '=') {
    input.remove_suffix(1);
  }
  // A single leftover character cannot encode a whole byte
  if (input.size() % 4 == 1) {
    return std::nullopt;
  }

  std::string out;
  out.reserve((input.size() * 3) / 4);

  uint32_t acc = 0;
  int bits = 0;
  for (char c : input) {
    int value = DecodeChar(c);
    if (value < 0) {
      return std::nullopt;
    }
    acc = (acc << 6) | static_cast<uint32_t>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((acc >> bits) & 0xFF));
    }
  }
  return out;
}

} // namespace util
} // namespace kvmrelay
