// src/hex.cpp
#include "mdh/codec.hpp"
#include "mdh/engine.hpp"

#include <cstdint>
#include <string>

namespace mdh {
namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::string to_hex(const Units &digest, Unit unit) {
  Units bytes;
  if (unit == Unit::byte) {
    bytes = digest;
  } else {
    // Read the bits as one big-endian number, zero-filled to whole bytes.
    Units bits((8 - digest.size() % 8) % 8, 0);
    bits.insert(bits.end(), digest.begin(), digest.end());
    bytes = bits_to_bytes(bits);
  }

  static const char *hex = "0123456789abcdef";
  std::string out;
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[2 * i] = hex[(bytes[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[bytes[i] & 0xF];
  }
  return out;
}

Units parse_hex(std::string_view hex) {
  if (hex.size() % 2 != 0)
    throw InvalidInput("hex string has odd length");
  Units out(hex.size() / 2, 0);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = hex_value(hex[2 * i]);
    const int lo = hex_value(hex[2 * i + 1]);
    if (hi < 0 || lo < 0)
      throw InvalidInput("hex string: invalid digit near index " +
                         std::to_string(2 * i));
    out[i] = static_cast<std::uint8_t>(hi << 4 | lo);
  }
  return out;
}

} // namespace mdh
