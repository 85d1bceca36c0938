// src/config.cpp
#include "mdh/mdh.hpp"

#include <cctype>
#include <limits>
#include <string>

namespace mdh {

HashConfig byte_preset() { return HashConfig{}; }

HashConfig file_preset() {
  HashConfig cfg;
  cfg.digest_width = 160 / 8;
  cfg.block_width = 160 / 8;
  cfg.iv_source = IvSource::random;
  return cfg;
}

HashConfig bit_preset() {
  HashConfig cfg;
  cfg.unit = Unit::bit;
  cfg.digest_width = 8;
  cfg.block_width = 16;
  cfg.mixing = Mixing::xor_fold;
  return cfg;
}

void validate(const HashConfig &cfg) {
  if (cfg.digest_width == 0)
    throw InvalidConfiguration("digest width must be >= 1");
  if (cfg.block_width == 0)
    throw InvalidConfiguration("block width must be >= 1");
  if (cfg.rounds == 0)
    throw InvalidConfiguration("rounds must be >= 1");
  if (cfg.mixing == Mixing::rotate_xor_add && cfg.unit != Unit::byte)
    throw InvalidConfiguration("rotate-xor-add mixing needs byte units");
}

void check_units(const Units &v, Unit unit, const char *what) {
  if (unit == Unit::byte)
    return;
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (v[i] > 1)
      throw InvalidInput(std::string(what) + ": bit unit at index " +
                         std::to_string(i) + " is not 0 or 1");
  }
}

Unit parse_unit(const std::string &s) {
  if (s == "bit")
    return Unit::bit;
  if (s == "byte")
    return Unit::byte;
  throw InvalidConfiguration("unit must be 'bit' or 'byte', got '" + s + "'");
}

Mixing parse_mixing(const std::string &s) {
  if (s == "xor")
    return Mixing::xor_fold;
  if (s == "rotate")
    return Mixing::rotate_xor_add;
  throw InvalidConfiguration("mixing must be 'xor' or 'rotate', got '" + s +
                             "'");
}

std::uint32_t parse_count(const std::string &s, const char *what) {
  // Digits only: stoull would accept a sign and wrap "-1" to the maximum.
  bool digits = !s.empty();
  for (char c : s)
    digits = digits && std::isdigit(static_cast<unsigned char>(c));
  if (!digits)
    throw InvalidConfiguration(std::string(what) +
                               " must be a non-negative integer, got '" + s +
                               "'");
  const std::size_t first = s.find_first_not_of('0');
  if (first != std::string::npos && s.size() - first > 10)
    throw InvalidConfiguration(std::string(what) + " " + s +
                               " does not fit in 32 bits");
  const unsigned long long v = std::stoull(s);
  if (v > std::numeric_limits<std::uint32_t>::max())
    throw InvalidConfiguration(std::string(what) + " " + s +
                               " does not fit in 32 bits");
  return static_cast<std::uint32_t>(v);
}

const char *to_string(Unit u) noexcept {
  return u == Unit::bit ? "bit" : "byte";
}

const char *to_string(Mixing m) noexcept {
  switch (m) {
  case Mixing::xor_fold:
    return "xor";
  case Mixing::rotate_xor_add:
    return "rotate";
  }
  return "?";
}

} // namespace mdh
