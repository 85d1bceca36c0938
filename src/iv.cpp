// src/iv.cpp
#include "mdh/engine.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace mdh {
namespace {

// SHA-256 initial hash words.
constexpr std::array<std::uint32_t, 8> kIvWords = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};

inline std::uint8_t iv_byte(std::size_t i) {
  const std::uint32_t w = kIvWords[(i / 4) % kIvWords.size()];
  return static_cast<std::uint8_t>(w >> (8 * (3 - i % 4)));
}

} // namespace

Units fixed_iv(const HashConfig &cfg) {
  validate(cfg);
  Units iv(cfg.digest_width, 0);
  for (std::size_t i = 0; i < iv.size(); ++i) {
    if (cfg.unit == Unit::byte)
      iv[i] = iv_byte(i);
    else
      iv[i] = static_cast<std::uint8_t>((iv_byte(i / 8) >> (7 - i % 8)) & 1u);
  }
  return iv;
}

Units random_iv(const HashConfig &cfg) {
  validate(cfg);
  std::random_device rd;
  std::uniform_int_distribution<int> dist(0, cfg.unit == Unit::bit ? 1 : 255);
  Units iv(cfg.digest_width, 0);
  for (auto &u : iv)
    u = static_cast<std::uint8_t>(dist(rd));
  return iv;
}

Units make_iv(const HashConfig &cfg) {
  return cfg.iv_source == IvSource::random ? random_iv(cfg) : fixed_iv(cfg);
}

} // namespace mdh
