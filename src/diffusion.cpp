// src/diffusion.cpp
#include "mdh/diffusion.hpp"
#include "mdh/codec.hpp"
#include "mdh/engine.hpp"

#include <algorithm> // std::max
#include <string>

#include <fmt/format.h>

namespace mdh {

DiffusionReport measure_diffusion(const Units &a, const Units &b, Unit unit) {
  DiffusionReport r;
  r.bits_a = render_bits(a, unit);
  r.bits_b = render_bits(b, unit);

  // Zero-fill for comparison only; unrelated to the codec's length padding.
  r.total_bits = std::max(r.bits_a.size(), r.bits_b.size());
  r.bits_a.resize(r.total_bits, '0');
  r.bits_b.resize(r.total_bits, '0');

  r.markers.assign(r.total_bits, ' ');
  for (std::size_t i = 0; i < r.total_bits; ++i) {
    if (r.bits_a[i] != r.bits_b[i]) {
      r.markers[i] = '^';
      ++r.different_bits;
    }
  }
  if (r.total_bits != 0)
    r.percentage = static_cast<double>(r.different_bits) /
                   static_cast<double>(r.total_bits) * 100.0;
  return r;
}

std::string format_report(const DiffusionReport &r, bool visual) {
  std::string out = fmt::format("Total bits compared: {}\n"
                                "Different bits: {}\n"
                                "Diffusion percentage: {:.2f}%\n",
                                r.total_bits, r.different_bits, r.percentage);
  if (visual) {
    out += "Bit differences (^ marks different bits):\n";
    out += fmt::format("1: {}\n2: {}\n   {}\n", r.bits_a, r.bits_b, r.markers);
  }
  return out;
}

LengthDiffusion length_diffusion(const HashConfig &cfg, const Units &iv,
                                 const Units &message) {
  HashEngine eng(cfg, iv);
  // Forked before any block is absorbed so both runs share the captured IV.
  HashEngine alt = eng.fork();
  const BlockCodec codec(cfg.unit, cfg.block_width);

  for (const Units &b : codec.split(message))
    eng.absorb(b);
  for (const Units &b : codec.split(message, message.size() + 1))
    alt.absorb(b);

  LengthDiffusion out;
  out.digest = eng.digest();
  out.modified_digest = alt.digest();
  out.report = measure_diffusion(out.digest, out.modified_digest, cfg.unit);
  return out;
}

Units flip_bit(const Units &v, Unit unit, std::size_t index) {
  const std::size_t nbits = v.size() * bits_per_unit(unit);
  if (index >= nbits)
    throw InvalidInput("bit index " + std::to_string(index) +
                       " out of range for " + std::to_string(nbits) + " bits");
  Units out = v;
  if (unit == Unit::bit)
    out[index] ^= 1u;
  else
    out[index / 8] ^= static_cast<std::uint8_t>(0x80u >> (index % 8));
  return out;
}

} // namespace mdh
