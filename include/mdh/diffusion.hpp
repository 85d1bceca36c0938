// include/mdh/diffusion.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "mdh.hpp"

namespace mdh {

// Bitwise comparison of two sequences; the shorter is right-padded with zero
// bits for the comparison only.
struct DiffusionReport {
  std::size_t total_bits = 0;     // max of both bit lengths
  std::size_t different_bits = 0;
  double percentage = 0.0;        // 0 when total_bits == 0
  std::string bits_a;             // padded renderings
  std::string bits_b;
  std::string markers;            // '^' under differing bits
};

DiffusionReport measure_diffusion(const Units &a, const Units &b,
                                  Unit unit = Unit::byte);

// Summary lines, plus the aligned bit diff when `visual` is set.
std::string format_report(const DiffusionReport &r, bool visual = true);

// Digest of a message against the digest of the same message whose length
// field claims one more unit; both runs start from the same captured IV.
struct LengthDiffusion {
  Units digest;
  Units modified_digest;
  DiffusionReport report;
};

LengthDiffusion length_diffusion(const HashConfig &cfg, const Units &iv,
                                 const Units &message);

// Copy of v with bit `index` flipped, counting bits MSB first across units.
// Throws InvalidInput when index is out of range.
Units flip_bit(const Units &v, Unit unit, std::size_t index);

} // namespace mdh
