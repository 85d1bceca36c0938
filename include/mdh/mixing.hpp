// include/mdh/mixing.hpp
#pragma once
#include <cstdint>
#include <memory>

#include "mdh.hpp"

namespace mdh {

// One compression step: (state, block) -> next state of the same width.
// Implementations are pure; the engine applies them `rounds` times per block.
class MixingStrategy {
public:
  virtual ~MixingStrategy() = default;
  virtual Units compress(const Units &state, const Units &block) const = 0;
  virtual Mixing kind() const noexcept = 0;
};

// result[k mod W] = state[k mod W] ^ block[k], reading the pre-step state.
class XorFold final : public MixingStrategy {
public:
  Units compress(const Units &state, const Units &block) const override;
  Mixing kind() const noexcept override { return Mixing::xor_fold; }
};

// Byte-wise rotate right, xor with the block byte, add the pre-step byte.
class RotateXorAdd final : public MixingStrategy {
public:
  explicit RotateXorAdd(std::uint32_t rotation) noexcept
      : rotation_(rotation % 8) {}
  Units compress(const Units &state, const Units &block) const override;
  Mixing kind() const noexcept override { return Mixing::rotate_xor_add; }
  std::uint32_t rotation() const noexcept { return rotation_; }

private:
  std::uint32_t rotation_;
};

inline constexpr std::uint8_t rotr8(std::uint8_t x, unsigned n) {
  n &= 7u;
  return n == 0 ? x
                : static_cast<std::uint8_t>((x >> n) | (x << (8u - n)));
}

// Strategy for cfg.mixing. Throws InvalidConfiguration via validate().
std::shared_ptr<const MixingStrategy> make_mixing(const HashConfig &cfg);

} // namespace mdh
