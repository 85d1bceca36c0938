// src/mixing.cpp
#include "mdh/mixing.hpp"

#include <cstdint>
#include <memory>

namespace mdh {

Units XorFold::compress(const Units &state, const Units &block) const {
  const std::size_t W = state.size();
  Units result = state;
  // Later block positions overwrite earlier ones landing on the same slot.
  for (std::size_t k = 0; k < block.size(); ++k)
    result[k % W] = static_cast<std::uint8_t>(state[k % W] ^ block[k]);
  return result;
}

Units RotateXorAdd::compress(const Units &state, const Units &block) const {
  const std::size_t W = state.size();
  Units result = state;
  for (std::size_t i = 0; i < block.size(); ++i) {
    const std::size_t p = i % W;
    // Rotation reads the working copy, the addition the pre-step state.
    const std::uint8_t rotated = rotr8(result[p], rotation_);
    const std::uint8_t mixed = rotated ^ block[i];
    result[p] = static_cast<std::uint8_t>(mixed + state[p]); // wraps mod 256
  }
  return result;
}

std::shared_ptr<const MixingStrategy> make_mixing(const HashConfig &cfg) {
  validate(cfg);
  switch (cfg.mixing) {
  case Mixing::xor_fold:
    return std::make_shared<XorFold>();
  case Mixing::rotate_xor_add:
    return std::make_shared<RotateXorAdd>(cfg.rotation);
  }
  throw InvalidConfiguration("unknown mixing function");
}

} // namespace mdh
