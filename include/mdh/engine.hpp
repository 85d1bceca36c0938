// include/mdh/engine.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "mdh.hpp"
#include "mixing.hpp"

namespace mdh {

// Merkle-Damgard iteration: state starts at the IV, every block is folded in
// `rounds` times, and the state after the last block is the digest.
class HashEngine {
public:
  // Throws InvalidConfiguration for a bad cfg and InvalidInput when iv is not
  // exactly digest_width units of cfg.unit.
  HashEngine(const HashConfig &cfg, Units iv);

  // Throws InvalidInput unless block has block_width units of cfg.unit.
  void absorb(const Units &block);

  const Units &state() const noexcept { return state_; }
  // Copy of the IV taken at construction; never aliases the live state.
  const Units &initial_state() const noexcept { return initial_; }
  Units digest() const { return state_; }
  std::uint64_t blocks_absorbed() const noexcept { return blocks_; }

  const HashConfig &config() const noexcept { return cfg_; }
  const MixingStrategy &mixing() const noexcept { return *mixing_; }

  void reset();
  // Fresh engine with the same configuration, starting from initial_state().
  HashEngine fork() const;

private:
  HashConfig cfg_;
  std::shared_ptr<const MixingStrategy> mixing_;
  Units initial_;
  Units state_;
  std::uint64_t blocks_ = 0;
};

// Pulls the next piece of input; std::nullopt marks the end.
using ChunkSupplier = std::function<std::optional<Units>()>;

Units hash_units(const HashConfig &cfg, const Units &iv, const Units &message);
// Bit string convenience; cfg.unit must be Unit::bit.
Units hash_bits(const HashConfig &cfg, const Units &iv, std::string_view bits);
Units hash_stream(const HashConfig &cfg, const Units &iv,
                  const ChunkSupplier &next);
// Reads `path` in block-sized chunks. Throws IoError if it cannot be read.
Units hash_file(const HashConfig &cfg, const Units &iv,
                const std::string &path);
// Whole file as units of `unit` (bits expand MSB first). Throws IoError.
Units read_file(const std::string &path, Unit unit);

// SHA-256 initial hash words, big-endian, cycled over digest_width units.
Units fixed_iv(const HashConfig &cfg);
// digest_width units drawn from std::random_device.
Units random_iv(const HashConfig &cfg);
// fixed_iv or random_iv according to cfg.iv_source.
Units make_iv(const HashConfig &cfg);

// Lowercase hex, two digits per whole byte of the digest's bit width.
std::string to_hex(const Units &digest, Unit unit);
// Inverse of to_hex for byte units. Throws InvalidInput on odd length or
// non-hex characters.
Units parse_hex(std::string_view hex);

} // namespace mdh
