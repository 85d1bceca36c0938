// include/mdh/mdh.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace mdh {

// Bump when the digest contract changes (handy for logging/UI).
inline constexpr const char *MDH_VERSION = "0.2.0";

// Alphabet of a message, block, state or digest. In bit mode every element of
// a Units vector holds 0 or 1; in byte mode it holds a full byte.
enum class Unit { bit, byte };

// Mixing function applied by the compression step.
enum class Mixing {
  xor_fold,       // state[k mod W] ^ block[k]
  rotate_xor_add, // rotr(state[p]) ^ block[i] + state[p], byte units only
};

enum class IvSource { fixed, random };

using Units = std::vector<std::uint8_t>;

inline constexpr std::size_t bits_per_unit(Unit u) noexcept {
  return u == Unit::bit ? 1 : 8;
}

// Construction parameters; widths are counted in units.
struct HashConfig {
  Unit unit = Unit::byte;
  std::uint32_t digest_width = 1;  // W
  std::uint32_t block_width = 2;   // B, independent of W
  std::uint32_t rounds = 3;        // compression rounds per block
  std::uint32_t rotation = 3;      // rotate-xor-add only, taken mod 8
  Mixing mixing = Mixing::rotate_xor_add;
  IvSource iv_source = IvSource::fixed;
};

// 1-byte digest over 2-byte blocks.
HashConfig byte_preset();
// 160-bit digest over 160-bit blocks, random IV (file hashing).
HashConfig file_preset();
// 8-bit digest over 16-bit blocks with the plain xor fold.
HashConfig bit_preset();

// Malformed message, IV or block (e.g. a '2' in a bit string).
struct InvalidInput : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Zero widths or rounds, or a mixing function the unit cannot carry.
struct InvalidConfiguration : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Input source could not be opened or read.
struct IoError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Throws InvalidConfiguration when cfg cannot drive an engine.
void validate(const HashConfig &cfg);

// Throws InvalidInput if any element of v is outside the unit's alphabet.
void check_units(const Units &v, Unit unit, const char *what);

// Parse "bit"/"byte", "xor"/"rotate" and unsigned 32-bit counts from text
// options; anything else is InvalidConfiguration naming `what`.
Unit parse_unit(const std::string &s);
Mixing parse_mixing(const std::string &s);
std::uint32_t parse_count(const std::string &s, const char *what);

const char *to_string(Unit u) noexcept;
const char *to_string(Mixing m) noexcept;

} // namespace mdh
