// include/mdh/codec.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "mdh.hpp"

namespace mdh {

// Receives each completed block, in order.
using BlockSink = std::function<void(const Units &)>;

// Splits messages into fixed-width blocks and appends the length field.
class BlockCodec {
public:
  // Throws InvalidConfiguration if block_width == 0.
  BlockCodec(Unit unit, std::size_t block_width);

  Unit unit() const noexcept { return unit_; }
  std::size_t block_width() const noexcept { return width_; }

  // Big-endian digits of `length` in the unit's base, no leading zeros
  // (one zero digit for 0), keeping only the low block_width digits.
  Units length_encoding(std::uint64_t length) const;

  // Whole message to blocks, the length field encoding message.size().
  std::vector<Units> split(const Units &message) const;
  // Same, but encodes `declared_length` instead of the real length.
  std::vector<Units> split(const Units &message,
                           std::uint64_t declared_length) const;

  // Reads a dedicated length block back as a number.
  // Throws InvalidInput for blocks of the wrong width or above 64 bits.
  std::uint64_t decode_length(const Units &block) const;

private:
  Unit unit_;
  std::size_t width_;
};

// Incremental splitter: full blocks leave through the sink as soon as they
// are complete, only the partial tail is buffered until finish().
class BlockWriter {
public:
  BlockWriter(const BlockCodec &codec, BlockSink sink);

  void write(const std::uint8_t *data, std::size_t n);
  void write(const Units &piece) { write(piece.data(), piece.size()); }

  // Pads the tail and emits the length field; the writer is spent afterwards.
  void finish();
  void finish(std::uint64_t declared_length);

  std::uint64_t length() const noexcept { return length_; }
  std::size_t blocks_emitted() const noexcept { return emitted_; }

private:
  void emit(const Units &block);

  const BlockCodec &codec_;
  BlockSink sink_;
  Units tail_;
  std::uint64_t length_ = 0;
  std::size_t emitted_ = 0;
  bool finished_ = false;
};

// "0101..." -> bit units. Throws InvalidInput on any other character.
Units parse_bits(std::string_view bits);
// Units rendered as a '0'/'1' string, 8 characters per byte unit.
std::string render_bits(const Units &v, Unit unit);
// One bit unit per bit, most significant first.
Units bytes_to_bits(const Units &bytes);
// Packs bit units MSB first; a trailing partial byte is padded with zeros.
Units bits_to_bytes(const Units &bits);

} // namespace mdh
