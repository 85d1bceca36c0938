// src/codec.cpp
#include "mdh/codec.hpp"

#include <algorithm>
#include <cstdint>
#include <gmp.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace mdh {
namespace {

// Scoped mpz_t; the length field may be wider than any native integer.
struct Mpz {
  mpz_t v;
  Mpz() { mpz_init(v); }
  ~Mpz() { mpz_clear(v); }
  Mpz(const Mpz &) = delete;
  Mpz &operator=(const Mpz &) = delete;
};

Units left_pad(const Units &enc, std::size_t width) {
  Units block(width, 0);
  std::copy(enc.begin(), enc.end(), block.end() - enc.size());
  return block;
}

} // namespace

BlockCodec::BlockCodec(Unit unit, std::size_t block_width)
    : unit_(unit), width_(block_width) {
  if (width_ == 0)
    throw InvalidConfiguration("block width must be >= 1");
}

Units BlockCodec::length_encoding(std::uint64_t length) const {
  Mpz n;
  mpz_import(n.v, 1, 1, sizeof(length), 0, 0, &length);
  // Keep the low block_width units: the field wraps instead of failing.
  mpz_tdiv_r_2exp(n.v, n.v, width_ * bits_per_unit(unit_));

  if (unit_ == Unit::bit) {
    const std::size_t nbits = mpz_sizeinbase(n.v, 2); // 1 for zero
    Units out(nbits, 0);
    for (std::size_t i = 0; i < nbits; ++i)
      out[i] = static_cast<std::uint8_t>(mpz_tstbit(n.v, nbits - 1 - i));
    return out;
  }

  const std::size_t nbytes = (mpz_sizeinbase(n.v, 2) + 7) / 8;
  Units out(nbytes, 0);
  std::size_t count = 0;
  mpz_export(out.data(), &count, 1, 1, 1, 0, n.v);
  if (count == 0) // zero exports nothing
    out.assign(1, 0);
  return out;
}

std::vector<Units> BlockCodec::split(const Units &message) const {
  return split(message, message.size());
}

std::vector<Units> BlockCodec::split(const Units &message,
                                     std::uint64_t declared_length) const {
  std::vector<Units> blocks;
  blocks.reserve(message.size() / width_ + 2);
  BlockWriter w(*this, [&](const Units &b) { blocks.push_back(b); });
  w.write(message);
  w.finish(declared_length);
  return blocks;
}

std::uint64_t BlockCodec::decode_length(const Units &block) const {
  if (block.size() != width_)
    throw InvalidInput("length block has " + std::to_string(block.size()) +
                       " units, expected " + std::to_string(width_));
  check_units(block, unit_, "length block");

  Mpz n;
  if (unit_ == Unit::byte) {
    mpz_import(n.v, block.size(), 1, 1, 1, 0, block.data());
  } else {
    for (std::size_t i = 0; i < block.size(); ++i)
      if (block[i])
        mpz_setbit(n.v, block.size() - 1 - i);
  }
  if (mpz_sizeinbase(n.v, 2) > 64)
    throw InvalidInput("length field does not fit in 64 bits");

  std::uint64_t value = 0;
  mpz_export(&value, nullptr, -1, sizeof(value), 0, 0, n.v);
  return value;
}

// ---- BlockWriter ----

BlockWriter::BlockWriter(const BlockCodec &codec, BlockSink sink)
    : codec_(codec), sink_(std::move(sink)) {
  tail_.reserve(codec_.block_width());
}

void BlockWriter::write(const std::uint8_t *data, std::size_t n) {
  if (finished_)
    throw std::logic_error("BlockWriter: write after finish");
  const std::size_t B = codec_.block_width();
  const bool bits = codec_.unit() == Unit::bit;
  for (std::size_t i = 0; i < n; ++i) {
    if (bits && data[i] > 1)
      throw InvalidInput("message: bit unit at index " +
                         std::to_string(length_ + i) + " is not 0 or 1");
  }
  for (std::size_t i = 0; i < n; ++i) {
    tail_.push_back(data[i]);
    if (tail_.size() == B) {
      emit(tail_);
      tail_.clear();
    }
  }
  length_ += n;
}

void BlockWriter::finish() { finish(length_); }

void BlockWriter::finish(std::uint64_t declared_length) {
  if (finished_)
    throw std::logic_error("BlockWriter: finish called twice");
  finished_ = true;

  const std::size_t B = codec_.block_width();
  const Units enc = codec_.length_encoding(declared_length);

  // Last chunk was full (or there was none): the length gets its own block.
  if (tail_.empty()) {
    emit(left_pad(enc, B));
    return;
  }

  const std::size_t remaining = B - tail_.size();
  if (enc.size() > remaining) {
    tail_.resize(B, 0);
    emit(tail_);
    emit(left_pad(enc, B));
  } else {
    tail_.insert(tail_.end(), enc.begin(), enc.end());
    tail_.resize(B, 0);
    emit(tail_);
  }
  tail_.clear();
}

void BlockWriter::emit(const Units &block) {
  ++emitted_;
  sink_(block);
}

// ---- bit strings ----

Units parse_bits(std::string_view bits) {
  Units out;
  out.reserve(bits.size());
  for (std::size_t i = 0; i < bits.size(); ++i) {
    const char c = bits[i];
    if (c != '0' && c != '1')
      throw InvalidInput("bit string: invalid character '" +
                         std::string(1, c) + "' at index " +
                         std::to_string(i));
    out.push_back(static_cast<std::uint8_t>(c - '0'));
  }
  return out;
}

std::string render_bits(const Units &v, Unit unit) {
  std::string out;
  if (unit == Unit::bit) {
    out.reserve(v.size());
    for (std::uint8_t b : v)
      out.push_back(b ? '1' : '0');
    return out;
  }
  out.reserve(v.size() * 8);
  for (std::uint8_t b : v)
    for (int i = 7; i >= 0; --i)
      out.push_back(((b >> i) & 1u) ? '1' : '0');
  return out;
}

Units bytes_to_bits(const Units &bytes) {
  Units out;
  out.reserve(bytes.size() * 8);
  for (std::uint8_t b : bytes)
    for (int i = 7; i >= 0; --i)
      out.push_back(static_cast<std::uint8_t>((b >> i) & 1u));
  return out;
}

Units bits_to_bytes(const Units &bits) {
  check_units(bits, Unit::bit, "bits");
  Units out((bits.size() + 7) / 8, 0);
  for (std::size_t i = 0; i < bits.size(); ++i)
    if (bits[i])
      out[i / 8] |= static_cast<std::uint8_t>(0x80u >> (i % 8));
  return out;
}

} // namespace mdh
