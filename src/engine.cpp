// src/engine.cpp
#include "mdh/engine.hpp"
#include "mdh/codec.hpp"
#include "mdh/log.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace mdh {

HashEngine::HashEngine(const HashConfig &cfg, Units iv)
    : cfg_(cfg), mixing_(make_mixing(cfg)), initial_(std::move(iv)) {
  if (initial_.size() != cfg_.digest_width)
    throw InvalidInput("iv has " + std::to_string(initial_.size()) +
                       " units, digest width is " +
                       std::to_string(cfg_.digest_width));
  check_units(initial_, cfg_.unit, "iv");
  state_ = initial_;
}

void HashEngine::absorb(const Units &block) {
  if (block.size() != cfg_.block_width)
    throw InvalidInput("block has " + std::to_string(block.size()) +
                       " units, block width is " +
                       std::to_string(cfg_.block_width));
  check_units(block, cfg_.unit, "block");

  // The same block is re-fed against the updated state every round.
  for (std::uint32_t r = 0; r < cfg_.rounds; ++r)
    state_ = mixing_->compress(state_, block);
  ++blocks_;
}

void HashEngine::reset() {
  state_ = initial_;
  blocks_ = 0;
}

HashEngine HashEngine::fork() const {
  HashEngine copy(*this);
  copy.reset();
  return copy;
}

namespace {

Units run(HashEngine &eng, const std::function<void(BlockWriter &)> &feed) {
  const HashConfig &cfg = eng.config();
  BlockCodec codec(cfg.unit, cfg.block_width);
  BlockWriter w(codec, [&](const Units &b) { eng.absorb(b); });
  feed(w);
  w.finish();
  log::debug("engine", "{} {}s in {} blocks, mixing={}", w.length(),
             to_string(cfg.unit), w.blocks_emitted(), to_string(cfg.mixing));
  return eng.digest();
}

} // namespace

Units hash_units(const HashConfig &cfg, const Units &iv, const Units &message) {
  HashEngine eng(cfg, iv);
  return run(eng, [&](BlockWriter &w) { w.write(message); });
}

Units hash_bits(const HashConfig &cfg, const Units &iv, std::string_view bits) {
  if (cfg.unit != Unit::bit)
    throw InvalidConfiguration("bit string input needs bit units");
  return hash_units(cfg, iv, parse_bits(bits));
}

Units hash_stream(const HashConfig &cfg, const Units &iv,
                  const ChunkSupplier &next) {
  HashEngine eng(cfg, iv);
  return run(eng, [&](BlockWriter &w) {
    while (std::optional<Units> piece = next())
      w.write(*piece);
  });
}

Units hash_file(const HashConfig &cfg, const Units &iv,
                const std::string &path) {
  validate(cfg);
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw IoError("cannot open '" + path + "'");

  std::vector<char> buf(cfg.block_width);
  auto next = [&]() -> std::optional<Units> {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    if (in.bad())
      throw IoError("read failed on '" + path + "'");
    const std::streamsize got = in.gcount();
    if (got <= 0)
      return std::nullopt;
    Units piece(buf.begin(), buf.begin() + got);
    return cfg.unit == Unit::bit ? bytes_to_bits(piece) : piece;
  };

  log::debug("engine", "hashing file '{}'", path);
  return hash_stream(cfg, iv, next);
}

Units read_file(const std::string &path, Unit unit) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw IoError("cannot open '" + path + "'");
  Units bytes((std::istreambuf_iterator<char>(in)),
              std::istreambuf_iterator<char>());
  if (in.bad())
    throw IoError("read failed on '" + path + "'");
  return unit == Unit::bit ? bytes_to_bits(bytes) : bytes;
}

} // namespace mdh
