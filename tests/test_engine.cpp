#include "mdh/codec.hpp"
#include "mdh/engine.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cstddef>
#include <optional>

using mdh::HashConfig;
using mdh::Units;

TEST_CASE("Bit-oriented reference digest") {
  HashConfig cfg = mdh::bit_preset();
  Units iv = mdh::parse_bits("01101010");
  Units d = mdh::hash_bits(cfg, iv, "01111010011111110100101111111011");
  REQUIRE(d == mdh::parse_bits("11001110"));
  REQUIRE(mdh::to_hex(d, mdh::Unit::bit) == "ce");

  // The fixed IV for an 8-bit digest is the same constant.
  REQUIRE(mdh::fixed_iv(cfg) == iv);
}

TEST_CASE("Byte-oriented digest with the fixed IV") {
  HashConfig cfg = mdh::byte_preset();
  Units iv = mdh::fixed_iv(cfg);
  REQUIRE(iv == Units{0x6a});
  Units msg{0x7a, 0x7f, 0x4b, 0xfb};
  REQUIRE(mdh::hash_units(cfg, iv, msg) == Units{0x98});

  HashConfig file = mdh::file_preset();
  Units iv20 = mdh::fixed_iv(file);
  REQUIRE(mdh::to_hex(iv20, mdh::Unit::byte) ==
          "6a09e667bb67ae853c6ef372a54ff53a510e527f");
  REQUIRE(mdh::to_hex(mdh::hash_units(file, iv20, Units{'a', 'b', 'c'}),
                      mdh::Unit::byte) ==
          "91bb68ff87747156a2f692f314264ee747e114a2");
}

TEST_CASE("Same message and IV always give the same digest") {
  HashConfig cfg = mdh::file_preset();
  Units iv = mdh::random_iv(cfg);
  Units msg{'h', 'e', 'l', 'l', 'o'};
  REQUIRE(mdh::hash_units(cfg, iv, msg) == mdh::hash_units(cfg, iv, msg));
}

TEST_CASE("Digest width does not depend on message length") {
  for (std::uint32_t W : {1u, 3u, 20u}) {
    for (std::uint32_t B : {1u, 2u, 20u, 32u}) {
      HashConfig cfg;
      cfg.digest_width = W;
      cfg.block_width = B;
      Units iv = mdh::fixed_iv(cfg);
      for (std::size_t n : {0u, 1u, 7u, 64u, 301u}) {
        Units msg(n, 0x5a);
        REQUIRE(mdh::hash_units(cfg, iv, msg).size() == W);
      }
    }
  }
}

TEST_CASE("Empty message hashes like a single zero block") {
  HashConfig cfg = mdh::byte_preset();
  Units iv{0x6a};
  mdh::HashEngine eng(cfg, iv);
  eng.absorb(Units{0, 0});
  REQUIRE(mdh::hash_units(cfg, iv, Units{}) == eng.digest());
  REQUIRE(eng.digest() == Units{66});
}

TEST_CASE("Degenerate configuration is rejected at construction") {
  HashConfig cfg = mdh::byte_preset();
  Units iv{0x6a};

  HashConfig bad = cfg;
  bad.digest_width = 0;
  REQUIRE_THROWS_AS(mdh::HashEngine(bad, Units{}), mdh::InvalidConfiguration);
  bad = cfg;
  bad.block_width = 0;
  REQUIRE_THROWS_AS(mdh::HashEngine(bad, iv), mdh::InvalidConfiguration);
  bad = cfg;
  bad.rounds = 0;
  REQUIRE_THROWS_AS(mdh::HashEngine(bad, iv), mdh::InvalidConfiguration);
  bad = cfg;
  bad.unit = mdh::Unit::bit;
  REQUIRE_THROWS_AS(mdh::HashEngine(bad, Units{1}),
                    mdh::InvalidConfiguration);
}

TEST_CASE("Option text is parsed strictly") {
  REQUIRE(mdh::parse_unit("bit") == mdh::Unit::bit);
  REQUIRE(mdh::parse_unit("byte") == mdh::Unit::byte);
  REQUIRE_THROWS_AS(mdh::parse_unit("bogus"), mdh::InvalidConfiguration);
  REQUIRE(mdh::parse_mixing("xor") == mdh::Mixing::xor_fold);
  REQUIRE(mdh::parse_mixing("rotate") == mdh::Mixing::rotate_xor_add);
  REQUIRE_THROWS_AS(mdh::parse_mixing("bogus"), mdh::InvalidConfiguration);

  REQUIRE(mdh::parse_count("20", "digest width") == 20);
  REQUIRE(mdh::parse_count("0", "rounds") == 0);
  REQUIRE(mdh::parse_count("4294967295", "block width") == 4294967295u);
  REQUIRE(mdh::parse_count("0000000000007", "rounds") == 7);
  REQUIRE_THROWS_AS(mdh::parse_count("-1", "digest width"),
                    mdh::InvalidConfiguration);
  REQUIRE_THROWS_AS(mdh::parse_count("+1", "digest width"),
                    mdh::InvalidConfiguration);
  REQUIRE_THROWS_AS(mdh::parse_count("4294967296", "digest width"),
                    mdh::InvalidConfiguration);
  REQUIRE_THROWS_AS(mdh::parse_count("4294967297", "digest width"),
                    mdh::InvalidConfiguration);
  REQUIRE_THROWS_AS(mdh::parse_count("123456789012345678901234", "rounds"),
                    mdh::InvalidConfiguration);
  REQUIRE_THROWS_AS(mdh::parse_count("", "rounds"), mdh::InvalidConfiguration);
  REQUIRE_THROWS_AS(mdh::parse_count("3x", "rounds"),
                    mdh::InvalidConfiguration);
  REQUIRE_THROWS_AS(mdh::parse_count(" 3", "rounds"),
                    mdh::InvalidConfiguration);
}

TEST_CASE("Malformed IVs, blocks and bit strings are InvalidInput") {
  HashConfig cfg = mdh::byte_preset();
  REQUIRE_THROWS_AS(mdh::HashEngine(cfg, Units{1, 2}), mdh::InvalidInput);

  mdh::HashEngine eng(cfg, Units{0x6a});
  REQUIRE_THROWS_AS(eng.absorb(Units{1}), mdh::InvalidInput);
  REQUIRE_THROWS_AS(eng.absorb(Units{1, 2, 3}), mdh::InvalidInput);

  HashConfig bits = mdh::bit_preset();
  REQUIRE_THROWS_AS(mdh::HashEngine(bits, Units(8, 2)), mdh::InvalidInput);
  REQUIRE_THROWS_AS(mdh::hash_bits(bits, mdh::fixed_iv(bits), "0120"),
                    mdh::InvalidInput);
  REQUIRE_THROWS_AS(mdh::hash_bits(cfg, Units{0x6a}, "01"),
                    mdh::InvalidConfiguration);
}

TEST_CASE("Initial state is a snapshot, fork restarts from it") {
  HashConfig cfg = mdh::file_preset();
  Units iv = mdh::fixed_iv(cfg);
  mdh::HashEngine eng(cfg, iv);
  eng.absorb(Units(20, 0x11));
  REQUIRE(eng.state() != iv);
  REQUIRE(eng.initial_state() == iv);
  REQUIRE(eng.blocks_absorbed() == 1);

  mdh::HashEngine other = eng.fork();
  REQUIRE(other.state() == iv);
  REQUIRE(other.blocks_absorbed() == 0);
  other.absorb(Units(20, 0x11));
  REQUIRE(other.state() == eng.state());

  eng.reset();
  REQUIRE(eng.state() == iv);
}

TEST_CASE("Rounds re-feed the same block") {
  HashConfig one = mdh::byte_preset();
  one.rounds = 1;
  mdh::HashEngine a(one, Units{0x6a});
  for (int r = 0; r < 3; ++r)
    a.absorb(Units{0x12, 0x34});

  mdh::HashEngine b(mdh::byte_preset(), Units{0x6a});
  b.absorb(Units{0x12, 0x34});
  REQUIRE(a.state() == b.state());
}

TEST_CASE("Streamed input matches the in-memory digest") {
  HashConfig cfg = mdh::file_preset();
  Units iv = mdh::fixed_iv(cfg);
  Units msg(97);
  for (std::size_t i = 0; i < msg.size(); ++i)
    msg[i] = static_cast<std::uint8_t>(i * 7);

  std::size_t pos = 0;
  auto next = [&]() -> std::optional<Units> {
    if (pos >= msg.size())
      return std::nullopt;
    std::size_t n = std::min<std::size_t>(13, msg.size() - pos);
    Units piece(msg.begin() + pos, msg.begin() + pos + n);
    pos += n;
    return piece;
  };
  REQUIRE(mdh::hash_stream(cfg, iv, next) == mdh::hash_units(cfg, iv, msg));
}

TEST_CASE("Hex rendering") {
  REQUIRE(mdh::to_hex(Units{0x00, 0xab}, mdh::Unit::byte) == "00ab");
  REQUIRE(mdh::to_hex(Units{}, mdh::Unit::byte).empty());
  // 20 bits read as one number, zero-filled to three bytes.
  REQUIRE(mdh::to_hex(mdh::parse_bits("10100000000000000001"),
                      mdh::Unit::bit) == "0a0001");
  REQUIRE(mdh::parse_hex("00aBff") == Units{0x00, 0xab, 0xff});
  REQUIRE_THROWS_AS(mdh::parse_hex("abc"), mdh::InvalidInput);
  REQUIRE_THROWS_AS(mdh::parse_hex("zz"), mdh::InvalidInput);
}

TEST_CASE("IV sources produce digest-width values in the unit alphabet") {
  HashConfig bits = mdh::bit_preset();
  bits.digest_width = 13;
  Units r = mdh::random_iv(bits);
  REQUIRE(r.size() == 13);
  for (auto u : r)
    REQUIRE(u <= 1);

  HashConfig cfg = mdh::file_preset();
  REQUIRE(mdh::make_iv(cfg).size() == 20);
  cfg.iv_source = mdh::IvSource::fixed;
  REQUIRE(mdh::make_iv(cfg) == mdh::fixed_iv(cfg));
  REQUIRE(mdh::fixed_iv(cfg) == mdh::fixed_iv(cfg));
}
