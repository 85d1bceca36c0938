#include "mdh/codec.hpp"
#include "mdh/engine.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <string>

namespace {

// Scratch file removed on scope exit.
struct TempFile {
  std::string path;
  explicit TempFile(const std::string &name, const std::string &contents)
      : path(name) {
    std::ofstream out(path, std::ios::binary);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  }
  ~TempFile() { std::remove(path.c_str()); }
};

} // namespace

TEST_CASE("File digest equals the in-memory digest of its bytes") {
  std::string contents;
  for (int i = 0; i < 1000; ++i)
    contents.push_back(static_cast<char>(i * 31));
  TempFile f("mdh_test_file.bin", contents);

  mdh::HashConfig cfg = mdh::file_preset();
  mdh::Units iv = mdh::fixed_iv(cfg);
  mdh::Units bytes(contents.begin(), contents.end());

  REQUIRE(mdh::read_file(f.path, mdh::Unit::byte) == bytes);
  REQUIRE(mdh::hash_file(cfg, iv, f.path) == mdh::hash_units(cfg, iv, bytes));
}

TEST_CASE("File hashing in bit units expands each byte") {
  TempFile f("mdh_test_bits.bin", "\x7a\x7f\x4b\xfb");
  mdh::HashConfig cfg = mdh::bit_preset();
  mdh::Units iv = mdh::parse_bits("01101010");
  REQUIRE(mdh::hash_file(cfg, iv, f.path) == mdh::parse_bits("11001110"));
}

TEST_CASE("Empty file hashes like an empty message") {
  TempFile f("mdh_test_empty.bin", "");
  mdh::HashConfig cfg = mdh::byte_preset();
  mdh::Units iv{0x6a};
  REQUIRE(mdh::hash_file(cfg, iv, f.path) == mdh::Units{66});
}

TEST_CASE("Unreadable file is an IoError") {
  mdh::HashConfig cfg = mdh::file_preset();
  mdh::Units iv = mdh::fixed_iv(cfg);
  REQUIRE_THROWS_AS(mdh::hash_file(cfg, iv, "does/not/exist.bin"),
                    mdh::IoError);
  REQUIRE_THROWS_AS(mdh::read_file("does/not/exist.bin", mdh::Unit::byte),
                    mdh::IoError);
}
