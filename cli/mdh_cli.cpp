#include "mdh/codec.hpp"
#include "mdh/diffusion.hpp"
#include "mdh/engine.hpp"
#include "mdh/log.hpp"
#include "mdh/mdh.hpp"

#include <exception>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace {

constexpr const char *kUsage =
    "usage: mdh_cli [options] [BITSTRING...]\n"
    "  --preset=byte|file|bit   start from a preset (default byte)\n"
    "  --unit=bit|byte          symbol alphabet\n"
    "  --digest=N --block=N     widths in units\n"
    "  --rounds=N --rotation=N  mixing knobs\n"
    "  --mixing=xor|rotate      compression function\n"
    "  --iv=fixed|random|hex:H|bits:B\n"
    "  --file=PATH              hash a file (repeatable)\n"
    "  --diffusion              also run the length-field diffusion check\n"
    "  --demo                   hash two messages one bit apart and compare\n"
    "  --verbose                debug logging\n";

struct Options {
  mdh::HashConfig cfg = mdh::byte_preset();
  std::string iv_spec;
  std::vector<std::string> messages;
  std::vector<std::string> files;
  bool diffusion = false;
  bool demo = false;
};

mdh::Units message_units(const mdh::HashConfig &cfg, const std::string &bits) {
  mdh::Units m = mdh::parse_bits(bits);
  return cfg.unit == mdh::Unit::bit ? m : mdh::bits_to_bytes(m);
}

mdh::Units resolve_iv(const Options &o) {
  const std::string &s = o.iv_spec;
  if (s.empty())
    return mdh::make_iv(o.cfg);
  if (s == "fixed")
    return mdh::fixed_iv(o.cfg);
  if (s == "random")
    return mdh::random_iv(o.cfg);
  if (s.rfind("hex:", 0) == 0) {
    mdh::Units v = mdh::parse_hex(s.substr(4));
    return o.cfg.unit == mdh::Unit::bit ? mdh::bytes_to_bits(v) : v;
  }
  if (s.rfind("bits:", 0) == 0)
    return message_units(o.cfg, s.substr(5));
  throw mdh::InvalidConfiguration("unknown iv source '" + s + "'");
}

void print_digest(const char *label, const mdh::Units &d, mdh::Unit unit) {
  fmt::print("{:<9}{} ({})\n", label, mdh::render_bits(d, unit),
             mdh::to_hex(d, unit));
}

void run_demo(const Options &o, const mdh::Units &iv) {
  const std::string bits1 = "01111010011111110100101111111011";
  const std::string bits2 = "11111010011111110100101111111011";
  const mdh::Unit unit = o.cfg.unit;

  print_digest("IV:", iv, unit);
  const mdh::Units m1 = message_units(o.cfg, bits1);
  const mdh::Units m2 = message_units(o.cfg, bits2);
  const mdh::Units d1 = mdh::hash_units(o.cfg, iv, m1);
  const mdh::Units d2 = mdh::hash_units(o.cfg, iv, m2);

  fmt::print("Message1: {}\n", bits1);
  print_digest("Digest1:", d1, unit);
  fmt::print("Message2: {}\n", bits2);
  print_digest("Digest2:", d2, unit);

  fmt::print("\nComparing input messages:\n{}",
             mdh::format_report(mdh::measure_diffusion(m1, m2, unit)));
  fmt::print("\nComparing output digests:\n{}",
             mdh::format_report(mdh::measure_diffusion(d1, d2, unit)));
}

} // namespace

int main(int argc, char **argv) {
  Options o;
  bool verbose = false;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a.rfind("--preset=", 0) == 0) {
        const std::string p = a.substr(9);
        if (p == "byte")
          o.cfg = mdh::byte_preset();
        else if (p == "file")
          o.cfg = mdh::file_preset();
        else if (p == "bit")
          o.cfg = mdh::bit_preset();
        else
          throw mdh::InvalidConfiguration("unknown preset '" + p + "'");
      } else if (a.rfind("--unit=", 0) == 0) {
        o.cfg.unit = mdh::parse_unit(a.substr(7));
      } else if (a.rfind("--digest=", 0) == 0) {
        o.cfg.digest_width = mdh::parse_count(a.substr(9), "digest width");
      } else if (a.rfind("--block=", 0) == 0) {
        o.cfg.block_width = mdh::parse_count(a.substr(8), "block width");
      } else if (a.rfind("--rounds=", 0) == 0) {
        o.cfg.rounds = mdh::parse_count(a.substr(9), "rounds");
      } else if (a.rfind("--rotation=", 0) == 0) {
        o.cfg.rotation = mdh::parse_count(a.substr(11), "rotation");
      } else if (a.rfind("--mixing=", 0) == 0) {
        o.cfg.mixing = mdh::parse_mixing(a.substr(9));
      } else if (a.rfind("--iv=", 0) == 0) {
        o.iv_spec = a.substr(5);
      } else if (a.rfind("--file=", 0) == 0) {
        o.files.push_back(a.substr(7));
      } else if (a == "--diffusion") {
        o.diffusion = true;
      } else if (a == "--demo") {
        o.demo = true;
      } else if (a == "--verbose") {
        verbose = true;
      } else if (a == "--help" || a == "-h") {
        fmt::print("{}", kUsage);
        return 0;
      } else if (a.rfind("--", 0) == 0) {
        fmt::print(stderr, "unknown option '{}'\n{}", a, kUsage);
        return 2;
      } else {
        o.messages.push_back(a);
      }
    }
  } catch (const std::exception &e) {
    fmt::print(stderr, "bad argument: {}\n{}", e.what(), kUsage);
    return 2;
  }

  if (verbose)
    mdh::log::set_level(mdh::log::Level::debug);

  try {
    mdh::validate(o.cfg);
    const mdh::Units iv = resolve_iv(o);
    mdh::log::info("cli", "unit={} W={} B={} rounds={} mixing={}",
                   mdh::to_string(o.cfg.unit), o.cfg.digest_width,
                   o.cfg.block_width, o.cfg.rounds,
                   mdh::to_string(o.cfg.mixing));

    if (o.demo) {
      run_demo(o, iv);
      return 0;
    }
    if (o.messages.empty() && o.files.empty()) {
      fmt::print(stderr, "{}", kUsage);
      return 2;
    }

    fmt::print("Initialization Vector: {}\n", mdh::to_hex(iv, o.cfg.unit));
    for (const auto &bits : o.messages) {
      const mdh::Units m = message_units(o.cfg, bits);
      fmt::print("{}  {}\n", mdh::to_hex(mdh::hash_units(o.cfg, iv, m),
                                         o.cfg.unit),
                 bits);
      if (o.diffusion) {
        auto ld = mdh::length_diffusion(o.cfg, iv, m);
        fmt::print("Modified Digest: {}\n{}",
                   mdh::to_hex(ld.modified_digest, o.cfg.unit),
                   mdh::format_report(ld.report, false));
      }
    }
    for (const auto &path : o.files) {
      const mdh::Units d = mdh::hash_file(o.cfg, iv, path);
      fmt::print("{}  {}\n", mdh::to_hex(d, o.cfg.unit), path);
      if (o.diffusion) {
        auto ld = mdh::length_diffusion(o.cfg, iv,
                                        mdh::read_file(path, o.cfg.unit));
        fmt::print("Modified Digest: {}\n{}",
                   mdh::to_hex(ld.modified_digest, o.cfg.unit),
                   mdh::format_report(ld.report, false));
      }
    }
  } catch (const mdh::IoError &e) {
    mdh::log::error("cli", "{}", e.what());
    return 1;
  } catch (const std::invalid_argument &e) {
    mdh::log::error("cli", "{}", e.what());
    return 2;
  } catch (const std::exception &e) {
    mdh::log::error("cli", "{}", e.what());
    return 1;
  }
  return 0;
}
