#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <optional>
#include <string>
#include <stdexcept>

#include "mdh/codec.hpp"
#include "mdh/diffusion.hpp"
#include "mdh/engine.hpp"

namespace py = pybind11;

static py::bytes units_to_bytes(const mdh::Units& u) {
  return py::bytes(reinterpret_cast<const char*>(u.data()), u.size());
}

static mdh::Units bytes_to_units(const py::bytes& b) {
  const std::string s = b;
  return mdh::Units(s.begin(), s.end());
}

static mdh::HashConfig make_config(const std::string& unit,
                                   std::uint32_t digest_width,
                                   std::uint32_t block_width,
                                   std::uint32_t rounds,
                                   std::uint32_t rotation,
                                   const std::string& mixing) {
  mdh::HashConfig cfg;
  cfg.unit = mdh::parse_unit(unit);
  cfg.mixing = mdh::parse_mixing(mixing);
  cfg.digest_width = digest_width;
  cfg.block_width = block_width;
  cfg.rounds = rounds;
  cfg.rotation = rotation;
  return cfg;
}

// Bit strings in, bit string out.
static std::string hash_bits_py(const std::string& message,
                                const std::string& iv,
                                std::uint32_t block_width,
                                std::uint32_t rounds) {
  mdh::HashConfig cfg = mdh::bit_preset();
  cfg.digest_width = static_cast<std::uint32_t>(iv.size());
  cfg.block_width = block_width;
  cfg.rounds = rounds;
  mdh::Units digest = mdh::hash_bits(cfg, mdh::parse_bits(iv), message);
  return mdh::render_bits(digest, mdh::Unit::bit);
}

static py::bytes hash_bytes_py(const py::bytes& message,
                               std::optional<py::bytes> iv,
                               std::uint32_t digest_width,
                               std::uint32_t block_width,
                               std::uint32_t rounds,
                               std::uint32_t rotation,
                               const std::string& mixing) {
  mdh::HashConfig cfg =
      make_config("byte", digest_width, block_width, rounds, rotation, mixing);
  mdh::Units v = iv ? bytes_to_units(*iv) : mdh::fixed_iv(cfg);
  mdh::Units msg = bytes_to_units(message);
  mdh::Units digest;
  {
    py::gil_scoped_release nogil;
    digest = mdh::hash_units(cfg, v, msg);
  }
  return units_to_bytes(digest);
}

static py::bytes hash_file_py(const std::string& path,
                              std::optional<py::bytes> iv,
                              std::uint32_t digest_width,
                              std::uint32_t block_width) {
  mdh::HashConfig cfg = mdh::file_preset();
  cfg.digest_width = digest_width;
  cfg.block_width = block_width;
  mdh::Units v = iv ? bytes_to_units(*iv) : mdh::random_iv(cfg);
  mdh::Units digest;
  {
    py::gil_scoped_release nogil;
    digest = mdh::hash_file(cfg, v, path);
  }
  return units_to_bytes(digest);
}

static py::dict measure_diffusion_py(const py::bytes& a, const py::bytes& b) {
  mdh::DiffusionReport r =
      mdh::measure_diffusion(bytes_to_units(a), bytes_to_units(b));
  py::dict out;
  out["total_bits"] = py::int_(r.total_bits);
  out["different_bits"] = py::int_(r.different_bits);
  out["percentage"] = r.percentage;
  out["markers"] = r.markers;
  out["text"] = mdh::format_report(r, true);
  return out;
}

PYBIND11_MODULE(mdhash, m) {
  m.doc() = "Merkle-Damgard teaching hash (pybind11)";
  m.attr("__version__") = mdh::MDH_VERSION;

  py::register_exception<mdh::InvalidInput>(m, "InvalidInput",
                                             PyExc_ValueError);
  py::register_exception<mdh::InvalidConfiguration>(
      m, "InvalidConfiguration", PyExc_ValueError);
  py::register_exception<mdh::IoError>(m, "IoError", PyExc_OSError);

  m.def("hash_bits", &hash_bits_py,
        py::arg("message"), py::arg("iv") = "01101010",
        py::arg("block_width") = 16, py::arg("rounds") = 3,
        R"pbdoc(
Hash a '0'/'1' string with the xor-fold compression.

The digest width is the length of `iv`; the result is a bit string of that
length.
)pbdoc");

  m.def("hash_bytes", &hash_bytes_py,
        py::arg("message"), py::arg("iv") = py::none(),
        py::arg("digest_width") = 1, py::arg("block_width") = 2,
        py::arg("rounds") = 3, py::arg("rotation") = 3,
        py::arg("mixing") = "rotate",
        R"pbdoc(Hash raw bytes; without `iv` the fixed IV is used.)pbdoc");

  m.def("hash_file", &hash_file_py,
        py::arg("path"), py::arg("iv") = py::none(),
        py::arg("digest_width") = 20, py::arg("block_width") = 20,
        R"pbdoc(Hash a file in block-sized chunks; without `iv` a random IV is drawn.)pbdoc");

  m.def("measure_diffusion", &measure_diffusion_py,
        py::arg("a"), py::arg("b"),
        R"pbdoc(Bitwise comparison: dict { total_bits, different_bits, percentage, markers, text }.)pbdoc");

  m.def("fixed_iv", [](std::uint32_t digest_width) {
          mdh::HashConfig cfg = mdh::byte_preset();
          cfg.digest_width = digest_width;
          return units_to_bytes(mdh::fixed_iv(cfg));
        },
        py::arg("digest_width") = 1);

  m.def("to_hex", [](const py::bytes& d) {
          return mdh::to_hex(bytes_to_units(d), mdh::Unit::byte);
        },
        py::arg("digest"));
}
