// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <fmt/core.h>

#include <cstddef>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

#include "libmol/io/report.hpp"
#include "libmol/utility/core.hpp"
#include "libmol/utility/version.hpp"

using namespace mol;

namespace {

  constexpr std::string_view usage = R"(Usage: molcalc [options] formula

Calculate the molecular mass, elemental composition and mass distribution of a chemical formula.

Options:
  -h, --help             Print this message and exit.
  --version              Print the version and exit.
  -v, --verbose          Print intermediate results and timings.
  --maxatoms N           Only compute the mass distribution of formulas with fewer than N atoms [512].
  --min-intensity X      Omit peaks with a smaller intensity (in percent) [1e-4].
  --no-groups            Do not expand abbreviations of chemical groups.
  --no-oligos            Do not parse DNA, RNA or peptide sequences.
  --no-fractions         Do not parse lists of mass fractions.
  --no-arithmetic        Do not expand '+', '.' and '*' arithmetic.
)";

  // Parse the value following the option at argv[i].
  template <typename F>
  auto value_of(int &i, int argc, char *argv[], F &&convert) {
    //
    std::string_view name = argv[i];

    verify(i + 1 < argc, "Option {} requires a value", name);

    std::string arg = argv[++i];

    std::size_t end = 0;

    try {
      auto value = convert(arg, &end);

      verify(end == arg.size(), "Invalid value '{}' for option {}", arg, name);

      return value;
    } catch (std::logic_error const &) {
      throw error("Invalid value '{}' for option {}", arg, name);
    }
  }

}  // namespace

int main(int argc, char *argv[]) {
  //
  io::AnalyzeOptions opt;

  std::string text;

  try {
    for (int i = 1; i < argc; ++i) {
      //
      std::string_view arg = argv[i];

      if (arg == "-h" || arg == "--help") {
        fmt::print("{}", usage);
        return 0;
      } else if (arg == "--version") {
        fmt::print("molcalc {}.{}.{}\n", MOL_VERSION_MAJOR, MOL_VERSION_MINOR, MOL_VERSION_PATCH);
        return 0;
      } else if (arg == "-v" || arg == "--verbose") {
        opt.debug = true;
      } else if (arg == "--maxatoms") {
        opt.maxatoms = value_of(i, argc, argv, [](std::string const &s, std::size_t *end) { return std::stoi(s, end); });
      } else if (arg == "--min-intensity") {
        opt.min_intensity = value_of(i, argc, argv, [](std::string const &s, std::size_t *end) { return std::stod(s, end); });
      } else if (arg == "--no-groups") {
        opt.formula.normalize.parse_groups = false;
      } else if (arg == "--no-oligos") {
        opt.formula.normalize.parse_oligos = false;
      } else if (arg == "--no-fractions") {
        opt.formula.normalize.parse_fractions = false;
      } else if (arg == "--no-arithmetic") {
        opt.formula.normalize.parse_arithmetic = false;
      } else if (arg.size() > 1 && arg.front() == '-') {
        throw error("Unknown option '{}'", arg);
      } else {
        text += arg;
      }
    }

    verify(!text.empty(), "No formula given");

  } catch (std::exception const &e) {
    fmt::print(stderr, "molcalc: {}\n\n{}", e.what(), usage);
    return 1;
  }

  std::string report = opt.debug ? timeit("analyze", io::analyze, text, opt) : io::analyze(text, opt);

  fmt::print("{}\n", report);

  return 0;
}
