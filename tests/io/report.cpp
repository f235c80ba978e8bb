// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/io/report.hpp"

#include <catch2/catch.hpp>
#include <string>

namespace {

  auto contains(std::string const &text, std::string const &part) -> bool { return text.find(part) != std::string::npos; }

}  // namespace

TEST_CASE("Report of caffeine", "[io]") {
  //
  mol::io::AnalyzeOptions opt;

  opt.min_intensity = 0.01;

  std::string report = mol::io::analyze("C8H10N4O2", opt);

  INFO(report);

  CHECK(contains(report, "Formula: C8H10N4O2"));
  CHECK(!contains(report, "Hill notation"));
  CHECK(contains(report, "Empirical formula: C4H5N2O"));
  CHECK(contains(report, "Nominal mass: 194"));
  CHECK(contains(report, "Average mass: 194.19"));
  CHECK(contains(report, "Monoisotopic mass: 194.08038 (89.883%)"));
  CHECK(contains(report, "Number of atoms: 24"));
  CHECK(contains(report, "Elemental Composition"));
  CHECK(contains(report, "O            2       31.99881     16.4780"));
  CHECK(contains(report, "Mass Distribution"));
  CHECK(contains(report, "Most abundant mass: 194.08038 (89.883%)"));
  CHECK(contains(report, "197      197.08721    0.050048     0.055681"));
  CHECK(!contains(report, "m/z"));
}

TEST_CASE("Report options", "[io]") {
  //
  mol::io::AnalyzeOptions opt;

  opt.maxatoms = 10;

  std::string report = mol::io::analyze("H10N4O2C8", opt);

  INFO(report);

  CHECK(contains(report, "Hill notation: C8H10N4O2"));
  CHECK(!contains(report, "Mass Distribution"));
  CHECK(!contains(report, "Most abundant mass"));

  opt.formula.allow_empty = true;

  std::string empty = mol::io::analyze("", opt);

  CHECK(contains(empty, "Nominal mass: 0"));
  CHECK(contains(empty, "Average mass: 0.000000"));
  CHECK(!contains(empty, "Elemental Composition"));
}

TEST_CASE("Report of an ion", "[io]") {
  //
  std::string report = mol::io::analyze("SO4_2-");

  INFO(report);

  CHECK(contains(report, "Hill notation: [O4S]2-"));
  CHECK(contains(report, "m/z: 48.031759"));
  CHECK(contains(report, "e-"));
  CHECK(contains(report, "m/z\n"));
}

TEST_CASE("Report of invalid formulas", "[io]") {
  //
  CHECK(contains(mol::io::analyze("Xy"), "Error: unknown symbol"));
  CHECK(contains(mol::io::analyze(""), "Error: empty formula"));
  CHECK(contains(mol::io::analyze("H2O-H2O"), "Error: subtraction not allowed"));
}
