// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/fractions.hpp"

#include <catch2/catch.hpp>

#include "libmol/formula/error.hpp"

TEST_CASE("parse_fractions", "[formula]") {
  //
  using namespace mol::formula;

  Fractions f = parse_fractions("O: 0.26, 30Si: 0.74");

  REQUIRE(f.size() == 2);
  CHECK(f.at("O") == Approx(0.26));
  CHECK(f.at("30Si") == Approx(0.74));

  REQUIRE_THROWS_AS(parse_fractions("O: 0.26, 30Si"), FormulaError);
  REQUIRE_THROWS_AS(parse_fractions("O: 0.2x6"), FormulaError);
  REQUIRE_THROWS_AS(parse_fractions(": 0.5"), FormulaError);
}

TEST_CASE("from_fractions", "[formula]") {
  //
  using namespace mol::formula;

  CHECK(from_fractions({{"H", 0.112}, {"O", 0.888}}) == "H2O");
  CHECK(from_fractions({{"D", 0.2}, {"O", 0.8}}) == "O[2H]2");
  CHECK(from_fractions({{"H", 8.97}, {"C", 59.39}, {"O", 31.64}}) == "C5H9O2");
  CHECK(from_fractions({{"O", 0.26}, {"30Si", 0.74}}) == "O2[30Si]3");
  CHECK(from_fractions({}).empty());

  REQUIRE_THROWS_AS(from_fractions({{"Xy", 0.5}, {"O", 0.5}}), FormulaError);
  REQUIRE_THROWS_AS(from_fractions({{"11C", 0.5}, {"O", 0.5}}), FormulaError);
  REQUIRE_THROWS_AS(from_fractions({{"H", 0.0}, {"O", 1.0}}), FormulaError);
}
