// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/charge.hpp"

#include <catch2/catch.hpp>
#include <string>
#include <utility>

#include "libmol/formula/error.hpp"

TEST_CASE("split_charge", "[formula]") {
  //
  using mol::formula::split_charge;

  using P = std::pair<std::string, int>;

  CHECK(split_charge("H2O") == P{"H2O", 0});
  CHECK(split_charge("") == P{"", 0});
  CHECK(split_charge("H+") == P{"H", 1});
  CHECK(split_charge("Fe+++") == P{"Fe", 3});
  CHECK(split_charge("Cl-") == P{"Cl", -1});
  CHECK(split_charge("NH2+") == P{"NH2", 1});
  CHECK(split_charge("Fe_+") == P{"Fe", 1});
  CHECK(split_charge("SO4_2-") == P{"SO4", -2});
  CHECK(split_charge("[SO4]2-") == P{"SO4", -2});
  CHECK(split_charge("[SO4]2_4-") == P{"[SO4]2", -4});
  CHECK(split_charge("CHNOP[13C]-2") == P{"CHNOP[13C]", -2});
  CHECK(split_charge("[CHNOP[13C]]2-") == P{"CHNOP[13C]", -2});
  CHECK(split_charge("[CHNOP[13C]]_2-") == P{"CHNOP[13C]", -2});
  CHECK(split_charge("[(HO)2]2-") == P{"(HO)2", -2});
  CHECK(split_charge("[13C]") == P{"[13C]", 0});
  CHECK(split_charge("[13C][12C]+") == P{"[13C][12C]", 1});

  CHECK(split_charge("X_999999+") == P{"X", 999999});

  REQUIRE_THROWS_AS(split_charge("X_9999999+"), mol::formula::FormulaError);
  REQUIRE_THROWS_AS(split_charge("X-12345678"), mol::formula::FormulaError);

  try {
    split_charge("SO4_9999999-");
    FAIL("charge accepted");
  } catch (mol::formula::FormulaError const &err) {
    CHECK(err.message() == "charge '9999999' is too large");
    CHECK(err.position() == 4);
  }
}

TEST_CASE("format_charge and join_charge", "[formula]") {
  //
  using namespace mol::formula;

  CHECK(format_charge(0) == "0");
  CHECK(format_charge(1) == "+");
  CHECK(format_charge(-1) == "-");
  CHECK(format_charge(2) == "2+");
  CHECK(format_charge(-3, "_") == "_3-");

  CHECK(join_charge("H2O", 0) == "H2O");
  CHECK(join_charge("H", 1) == "[H]+");
  CHECK(join_charge("SO4", -2) == "[SO4]2-");
  CHECK(join_charge("SO4", -2, "_") == "SO4_2-");

  CHECK(mass_charge_ratio(96.0, 0) == 96.0);
  CHECK(mass_charge_ratio(96.0, -2) == 48.0);
}
