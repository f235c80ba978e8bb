// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/parse.hpp"

#include <catch2/catch.hpp>
#include <string>
#include <vector>

#include "libmol/formula/error.hpp"

TEST_CASE("parse counts elements and isotopes", "[formula]") {
  //
  using namespace mol::formula;

  CHECK(parse("H2O") == Elements{{"H", {{0, 2}}}, {"O", {{0, 1}}}});
  CHECK(parse("(COOH)2") == Elements{{"C", {{0, 2}}}, {"H", {{0, 2}}}, {"O", {{0, 4}}}});
  CHECK(parse("[2H]2O") == Elements{{"H", {{2, 2}}}, {"O", {{0, 1}}}});
  CHECK(parse("12CC") == Elements{{"C", {{0, 1}, {12, 1}}}});
  CHECK(parse("[30Si]3O2") == Elements{{"O", {{0, 2}}}, {"Si", {{30, 3}}}});
  CHECK(parse("{Ca<OH>2}3") == Elements{{"Ca", {{0, 3}}}, {"H", {{0, 6}}}, {"O", {{0, 6}}}});
  CHECK(parse("C1000H1000") == Elements{{"C", {{0, 1000}}}, {"H", {{0, 1000}}}});
  CHECK(parse("", true).empty());
  CHECK(parse("()", true).empty());
  CHECK(parse("()2(())", true).empty());
}

TEST_CASE("parse rejects malformed formulas", "[formula]") {
  //
  using namespace mol::formula;

  auto message = [](std::string const &formula) -> std::string {
    try {
      parse(formula);
    } catch (FormulaError const &err) {
      return err.message();
    }
    return "";
  };

  CHECK(message("") == "empty formula");
  CHECK(message("abc") == "unexpected character 'a'");
  CHECK(message("H2O)") == "missing opening parenthesis");
  CHECK(message("(H2O") == "missing closing parenthesis");
  CHECK(message("H0") == "count is zero");
  CHECK(message("Xy") == "unknown symbol 'Xy'");
  CHECK(message("[11C]") == "unknown isotope '11C'");
  CHECK(message("[4294967308C]") == "unknown isotope '4294967308C'");
  CHECK(message("999999999999C") == "unknown isotope '999999999999C'");
  CHECK(message("2(H2O)") == "number preceding formula");
  CHECK(message("H1234567890123") == "number too large");
  CHECK(message("H2O*") == "unexpected character '*'");
  CHECK(message("()") == "invalid formula");
}

TEST_CASE("Errors point at the offending character", "[formula]") {
  //
  using namespace mol::formula;

  try {
    parse("[11C]");
    FAIL("Expected a FormulaError");
  } catch (FormulaError const &err) {
    CHECK(err.position() == 1);
    CHECK(std::string(err.what()) == "unknown isotope '11C'\n[11C]\n.^");
  }

  try {
    parse("abc");
    FAIL("Expected a FormulaError");
  } catch (FormulaError const &err) {
    CHECK(std::string(err.what()) == "unexpected character 'a'\nabc\n^");
  }
}

TEST_CASE("hill_order", "[formula]") {
  //
  using mol::formula::hill_order;

  using V = std::vector<std::string>;

  CHECK(hill_order({"H", "C", "O"}) == V{"C", "H", "O"});
  CHECK(hill_order({"O", "H"}) == V{"H", "O"});
  CHECK(hill_order({"Na", "Cl"}) == V{"Cl", "Na"});
  CHECK(hill_order({"Cl", "Ru", "P", "H", "C", "O"}) == V{"C", "H", "Cl", "O", "P", "Ru"});
}

TEST_CASE("from_elements", "[formula]") {
  //
  using namespace mol::formula;

  Elements elements{{"C", {{0, 4}, {12, 2}}}};

  CHECK(from_elements(elements) == "C4[12C]2");
  CHECK(from_elements(elements, 2, 2, Notation::html()) == "[C<sub>2</sub><sup>12</sup>C]+");
  CHECK(from_elements(elements, 1, 2, Notation::html()) == "[C<sub>4</sub><sup>12</sup>C<sub>2</sub>]2+");
  CHECK(from_elements({{"H", {{1, 1}}}}, 1, 1) == "[[1H]]+");
  CHECK(from_elements({}).empty());
}
