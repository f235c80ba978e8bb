// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/sequence.hpp"

#include <catch2/catch.hpp>

#include "libmol/formula/error.hpp"
#include "libmol/formula/groups.hpp"

TEST_CASE("from_sequence", "[formula]") {
  //
  using namespace mol::formula;

  SequenceItems items{{'A', "B"}, {'C', "D"}};

  CHECK(from_sequence("A", items) == "(B)");
  CHECK(from_sequence("AA", items) == "(B)2");
  CHECK(from_sequence("CAC", items) == "(B)(D)2");

  REQUIRE_THROWS_AS(from_sequence("AX", items), FormulaError);

  try {
    from_sequence("AAX", items);
  } catch (FormulaError const &err) {
    CHECK(err.position() == 2);
  }
}

TEST_CASE("from_peptide", "[formula]") {
  //
  using namespace mol::formula;

  CHECK(from_peptide("GG") == "((C2H3NO)2H2O)");
  CHECK(from_peptide("CPK") == "((C3H5NOS)(C6H12N2O)(C5H7NO)H2O)");
  CHECK(from_peptide("G G+") == "[((C2H3NO)2H2O)]+");
}

TEST_CASE("from_oligo", "[formula]") {
  //
  using namespace mol::formula;

  CHECK(from_oligo("AC", Oligo::ssdna) == "((C10H12N5O5P)(C9H12N3O6P)H2O)");
  CHECK(from_oligo("AU", Oligo::dsrna) == "((C10H12N5O6P)2(C9H11N2O8P)2(H2O)2)");
  CHECK(from_oligo("CCUU", Oligo::dsrna)
        == "((C10H12N5O6P)2(C9H12N3O7P)2(C10H12N5O7P)2(C9H11N2O8P)2(H2O)2)");

  REQUIRE_THROWS_AS(from_oligo("AU", Oligo::dsdna), FormulaError);
}

TEST_CASE("parse_oligo", "[formula]") {
  //
  using namespace mol::formula;

  CHECK(parse_oligo("ssdna") == Oligo::ssdna);
  CHECK(parse_oligo("dsDNA") == Oligo::dsdna);
  CHECK(parse_oligo("SSRNA") == Oligo::ssrna);
  CHECK(parse_oligo("dsrna") == Oligo::dsrna);

  REQUIRE_THROWS_AS(parse_oligo("tsdna"), FormulaError);
}
