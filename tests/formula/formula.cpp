// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/formula.hpp"

#include <catch2/catch.hpp>
#include <optional>
#include <string>
#include <vector>

#include "libmol/data/elements.hpp"
#include "libmol/formula/error.hpp"
#include "libmol/utility/core.hpp"

namespace {

  auto allow_empty() -> mol::formula::Formula::Options {
    mol::formula::Formula::Options opt;
    opt.allow_empty = true;
    return opt;
  }

}  // namespace

TEST_CASE("Formula queries", "[formula]") {
  //
  using mol::formula::Formula;

  Formula f{"CuSO4.5H2O"};

  CHECK(f.formula() == "CuSO4(H2O)5");
  CHECK(f.hill() == "CuH10O9S");
  CHECK(f.empirical() == "CuH10O9S");
  CHECK(f.charge() == 0);
  CHECK(f.atoms() == 21);
  CHECK(f.gcd() == 1);
  CHECK(f.mass() == Approx(249.68485).margin(1e-5));
  CHECK(f.mz() == f.mass());

  CHECK(Formula{"D2O"}.formula() == "[2H]2O");
  CHECK(Formula{"D2O"}.mass() == Approx(20.0276).margin(1e-4));
  CHECK(Formula{"EtOH"}.formula() == "(C2H5)OH");
  CHECK(Formula{"H2O"}.mass() == Approx(18.015287).margin(1e-6));
  CHECK(Formula{"C6H12O6"}.empirical() == "CH2O");
  CHECK(Formula{"C6H12O6"}.gcd() == 6);
}

TEST_CASE("Empirical formula and mass", "[formula]") {
  //
  using mol::formula::Formula;

  struct Case {
    char const *input;
    char const *empirical;
    std::optional<double> mass;
    double margin;
  };

  std::vector<Case> cases{
      {"1H+", "[[1H]]+", std::nullopt, 0},
      {"12CC", "C[12C]", 24.01074, 1e-5},
      {"[SO4]2_4-", "[O4S]2-", 192.127, 1e-3},
      {"[CHNOP[13C]]2-", "[C[13C]HNOP]2-", 87.003, 1e-3},
      {"[CHNOP[13C]]_2-", "[C[13C]HNOP]2-", 87.003, 1e-3},
      {"CHNOP[13C]-2", "[C[13C]HNOP]2-", 87.003, 1e-3},
      {"Co(Bpy)(CO)4", "C14H8CoN2O4", 327.158108, 1e-6},
      {"CH3CH2Cl", "C2H5Cl", std::nullopt, 0},
      {"C1000H1000", "CH", std::nullopt, 0},
      {"Ru2(CO)8", "C4O4Ru", std::nullopt, 0},
      {"RuClH(CO)(PPh3)3", "C55H46ClOP3Ru", 952.399577, 1e-6},
      {"PhSiMe3", "C9H14Si", std::nullopt, 0},
      {"Ph(CO)C(CH3)3", "C11H14O", std::nullopt, 0},
      {"HGlyGluTyrOH", "C16H21N3O7", 367.354545, 1e-6},
      {"CGCGAATTCGCG", "C116H148N46O73P12", 3726.371155, 1e-6},
      {"MDRGEQGLLK", "C47H83N15O16S", 1146.319708, 1e-6},
      {"CDCl3", "C[2H]Cl3", 120.383542, 1e-6},
      {"[13C]Cl4", "[13C]Cl4", 154.814955, 1e-6},
      {"C5(PhBu(EtCHBr)2)3", "C53H78Br6", 1194.609618, 1e-6},
      {"AgCuRu4(H)2[CO]12{PPh3}2", "C48H32AgCuO12P2Ru4", 1438.404216, 1e-6},
      {"PhNH2.HCl", "C6H8ClN", 129.587571, 1e-6},
      {"NH3.BF3", "BF3H3N", 84.8367355, 1e-6},
      {"CuSO4.5H2O", "CuH10O9S", 249.68485, 1e-5},
      {"5*H2O+CuSO4", "CuH10O9S", 249.68485, 1e-5},
      {"5*H2O", "H2O", 90.076435, 1e-6},
      {"HCysp(Trt)Tyrp(Tbu)IleGlnp(Trt)Asnp(Trt)ProLeuGlyNH2", "C101H113N11O11S", 1689.114061, 1e-6},
  };

  for (Case const &c : cases) {
    //
    INFO(c.input);

    Formula f{c.input};

    CHECK(f.empirical() == c.empirical);

    Formula again{f.formula()};

    CHECK(again.elements() == f.elements());
    CHECK(again.charge() == f.charge());

    if (c.mass) {
      CHECK(f.mass() == Approx(*c.mass).margin(c.margin));
    }
  }
}

TEST_CASE("Mass of all elements", "[formula]") {
  //
  std::string symbols;

  for (mol::data::Element const &ele : mol::data::elements()) {
    symbols += ele.symbol;
  }

  mol::formula::Formula f{symbols};

  CHECK(f.atoms() == 109);
  CHECK(f.mass() == Approx(14693.181589).margin(1e-6));
}

TEST_CASE("Charged formulas", "[formula]") {
  //
  using mol::formula::Formula;

  Formula h{"H+"};

  CHECK(h.charge() == 1);
  CHECK(h.mass() == Approx(1.007392).margin(1e-6));

  Formula so4{"SO4_2-"};

  CHECK(so4.formula() == "[SO4]2-");
  CHECK(so4.hill() == "[O4S]2-");
  CHECK(so4.charge() == -2);
  CHECK(so4.mass() == Approx(96.06351715981813).margin(1e-9));
  CHECK(so4.mz() == Approx(48.03175).margin(1e-5));

  mol::data::Isotope const &iso = so4.isotope();

  CHECK(iso.mass == Approx(95.952826812).margin(1e-8));
  CHECK(iso.abundance == Approx(0.9407).margin(1e-4));
  CHECK(iso.massnumber == 96);
  CHECK(iso.charge == -2);
}

TEST_CASE("Isotopic composition of the most abundant isotopes", "[formula]") {
  //
  using mol::formula::Formula;

  Formula caffeine{"C8H10N4O2"};

  CHECK(caffeine.mass() == Approx(194.1909).margin(1e-4));
  CHECK(caffeine.monoisotopic_mass() == Approx(194.08037).margin(1e-5));
  CHECK(caffeine.nominal_mass() == 194);

  Formula big{"C48H32AgCuO12P2Ru4"};

  CHECK(big.isotope().mass == Approx(1439.588966).margin(1e-6));
  CHECK(big.isotope().abundance == Approx(0.0020507511).margin(1e-10));
  CHECK(big.nominal_mass() == 1440);

  CHECK(Formula{"C"}.isotope().mass == 12.0);
  CHECK(Formula{"C"}.isotope().abundance == Approx(0.9893));
  CHECK(Formula{"12C"}.isotope().massnumber == 12);
  CHECK(Formula{"13C"}.isotope().abundance == Approx(0.0107));

  Formula etoh{"EtOH"};

  CHECK(etoh.mass() == Approx(46.068531).margin(1e-6));
  CHECK(etoh.monoisotopic_mass() == Approx(46.04186481295).margin(1e-9));
  CHECK(etoh.isotope().abundance == Approx(0.9756627354527866).margin(1e-12));
  CHECK(etoh.atoms() == 9);
}

TEST_CASE("The empty formula", "[formula]") {
  //
  using mol::formula::Formula;

  REQUIRE_THROWS_AS(Formula{""}, mol::formula::FormulaError);

  Formula f{"", allow_empty()};

  CHECK(f.formula().empty());
  CHECK(f.hill().empty());
  CHECK(f.empirical().empty());
  CHECK(f.elements().empty());
  CHECK(f.atoms() == 0);
  CHECK(f.gcd() == 1);
  CHECK(f.mass() == 0.0);
  CHECK(f.isotope().mass == 0.0);
  CHECK(f.isotope().abundance == 1.0);
  CHECK(f.nominal_mass() == 0);
  CHECK(f.composition().empty());
  CHECK(f.spectrum().empty());
  CHECK(f.spectrum().mean() == 0.0);

  REQUIRE_THROWS_AS(f.spectrum().peak(), mol::RuntimeError);
  REQUIRE_THROWS_AS(f.spectrum().range(), mol::RuntimeError);

  Formula water{"H2O"};

  CHECK((f * 2).formula() == "()2");
  CHECK((f * 2).elements().empty());
  CHECK((f * 2) == f);
  CHECK((f + f).formula() == "()()");
  CHECK((f + f).mass() == 0.0);
  CHECK(((water - water) * 2).atoms() == 0);
  CHECK(((water - water) * 2).hill().empty());
  CHECK((f + water) == water);
}

TEST_CASE("Large counts", "[formula]") {
  //
  using mol::formula::Formula;

  Formula carbon{"C200000000"};

  CHECK(carbon.atoms() == 200000000);
  CHECK(carbon.nominal_mass() == 2400000000);
  CHECK(carbon.mass() == Approx(200000000 * mol::data::elements()["C"].mass));

  Formula labelled{"[13C]200000000"};

  CHECK(labelled.nominal_mass() == 2600000000);
  REQUIRE_THROWS_AS(labelled.spectrum(), mol::RuntimeError);

  CHECK(Formula{"[13C]1000"}.spectrum().at(13000).fraction == Approx(1.0));
}

TEST_CASE("Formula arithmetic", "[formula]") {
  //
  using mol::formula::Formula;

  Formula water{"H2O"};
  Formula hydroxide{"HO-"};

  CHECK((hydroxide * 2).formula() == "[(HO)2]2-");
  CHECK((2 * hydroxide).formula() == "[(HO)2]2-");
  CHECK((hydroxide * 2).charge() == -2);
  CHECK((water + hydroxide).formula() == "[(H2O)(HO)]-");
  CHECK((water + Formula{"", allow_empty()}).formula() == "(H2O)()");
  CHECK((water + Formula{"", allow_empty()}).mass() == Approx(water.mass()));
  CHECK((water - Formula{"O"}).formula() == "H2");
  CHECK((water - water).formula().empty());
  CHECK((water - water).atoms() == 0);
  CHECK(Formula{"CuSO4.5H2O"} - Formula{"5*H2O"} == Formula{"CuSO4"});
  CHECK((Formula{"H3O+"} - Formula{"H+"}).charge() == 0);

  CHECK(Formula{"H2O"} == Formula{"OH2"});
  CHECK(Formula{"H2O"} != Formula{"D2O"});
  CHECK(Formula{"H+"} != Formula{"H"});

  REQUIRE_THROWS_AS(water * 0, mol::RuntimeError);
  REQUIRE_THROWS_AS(water - Formula{"N"}, mol::RuntimeError);
  REQUIRE_THROWS_AS(water - Formula{"H3"}, mol::RuntimeError);
  REQUIRE_THROWS_AS(water - Formula{"[2H]"}, mol::RuntimeError);
}

TEST_CASE("Formula errors", "[formula]") {
  //
  using mol::formula::Formula;
  using mol::formula::FormulaError;

  REQUIRE_THROWS_AS(Formula{"Xy"}, FormulaError);
  REQUIRE_THROWS_AS(Formula{"[11C]"}, FormulaError);
  REQUIRE_THROWS_AS(Formula{"H2O-H2O"}, FormulaError);
  REQUIRE_THROWS_AS(Formula{"(H2O"}, FormulaError);

  // FormulaError is a mol::RuntimeError.
  REQUIRE_THROWS_AS(Formula{"abc"}, mol::RuntimeError);
}
