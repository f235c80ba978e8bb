// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/mass/composition.hpp"

#include <catch2/catch.hpp>
#include <string>
#include <vector>

#include "libmol/formula/formula.hpp"
#include "libmol/utility/core.hpp"

TEST_CASE("Composition of ethanol", "[mass]") {
  //
  mol::formula::Formula etoh{"EtOH"};

  mol::mass::Composition const &comp = etoh.composition();

  REQUIRE(comp.size() == 3);

  std::vector<std::string> order;

  for (mol::mass::CompositionItem const &item : comp) {
    order.push_back(item.symbol);
  }

  CHECK(order == std::vector<std::string>{"C", "H", "O"});

  CHECK(comp.at("C").count == 2);
  CHECK(comp.at("C").mass == Approx(24.02148).margin(1e-6));
  CHECK(comp.at("C").fraction == Approx(0.5214292593788155).margin(1e-10));
  CHECK(comp.at("H").count == 6);
  CHECK(comp.at("H").mass == Approx(6.047646).margin(1e-6));
  CHECK(comp.at("H").fraction == Approx(0.13127499116479316).margin(1e-10));
  CHECK(comp.at("O").count == 1);
  CHECK(comp.at("O").mass == Approx(15.999405).margin(1e-6));
  CHECK(comp.at("O").fraction == Approx(0.34729574945639136).margin(1e-10));

  mol::mass::CompositionItem total = comp.total();

  CHECK(total.count == 9);
  CHECK(total.mass == Approx(etoh.mass()));
  CHECK(total.fraction == Approx(1.0));

  CHECK(comp.find("N") == nullptr);
  REQUIRE_THROWS_AS(comp.at("N"), mol::RuntimeError);
}

TEST_CASE("Isotopic and elemental composition", "[mass]") {
  //
  mol::formula::Formula f{"[12C][13C]C"};

  mol::mass::Composition const &iso = f.composition(true);

  REQUIRE(iso.size() == 3);

  auto it = iso.begin();

  CHECK(it->symbol == "C");
  CHECK(it->count == 1);
  CHECK(it->mass == Approx(12.01074).margin(1e-8));
  CHECK(it->fraction == Approx(0.324490982).margin(1e-9));

  ++it;

  CHECK(it->symbol == "12C");
  CHECK(it->mass == 12.0);
  CHECK(it->fraction == Approx(0.324201).margin(1e-6));

  ++it;

  CHECK(it->symbol == "13C");

  mol::formula::Formula ion{"[12C][13C]C+"};

  mol::mass::Composition const &ele = ion.composition(false);

  REQUIRE(ele.size() == 2);

  CHECK(ele.at("C").count == 3);
  CHECK(ele.at("C").mass == Approx(37.014095).margin(1e-6));
  CHECK(ele.at("C").fraction == Approx(1.000014821).margin(1e-9));
  CHECK(ele.at("e-").count == -1);
  CHECK(ele.at("e-").mass == Approx(-5.48579909065e-4));
  CHECK(ele.total().fraction == Approx(1.0));
}

TEST_CASE("Composition of an anion", "[mass]") {
  //
  mol::formula::Formula f{"SO4_2-"};

  CHECK(f.composition().at("e-").count == 2);
  CHECK(f.composition().total().fraction == Approx(1.0));
}

TEST_CASE("Composition table", "[mass]") {
  //
  mol::mass::Composition comp{{{"2H", 2, 4.028, 0.201}, {"O", 1, 15.999, 0.799}}};

  std::string expect = "Element  Count  Relative mass  Fraction %\n"
                       "2H           2       4.028000     20.1000\n"
                       "O            1      15.999000     79.9000\n"
                       "Total:       3      20.027000    100.0000";

  CHECK(comp.to_string() == expect);

  CHECK(mol::mass::Composition{}.to_string().empty());

  mol::mass::Composition single{{{"He", 1, 4.002602, 1.0}}};

  CHECK(single.to_string() == "Element  Count  Relative mass  Fraction %\nHe           1      4.0026020    100.0000");
}
