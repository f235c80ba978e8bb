// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <fmt/core.h>

#include "libmol/formula/formula.hpp"

void example_arithmetic() {
  //
  using mol::formula::Formula;

  Formula water{"H2O"};
  Formula copper{"CuSO4"};

  Formula hydrate = copper + 5 * water;  // (CuSO4)((H2O)5)

  fmt::print("{} has mass {:.5f}\n", hydrate.hill(), hydrate.mass());

  Formula dry = hydrate - 5 * water;  // Back to CuSO4.

  fmt::print("{} == {} is {}\n", dry.formula(), copper.formula(), dry == copper);
}

void example_options() {
  //
  mol::formula::Formula::Options opt;

  opt.normalize.parse_groups = false;  // "Et" is no longer ethyl.
  opt.allow_empty = true;

  mol::formula::Formula f{"EtOH"};
  mol::formula::Formula g{"", opt};

  fmt::print("{} {} '{}'\n", f.formula(), f.empirical(), g.formula());
}

int main() {
  example_arithmetic();
  example_options();
  return 0;
}
