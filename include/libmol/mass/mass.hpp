#pragma once

// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/data/elements.hpp"
#include "libmol/formula/parse.hpp"

/**
 * \file mass.hpp
 *
 * @brief Masses of parsed formulas.
 */

namespace mol::mass {

  /**
   * @brief Average relative mass of a formula.
   *
   * \rst
   *
   * Natural elements contribute their standard atomic weight, explicit isotopes their isotopic mass. The mass of
   * ``charge`` electrons is subtracted such that cations are lighter than the neutral molecule.
   *
   * \endrst
   */
  auto average_mass(formula::Elements const &elements, int charge) -> double;

  /**
   * @brief The isotopic composition made of the most abundant isotope of every natural element.
   *
   * The abundance is the product of the abundances of the individual isotopes, the mass is corrected for the
   * electrons of the charge.
   */
  auto monoisotopic(formula::Elements const &elements, int charge) -> data::Isotope;

  /**
   * @brief Count the atoms in a formula.
   */
  auto count_atoms(formula::Elements const &elements) -> formula::Count;

}  // namespace mol::mass
