#pragma once

// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <functional>
#include <map>
#include <string>
#include <string_view>

/**
 * \file fractions.hpp
 *
 * @brief Infer a formula from elemental mass fractions.
 */

namespace mol::formula {

  /**
   * @brief Mapping from element or isotope symbol to its (unnormalised) mass fraction.
   *
   * Keys are element symbols, ``D`` for deuterium or isotopes written as ``30Si`` or ``[30Si]``.
   */
  using Fractions = std::map<std::string, double, std::less<>>;

  /**
   * @brief Parse a list of mass fractions like ``"O: 0.26, 30Si: 0.74"``.
   *
   * Throws FormulaError if the list is malformed.
   */
  auto parse_fractions(std::string_view text) -> Fractions;

  /**
   * @brief Find the formula with the smallest counts matching the mass fractions.
   *
   * \rst
   *
   * The fractions are normalised and divided by the element (or isotope) masses giving relative atom counts
   * :math:`n_k`, scaled such that the smallest is one. The factor :math:`i \in [1, \text{maxcount})` minimising
   *
   * .. math::
   *
   *    \sum_k |i n_k - \text{round}(i n_k)|
   *
   * is then selected, stopping early once the error is below :math:`i \times \text{precision}` per symbol.
   *
   * \endrst
   *
   * @param fractions Mass fraction of each element or isotope.
   * @param maxcount Exclusive upper bound of the scaling factor.
   * @param precision Accepted rounding error per symbol.
   * @return Formula with symbols sorted alphabetically, isotopes as ``[30Si]``, or empty string if ``fractions`` is empty.
   */
  auto from_fractions(Fractions const& fractions, int maxcount = 10, double precision = 1e-4) -> std::string;

}  // namespace mol::formula
