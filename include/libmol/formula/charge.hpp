#pragma once

// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <string>
#include <string_view>
#include <utility>

/**
 * \file charge.hpp
 *
 * @brief Reading and writing the ion charge suffix of a formula.
 *
 * \rst
 *
 * The accepted suffixes are:
 *
 * ============================  ======
 * Text                          Charge
 * ============================  ======
 * ``Formula+``, ``Formula_+``   +1
 * ``Formula++``                 +2
 * ``Formula+1``, ``Formula-2``  +1, -2
 * ``Formula_2-``                -2
 * ``[Formula]2+``               +2
 * ``[Formula]-2``               -2
 * ============================  ======
 *
 * \endrst
 */

namespace mol::formula {

  /**
   * @brief Split the trailing charge off a formula.
   *
   * If a charge suffix is found one pair of square brackets enclosing the remaining formula is removed.
   *
   * @param text Formula with optional charge suffix.
   * @return The formula without the charge suffix and the charge.
   *
   * Throws a FormulaError if the magnitude of the charge is a million or more.
   */
  auto split_charge(std::string_view text) -> std::pair<std::string, int>;

  /**
   * @brief Render a charge as a suffix.
   *
   * Zero renders as ``"0"``, unit charges as a single sign and others as ``prefix``, magnitude then sign.
   */
  auto format_charge(int charge, std::string_view prefix = "") -> std::string;

  /**
   * @brief Append a charge suffix to a formula, the inverse of split_charge().
   *
   * Without a ``separator`` the formula is enclosed in square brackets, e.g. ``[SO4]2-``, otherwise the separator
   * precedes the magnitude, e.g. ``SO4_2-``. Neutral formulas are returned unchanged.
   */
  auto join_charge(std::string_view formula, int charge, std::string_view separator = "") -> std::string;

  /**
   * @brief Mass-to-charge ratio, ``mass`` itself for neutral species.
   */
  auto mass_charge_ratio(double mass, int charge) -> double;

}  // namespace mol::formula
