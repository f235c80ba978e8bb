#pragma once

// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file parse.hpp
 *
 * @brief Parse canonical formula strings into element counts and render them in Hill notation.
 */

namespace mol::formula {

  /**
   * @brief Type used to count atoms.
   */
  using Count = std::int64_t;

  /**
   * @brief Mapping from isotope selector to count.
   *
   * A selector of zero denotes the natural isotope distribution, otherwise it is the mass number of an explicit
   * isotope.
   */
  using Isotopes = std::map<int, Count>;

  /**
   * @brief Mapping from element symbol to the counts of its isotopes.
   *
   * Every selector is a known isotope of the element and no count is zero.
   */
  using Elements = std::map<std::string, Isotopes, std::less<>>;

  /**
   * @brief Parse a canonical formula (without charge suffix) into element counts.
   *
   * \rst
   *
   * The formula is scanned right-to-left keeping a stack of the multipliers of the enclosing brackets. The
   * bracket families ``()``, ``[]``, ``{}`` and ``<>`` are interchangeable. A run of digits preceding an element
   * symbol is its mass number if it is preceded by an opening bracket (or starts the formula), e.g. ``[13C]``.
   *
   * \endrst
   *
   * @param formula The formula to parse.
   * @param allow_empty If true a formula without elements, e.g. the empty string or ``()``, is accepted.
   * @return The element counts.
   */
  auto parse(std::string_view formula, bool allow_empty = false) -> Elements;

  /**
   * @brief Sort element symbols in Hill order.
   *
   * Carbon first, then hydrogen if carbon is present, then all others alphabetically.
   */
  auto hill_order(std::vector<std::string> symbols) -> std::vector<std::string>;

  /**
   * @brief Format strings used by from_elements().
   *
   * Each is a `{fmt}` format string, the isotope formats receive the mass number first.
   */
  struct Notation {
    std::string element = "{}";                ///< Symbol.
    std::string element_count = "{}{}";        ///< Symbol, count.
    std::string isotope = "[{}{}]";            ///< Mass number, symbol.
    std::string isotope_count = "[{}{}]{}";    ///< Mass number, symbol, count.

    /**
     * @brief Counts as subscripts and mass numbers as superscripts.
     */
    static auto html() -> Notation;
  };

  /**
   * @brief Render element counts as a formula in Hill notation.
   *
   * @param elements Element counts.
   * @param divisor Every count (and the charge) is divided by this.
   * @param charge Charge appended with join_charge().
   * @param notation Formats of the individual terms.
   */
  auto from_elements(Elements const& elements, Count divisor = 1, int charge = 0, Notation const& notation = {}) -> std::string;

}  // namespace mol::formula
