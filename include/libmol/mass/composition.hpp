#pragma once

// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "libmol/formula/parse.hpp"

/**
 * \file composition.hpp
 *
 * @brief Elemental composition of a formula.
 */

namespace mol::mass {

  /**
   * @brief The contribution of one element (or isotope) to a formula.
   */
  struct CompositionItem {
    std::string symbol;        ///< Element symbol, isotope symbol like ``13C`` or ``e-`` for the charge.
    formula::Count count = 0;  ///< Number of atoms.
    double mass = 0.0;         ///< Total relative mass of the atoms.
    double fraction = 0.0;     ///< Mass fraction of the formula.
  };

  /**
   * @brief Elemental composition, items are in Hill order.
   *
   * \rst
   *
   * Rendered as a table:
   *
   * .. code::
   *
   *     Element  Count  Relative mass  Fraction %
   *     2H           2       4.028000     20.1000
   *     O            1      15.999000     79.9000
   *     Total:       3      20.027000    100.0000
   *
   * \endrst
   */
  class Composition {
  public:
    /**
     * @brief Construct an empty Composition.
     */
    Composition() = default;

    /**
     * @brief Construct a new Composition from ``items``.
     */
    explicit Composition(std::vector<CompositionItem> items) : m_items(std::move(items)) {}

    /**
     * @brief Compute the composition of a formula.
     *
     * @param elements Element counts of the formula.
     * @param charge Net charge, if non-zero an ``e-`` item with count ``-charge`` is appended.
     * @param isotopic If true explicit isotopes are listed separately from the natural element.
     */
    static auto from_elements(formula::Elements const &elements, int charge, bool isotopic) -> Composition;

    /**
     * @brief Number of items.
     */
    auto size() const noexcept -> std::size_t { return m_items.size(); }

    /**
     * @brief Test if there are no items.
     */
    auto empty() const noexcept -> bool { return m_items.empty(); }

    /**
     * @brief Iterator to the first item.
     */
    auto begin() const noexcept { return m_items.begin(); }

    /**
     * @brief Iterator past the last item.
     */
    auto end() const noexcept { return m_items.end(); }

    /**
     * @brief Find an item by symbol, returns ``nullptr`` if not present.
     */
    auto find(std::string_view symbol) const -> CompositionItem const *;

    /**
     * @brief Fetch an item by symbol, throws if not present.
     */
    auto at(std::string_view symbol) const -> CompositionItem const &;

    /**
     * @brief Sums of the counts, masses and fractions with the symbol ``Total:``.
     */
    auto total() const -> CompositionItem;

    /**
     * @brief Render as a table, empty compositions render as the empty string.
     */
    auto to_string() const -> std::string;

  private:
    std::vector<CompositionItem> m_items;
  };

}  // namespace mol::mass
