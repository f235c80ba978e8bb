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
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "libmol/formula/parse.hpp"

/**
 * \file spectrum.hpp
 *
 * @brief Isotopic mass distribution of a formula.
 */

namespace mol::mass {

  /**
   * @brief One bin of a mass spectrum, all isotopologues with the same mass number.
   */
  struct SpectrumEntry {
    int massnumber = 0;      ///< Mass number of the bin.
    double mass = 0.0;       ///< Abundance weighted mean mass of the isotopologues.
    double fraction = 0.0;   ///< Sum of the abundances of the isotopologues.
    double intensity = 0.0;  ///< Fraction relative to the most abundant bin, in percent.
    double mz = 0.0;         ///< Mass to charge ratio.
  };

  /**
   * @brief Mass distribution of a formula, bins are in ascending order of mass number.
   *
   * \rst
   *
   * Computed by convolving the bins one atom at a time with the natural isotope distribution of each element:
   *
   * .. math::
   *
   *    f'_{k + A} = \sum f_k \, a_A
   *
   * where :math:`a_A` is the abundance of the isotope with mass number :math:`A`. Masses merged into a bin are
   * averaged weighted by their fraction. Explicit isotopes shift every bin without broadening the distribution.
   *
   * \endrst
   */
  class Spectrum {
  public:
    /**
     * @brief Used to configure the spectrum calculation.
     */
    struct Options {
      /** @brief Bins with a smaller fraction are dropped before each convolution step. */
      double min_fraction = 1e-9;
      /** @brief If set, bins with a smaller intensity (in percent) are dropped from the result. */
      std::optional<double> min_intensity = std::nullopt;
    };

    /**
     * @brief Construct an empty Spectrum.
     */
    Spectrum() = default;

    /**
     * @brief Compute the spectrum of a formula.
     *
     * Throws if a mass number of the distribution does not fit in an ``int``.
     *
     * @param elements Element counts of the formula.
     * @param charge Net charge, shifts masses by the mass of the electrons and divides the m/z.
     * @param opt Calculation options.
     */
    Spectrum(formula::Elements const &elements, int charge, Options const &opt);

    /**
     * @brief Number of bins.
     */
    auto size() const noexcept -> std::size_t { return m_entries.size(); }

    /**
     * @brief Test if there are no bins.
     */
    auto empty() const noexcept -> bool { return m_entries.empty(); }

    /**
     * @brief Iterator to the lightest bin.
     */
    auto begin() const noexcept { return m_entries.begin(); }

    /**
     * @brief Iterator past the heaviest bin.
     */
    auto end() const noexcept { return m_entries.end(); }

    /**
     * @brief Find the bin with mass number ``massnumber``, returns ``nullptr`` if there is none.
     */
    auto find(int massnumber) const -> SpectrumEntry const *;

    /**
     * @brief Fetch the bin with mass number ``massnumber``, throws if there is none.
     */
    auto at(int massnumber) const -> SpectrumEntry const &;

    /**
     * @brief The most abundant bin, the lightest if several are equally abundant.
     */
    auto peak() const -> SpectrumEntry const &;

    /**
     * @brief Mean mass of the retained bins weighted by their fraction, zero if empty.
     */
    auto mean() const -> double;

    /**
     * @brief Smallest and largest mass number.
     */
    auto range() const -> std::pair<int, int>;

    /**
     * @brief Net charge.
     */
    auto charge() const noexcept -> int { return m_charge; }

    /**
     * @brief Render as a table, with an m/z column if charged.
     */
    auto to_string() const -> std::string;

  private:
    std::vector<SpectrumEntry> m_entries;
    int m_charge = 0;
  };

}  // namespace mol::mass
