#pragma once

// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "libmol/data/elements.hpp"
#include "libmol/formula/normalize.hpp"
#include "libmol/formula/parse.hpp"
#include "libmol/mass/composition.hpp"
#include "libmol/mass/spectrum.hpp"

/**
 * \file formula.hpp
 *
 * @brief Chemical formulas and their derived masses.
 */

namespace mol::formula {

  /**
   * @brief A chemical formula, parsed once and queried for masses, composition and mass distribution.
   *
   * \rst
   *
   * Example:
   *
   * .. code::
   *
   *     mol::formula::Formula f{"CuSO4.5H2O"};
   *
   *     f.formula();    // "CuSO4(H2O)5"
   *     f.empirical();  // "CuH10O9S"
   *     f.mass();       // 249.68485
   *
   * Derived results are computed on first use and cached, a Formula is therefore not safe to query concurrently
   * until it has been queried once.
   *
   * \endrst
   */
  class Formula {
  public:
    /**
     * @brief Used to configure parsing.
     */
    struct Options {
      /** @brief Accept the empty formula. */
      bool allow_empty = false;
      /** @brief Options forwarded to the Normalizer. */
      Normalizer::Options normalize = {};
    };

    /**
     * @brief Parse ``text`` with the default options, throws FormulaError if malformed.
     */
    explicit Formula(std::string_view text);

    /**
     * @brief Parse ``text``, throws FormulaError if malformed.
     */
    Formula(std::string_view text, Options const &opt);

    /**
     * @brief The normalized formula, e.g. ``CuSO4(H2O)5``.
     */
    auto formula() const noexcept -> std::string const & { return m_formula; }

    /**
     * @brief Formula in Hill notation including the charge.
     */
    auto hill() const -> std::string const &;

    /**
     * @brief Hill notation with all counts and the charge divided by gcd().
     */
    auto empirical() const -> std::string const &;

    /**
     * @brief Number of atoms of each element and isotope.
     */
    auto elements() const noexcept -> Elements const & { return m_elements; }

    /**
     * @brief Net charge.
     */
    auto charge() const noexcept -> int { return m_charge; }

    /**
     * @brief Number of atoms.
     */
    auto atoms() const -> Count;

    /**
     * @brief Greatest common divisor of the counts and the charge.
     */
    auto gcd() const -> Count;

    /**
     * @brief Average relative mass, corrected for the electrons of the charge.
     */
    auto mass() const -> double;

    /**
     * @brief Mass to charge ratio, equal to mass() if not charged.
     */
    auto mz() const -> double;

    /**
     * @brief Isotopic composition of the most abundant isotopes.
     */
    auto isotope() const -> data::Isotope const &;

    /**
     * @brief Mass of isotope().
     */
    auto monoisotopic_mass() const -> double { return isotope().mass; }

    /**
     * @brief Mass number of isotope().
     */
    auto nominal_mass() const -> Count { return isotope().massnumber; }

    /**
     * @brief Elemental composition, if ``isotopic`` explicit isotopes are listed separately.
     */
    auto composition(bool isotopic = true) const -> mass::Composition const &;

    /**
     * @brief Mass distribution, cached for the most recent options.
     */
    auto spectrum(mass::Spectrum::Options const &opt = {}) const -> mass::Spectrum const &;

    /**
     * @brief ``n`` copies of ``f``, e.g. ``HO- * 2`` is ``[(HO)2]2-``.
     */
    friend auto operator*(Formula const &f, int n) -> Formula;

    /**
     * @brief ``n`` copies of ``f``.
     */
    friend auto operator*(int n, Formula const &f) -> Formula { return f * n; }

    /**
     * @brief Concatenate two formulas, e.g. ``H2O + HO-`` is ``[(H2O)(HO)]-``.
     */
    friend auto operator+(Formula const &a, Formula const &b) -> Formula;

    /**
     * @brief Remove the atoms of ``b`` from ``a``, throws if ``a`` does not contain them.
     */
    friend auto operator-(Formula const &a, Formula const &b) -> Formula;

    /**
     * @brief Formulas are equal if they have the same atoms and charge.
     */
    friend auto operator==(Formula const &a, Formula const &b) -> bool {
      return a.m_charge == b.m_charge && a.m_elements == b.m_elements;
    }

    /**
     * @brief Negation of operator==.
     */
    friend auto operator!=(Formula const &a, Formula const &b) -> bool { return !(a == b); }

  private:
    struct canonical_t {};

    // Parse an already normalized formula, the empty formula is allowed.
    Formula(canonical_t, std::string formula);

    std::string m_formula;
    Elements m_elements;
    int m_charge = 0;

    mutable std::optional<std::string> m_hill;
    mutable std::optional<std::string> m_empirical;
    mutable std::optional<data::Isotope> m_isotope;
    mutable std::optional<mass::Composition> m_composition[2];
    mutable std::optional<std::pair<mass::Spectrum::Options, mass::Spectrum>> m_spectrum;

    auto body() const -> std::string;
  };

}  // namespace mol::formula
