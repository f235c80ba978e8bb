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
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "libmol/utility/core.hpp"

/**
 * \file elements.hpp
 *
 * @brief Properties of the chemical elements, their isotopes and some elementary particles.
 *
 * \rst
 *
 * Masses are relative atomic masses, i.e. the ratio of the average mass of atoms of the element to 1/12 of the mass
 * of an atom of :sup:`12`\ C. Isotopic compositions and masses are from NIST's "Atomic Weights and Isotopic
 * Compositions".
 *
 * \endrst
 */

namespace mol::data {

  /**
   * @brief Elementary charge in coulomb.
   */
  inline constexpr double elementary_charge = 1.602176634e-19;

  /**
   * @brief An elementary particle.
   */
  struct Particle {
    std::string_view name;  ///< Name in English.
    double mass;            ///< Relative mass.
    double charge;          ///< Electric charge in coulomb.
  };

  inline constexpr Particle electron{"Electron", 5.48579909065e-4, -elementary_charge};  ///< The electron.
  inline constexpr Particle proton{"Proton", 1.007276466621, elementary_charge};         ///< The proton.
  inline constexpr Particle neutron{"Neutron", 1.00866491595, 0.0};                      ///< The neutron.
  inline constexpr Particle positron{"Positron", 5.48579909065e-4, elementary_charge};   ///< The positron.

  /**
   * @brief A single isotope (or the isotopic sum of a formula).
   */
  struct Isotope {
    double mass = 0.0;            ///< Relative atomic mass.
    double abundance = 1.0;       ///< Natural abundance as a fraction in [0, 1].
    std::int64_t massnumber = 0;  ///< Sum of protons and neutrons.
    int charge = 0;               ///< Net charge, non-zero only for isotopic sums of ions.
  };

  /**
   * @brief Electron configuration, mapping (shell, subshell) to number of electrons.
   */
  using ElectronConfig = std::map<std::pair<int, char>, int>;

  /**
   * @brief A chemical element and its isotopes.
   */
  struct Element {
    int number;                      ///< Atomic number.
    std::string symbol;              ///< Chemical symbol, one or two letters.
    std::string name;                ///< Name in English.
    int group;                       ///< Group in the periodic table.
    int period;                      ///< Period in the periodic table.
    char block;                      ///< Block in the periodic table.
    int series;                      ///< Index into ``series_names()``.
    double mass;                     ///< Standard atomic weight.
    double eleneg;                   ///< Electronegativity (Pauling scale).
    double eleaffin;                 ///< Electron affinity in eV.
    double covrad;                   ///< Covalent radius in Angstrom.
    double atmrad;                   ///< Atomic radius in Angstrom.
    double vdwrad;                   ///< Van der Waals radius in Angstrom.
    double tboil;                    ///< Boiling temperature in K.
    double tmelt;                    ///< Melting temperature in K.
    double density;                  ///< Density at 295K in g/cm3 respectively g/L.
    std::string eleconfig;           ///< Ground state electron configuration.
    std::string oxistates;           ///< Oxidation states.
    std::vector<double> ionenergy;   ///< Ionization energies in eV.
    std::map<int, Isotope> isotopes;  ///< Isotopes keyed by mass number.
    int nominalmass = 0;             ///< Mass number of the most abundant natural isotope, set by the ElementTable.

    /**
     * @brief Number of protons, equal to the atomic number.
     */
    auto protons() const noexcept -> int { return number; }

    /**
     * @brief Number of electrons of the neutral atom.
     */
    auto electrons() const noexcept -> int { return number; }

    /**
     * @brief Number of neutrons in the most abundant natural isotope.
     */
    auto neutrons() const noexcept -> int { return nominalmass - number; }

    /**
     * @brief Relative atomic mass calculated from the isotopic composition.
     */
    auto exact_mass() const -> double;

    /**
     * @brief The most abundant natural isotope.
     */
    auto most_abundant() const -> Isotope const &;

    /**
     * @brief Fetch the isotope with mass number ``massnumber`` or throw if it is not known.
     */
    auto isotope(int massnumber) const -> Isotope const &;

    /**
     * @brief Expand the electron configuration, including the noble gas core.
     */
    auto eleconfig_dict() const -> ElectronConfig;

    /**
     * @brief Number of electrons in each occupied shell, innermost first.
     */
    auto eleshells() const -> std::vector<int>;

    /**
     * @brief Check the consistency of the element's data, throws mol::RuntimeError on failure.
     */
    auto validate() const -> void;
  };

  /**
   * @brief Names of the element series, indexed by ``Element::series``.
   */
  auto series_names() -> std::vector<std::string_view> const &;

  /**
   * @brief An immutable registry of the elements with lookup by number, symbol and name.
   *
   * Iteration is in order of atomic number.
   */
  class ElementTable {
  public:
    /**
     * @brief Construct a new ElementTable, elements must be supplied in order of atomic number.
     */
    explicit ElementTable(std::vector<Element> elements);

    /**
     * @brief Test if ``key`` is the symbol or name of an element.
     */
    auto contains(std::string_view key) const -> bool { return find(key) != nullptr; }

    /**
     * @brief Find an element by symbol or name, returns ``nullptr`` if not found.
     */
    auto find(std::string_view key) const -> Element const *;

    /**
     * @brief Fetch an element by symbol or name, throws if not found.
     */
    auto operator[](std::string_view key) const -> Element const &;

    /**
     * @brief Fetch an element by atomic number, throws if not found.
     */
    auto operator[](int number) const -> Element const &;

    /**
     * @brief Number of elements in the table.
     */
    auto size() const noexcept -> std::size_t { return m_elements.size(); }

    /**
     * @brief Iterator to the first element (Hydrogen).
     */
    auto begin() const noexcept { return m_elements.begin(); }

    /**
     * @brief Iterator past the last element.
     */
    auto end() const noexcept { return m_elements.end(); }

  private:
    std::vector<Element> m_elements;
    std::map<std::string, std::size_t, std::less<>> m_index;
  };

  /**
   * @brief The process wide table of elements, built on first use.
   */
  auto elements() -> ElementTable const &;

}  // namespace mol::data
