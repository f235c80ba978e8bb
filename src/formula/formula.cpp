// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/formula.hpp"

#include <fmt/core.h>

#include <cmath>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "libmol/data/elements.hpp"
#include "libmol/formula/charge.hpp"
#include "libmol/formula/normalize.hpp"
#include "libmol/formula/parse.hpp"
#include "libmol/mass/composition.hpp"
#include "libmol/mass/mass.hpp"
#include "libmol/mass/spectrum.hpp"
#include "libmol/utility/core.hpp"

namespace mol::formula {

  Formula::Formula(std::string_view text) : Formula(text, Options{}) {}

  Formula::Formula(std::string_view text, Options const &opt) : m_formula(Normalizer{opt.normalize}(text)) {
    //
    auto [bare, charge] = split_charge(m_formula);

    m_elements = parse(bare, opt.allow_empty);
    m_charge = charge;
  }

  Formula::Formula(canonical_t, std::string formula) : m_formula(std::move(formula)) {
    //
    auto [bare, charge] = split_charge(m_formula);

    m_elements = parse(bare, true);
    m_charge = charge;
  }

  auto Formula::body() const -> std::string { return split_charge(m_formula).first; }

  auto Formula::hill() const -> std::string const & {
    if (!m_hill) {
      m_hill = from_elements(m_elements, 1, m_charge);
    }
    return *m_hill;
  }

  auto Formula::empirical() const -> std::string const & {
    if (!m_empirical) {
      m_empirical = from_elements(m_elements, gcd(), m_charge);
    }
    return *m_empirical;
  }

  auto Formula::atoms() const -> Count { return mass::count_atoms(m_elements); }

  auto Formula::gcd() const -> Count {
    //
    std::vector<Count> counts;

    for (auto const &[symbol, isotopes] : m_elements) {
      for (auto const &[massnumber, count] : isotopes) {
        counts.push_back(count);
      }
    }

    if (m_charge != 0) {
      counts.push_back(std::abs(m_charge));
    }

    return mol::gcd(counts);
  }

  auto Formula::mass() const -> double { return mass::average_mass(m_elements, m_charge); }

  auto Formula::mz() const -> double { return mass_charge_ratio(mass(), m_charge); }

  auto Formula::isotope() const -> data::Isotope const & {
    if (!m_isotope) {
      m_isotope = mass::monoisotopic(m_elements, m_charge);
    }
    return *m_isotope;
  }

  auto Formula::composition(bool isotopic) const -> mass::Composition const & {
    //
    std::optional<mass::Composition> &cache = m_composition[isotopic ? 1 : 0];

    if (!cache) {
      cache = mass::Composition::from_elements(m_elements, m_charge, isotopic);
    }

    return *cache;
  }

  auto Formula::spectrum(mass::Spectrum::Options const &opt) const -> mass::Spectrum const & {
    //
    auto same = [&opt](mass::Spectrum::Options const &old) {
      return old.min_fraction == opt.min_fraction && old.min_intensity == opt.min_intensity;
    };

    if (!m_spectrum || !same(m_spectrum->first)) {
      m_spectrum.emplace(opt, mass::Spectrum{m_elements, m_charge, opt});
    }

    return m_spectrum->second;
  }

  auto operator*(Formula const &f, int n) -> Formula {
    //
    verify(n > 0, "Can only multiply a formula by a positive integer, got {}", n);

    return Formula{Formula::canonical_t{}, join_charge(fmt::format("({}){}", f.body(), n), f.m_charge * n)};
  }

  auto operator+(Formula const &a, Formula const &b) -> Formula {
    return Formula{Formula::canonical_t{}, join_charge(fmt::format("({})({})", a.body(), b.body()), a.m_charge + b.m_charge)};
  }

  auto operator-(Formula const &a, Formula const &b) -> Formula {
    //
    Elements result = a.m_elements;

    for (auto const &[symbol, isotopes] : b.m_elements) {
      //
      auto it = result.find(symbol);

      verify(it != result.end(), "Cannot subtract {} from {}, it contains no {}", b.m_formula, a.m_formula, symbol);

      for (auto const &[massnumber, count] : isotopes) {
        //
        auto iso = it->second.find(massnumber);

        verify(iso != it->second.end(), "Cannot subtract {} from {}, missing isotope {} of {}", b.m_formula, a.m_formula,
               massnumber, symbol);

        verify(iso->second >= count, "Cannot subtract {} from {}, negative count of {}", b.m_formula, a.m_formula, symbol);

        if ((iso->second -= count) == 0) {
          it->second.erase(iso);
        }
      }

      if (it->second.empty()) {
        result.erase(it);
      }
    }

    return Formula{Formula::canonical_t{}, from_elements(result, 1, a.m_charge - b.m_charge)};
  }

}  // namespace mol::formula
