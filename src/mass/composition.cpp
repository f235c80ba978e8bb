// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/mass/composition.hpp"

#include <fmt/core.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "libmol/data/elements.hpp"
#include "libmol/formula/parse.hpp"
#include "libmol/mass/mass.hpp"
#include "libmol/utility/core.hpp"

namespace mol::mass {

  auto Composition::from_elements(formula::Elements const &elements, int charge, bool isotopic) -> Composition {
    //
    std::vector<std::string> symbols;

    for (auto const &[symbol, isotopes] : elements) {
      symbols.push_back(symbol);
    }

    std::vector<CompositionItem> items;

    for (std::string const &symbol : formula::hill_order(std::move(symbols))) {
      //
      data::Element const &ele = data::elements()[symbol];

      CompositionItem merged{symbol};

      for (auto const &[massnumber, count] : elements.find(symbol)->second) {
        //
        double mass = static_cast<double>(count) * (massnumber == 0 ? ele.mass : ele.isotope(massnumber).mass);

        if (isotopic) {
          items.push_back({massnumber == 0 ? symbol : fmt::format("{}{}", massnumber, symbol), count, mass});
        } else {
          merged.count += count;
          merged.mass += mass;
        }
      }

      if (!isotopic) {
        items.push_back(std::move(merged));
      }
    }

    if (charge != 0) {
      items.push_back({"e-", -charge, -charge * data::electron.mass});
    }

    double total = average_mass(elements, charge);

    for (CompositionItem &item : items) {
      item.fraction = item.mass / total;
    }

    return Composition{std::move(items)};
  }

  auto Composition::find(std::string_view symbol) const -> CompositionItem const * {
    for (CompositionItem const &item : m_items) {
      if (item.symbol == symbol) {
        return &item;
      }
    }
    return nullptr;
  }

  auto Composition::at(std::string_view symbol) const -> CompositionItem const & {
    if (CompositionItem const *item = find(symbol)) {
      return *item;
    }
    throw error("No '{}' in composition", symbol);
  }

  auto Composition::total() const -> CompositionItem {
    //
    CompositionItem sum{"Total:"};

    for (CompositionItem const &item : m_items) {
      sum.count += item.count;
      sum.mass += item.mass;
      sum.fraction += item.fraction;
    }

    return sum;
  }

  auto Composition::to_string() const -> std::string {
    //
    if (m_items.empty()) {
      return "";
    }

    CompositionItem sum = total();

    int prec = precision_digits(sum.mass, 9);

    std::string table = "Element  Count  Relative mass  Fraction %";

    auto row = [&](CompositionItem const &item) {
      table += fmt::format("\n{:<7}  {:>5}  {:>13.{}f}  {:>10.4f}", item.symbol, item.count, item.mass, prec, item.fraction * 100);
    };

    for (CompositionItem const &item : m_items) {
      row(item);
    }

    if (m_items.size() > 1) {
      row(sum);
    }

    return table;
  }

}  // namespace mol::mass
