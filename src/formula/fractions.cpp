// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/fractions.hpp"

#include <fmt/core.h>

#include <Eigen/Core>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "libmol/data/elements.hpp"
#include "libmol/formula/error.hpp"
#include "libmol/utility/core.hpp"

namespace mol::formula {

  namespace {

    auto is_upper(char c) -> bool { return std::isupper(static_cast<unsigned char>(c)) != 0; }

    auto is_digit(char c) -> bool { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

    auto split(std::string_view text, char delim) -> std::vector<std::string_view> {
      std::vector<std::string_view> parts;
      while (true) {
        std::size_t k = text.find(delim);
        parts.push_back(text.substr(0, k));
        if (k == std::string_view::npos) {
          return parts;
        }
        text.remove_prefix(k + 1);
      }
    }

    auto trim(std::string_view text) -> std::string_view {
      while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
      }
      while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
      }
      return text;
    }

    struct Term {
      std::string symbol;  // As rendered in the formula.
      double mass;
    };

    auto resolve(std::string_view key) -> Term {
      //
      std::string symbol = key == "D" ? "2H" : std::string(key);

      if (is_upper(symbol.front())) {
        if (data::Element const* elem = data::elements().find(symbol); elem && elem->symbol == symbol) {
          return {symbol, elem->mass};
        }
        throw formula_error(key, -1, "unknown element '{}'", symbol);
      }

      std::string_view iso = symbol;

      if (iso.front() == '[' && iso.back() == ']' && iso.size() > 2) {
        iso = iso.substr(1, iso.size() - 2);
      }

      std::size_t i = 0;

      while (i < iso.size() && is_digit(iso[i])) {
        ++i;
      }

      if (i == 0 || i > 6) {
        throw formula_error(key, -1, "unknown isotope '{}'", key);
      }

      int massnumber = std::stoi(std::string(iso.substr(0, i)));
      std::string_view sym = iso.substr(i);

      if (data::Element const* elem = data::elements().find(sym)) {
        if (auto it = elem->isotopes.find(massnumber); it != elem->isotopes.end() && sym == elem->symbol) {
          return {fmt::format("[{}{}]", massnumber, sym), it->second.mass};
        }
      }

      throw formula_error(key, -1, "unknown isotope '[{}{}]'", massnumber, sym);
    }

  }  // namespace

  auto parse_fractions(std::string_view text) -> Fractions {
    //
    Fractions fractions;

    for (std::string_view item : split(text, ',')) {
      //
      std::vector<std::string_view> parts = split(item, ':');

      if (parts.size() < 2) {
        throw formula_error(text, -1, "invalid list of mass fractions");
      }

      std::string_view key = trim(parts[0]);
      std::string value{trim(parts[1])};

      char* end = nullptr;
      double fraction = std::strtod(value.c_str(), &end);

      if (key.empty() || value.empty() || end != value.c_str() + value.size()) {
        throw formula_error(text, -1, "invalid list of mass fractions");
      }

      fractions[std::string(key)] = fraction;
    }

    return fractions;
  }

  auto from_fractions(Fractions const& fractions, int maxcount, double precision) -> std::string {
    //
    if (fractions.empty()) {
      return "";
    }

    std::map<std::string, Eigen::Index> slots;
    std::vector<double> mass;
    std::vector<double> frac;

    for (auto const& [key, fraction] : fractions) {
      //
      if (!(fraction > 0)) {
        throw formula_error(key, -1, "mass fraction of '{}' must be positive", key);
      }

      Term term = resolve(key);

      if (auto it = slots.find(term.symbol); it != slots.end()) {
        frac[static_cast<std::size_t>(it->second)] = fraction;
      } else {
        slots.emplace(term.symbol, ssize(mass));
        mass.push_back(term.mass);
        frac.push_back(fraction);
      }
    }

    Eigen::Index const n = ssize(mass);

    Eigen::ArrayXd numbers = Eigen::Map<Eigen::ArrayXd const>(frac.data(), n);

    numbers /= numbers.sum() * Eigen::Map<Eigen::ArrayXd const>(mass.data(), n);

    numbers /= numbers.minCoeff();

    // Find the smallest factor that turns all numbers into integers.
    precision *= static_cast<double>(n);

    double best = 1e6;
    int factor = 1;

    for (int i = 1; i < maxcount; i++) {
      //
      Eigen::ArrayXd scaled = numbers * static_cast<double>(i);

      double err = (scaled - scaled.round()).abs().sum();

      if (err < best) {
        best = err;
        factor = i;
        if (best < i * precision) {
          break;
        }
      }
    }

    std::string formula;

    for (auto const& [symbol, k] : slots) {
      //
      auto count = static_cast<long>(std::lround(factor * numbers[k]));

      if (count > 1) {
        formula += fmt::format("{}{}", symbol, count);
      } else {
        formula += symbol;
      }
    }

    return formula;
  }

}  // namespace mol::formula
