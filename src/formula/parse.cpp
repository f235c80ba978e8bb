// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/parse.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "libmol/data/elements.hpp"
#include "libmol/formula/charge.hpp"
#include "libmol/formula/error.hpp"
#include "libmol/utility/core.hpp"

namespace mol::formula {

  namespace {

    constexpr std::string_view leading_chars = "([{<123456789ABCDEFGHIKLMNOPRSTUVWXYZ";

    constexpr std::string_view trailing_chars = "]})>0abcdefghiklmnoprstuy";

    auto is_opening(char c) -> bool { return c == '(' || c == '[' || c == '{' || c == '<'; }

    auto is_closing(char c) -> bool { return c == ')' || c == ']' || c == '}' || c == '>'; }

    auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

    auto is_lower(char c) -> bool { return c >= 'a' && c <= 'z'; }

    auto is_upper(char c) -> bool { return c >= 'A' && c <= 'Z'; }

    auto is_valid(char c) -> bool {
      return leading_chars.find(c) != std::string_view::npos || trailing_chars.find(c) != std::string_view::npos;
    }

    /**
     * @brief Right-to-left scanner over a formula.
     */
    class ReverseScanner {
    public:
      explicit ReverseScanner(std::string_view formula) : m_formula(formula), m_i(formula.size()) {}

      auto run() -> Elements {
        while (m_i > 0) {
          //
          char c = m_formula[--m_i];

          if (!is_valid(c)) {
            throw fail("unexpected character '{}'", c);
          } else if (is_opening(c)) {
            open();
          } else if (is_closing(c)) {
            close();
          } else if (is_digit(c)) {
            digits();
          } else if (is_lower(c)) {
            lower(c);
          } else {
            upper(c);
          }
        }

        if (m_num != 0) {
          throw formula_error(m_formula, 0, "number preceding formula");
        }

        if (m_counts.size() != 1) {
          throw formula_error(m_formula, 0, "missing opening parenthesis");
        }

        return std::move(m_elements);
      }

    private:
      std::string_view m_formula;
      std::size_t m_i;

      Count m_num = 0;                  // Pending numeric literal.
      std::string m_symbol;             // Lowercase letter of a two-letter symbol.
      std::vector<Count> m_counts{1};   // Cumulative multiplier of each nesting level.
      Elements m_elements;

      template <typename... Args>
      auto fail(fmt::format_string<Args...> fmt, Args&&... args) const -> FormulaError {
        return formula_error(m_formula, safe_cast<int>(m_i), fmt, std::forward<Args>(args)...);
      }

      // Read the run of digits ending at m_i, leaving m_i at its first digit.
      auto read_number() -> Count {
        //
        std::size_t end = m_i + 1;

        while (m_i > 0 && is_digit(m_formula[m_i - 1])) {
          --m_i;
        }

        if (end - m_i > 12) {
          throw fail("number too large");
        }

        Count value = 0;

        for (char d : m_formula.substr(m_i, end - m_i)) {
          value = value * 10 + (d - '0');
        }

        return value;
      }

      void open() {
        if (m_counts.size() == 1 || m_num != 0) {
          throw fail("missing closing parenthesis");
        }
        m_counts.pop_back();
      }

      void close() {
        m_counts.push_back((m_num == 0 ? 1 : m_num) * m_counts.back());
        m_num = 0;
      }

      void digits() {
        if ((m_num = read_number()) == 0) {
          throw fail("count is zero");
        }
      }

      void lower(char c) {
        if (m_i == 0 || !is_upper(m_formula[m_i - 1])) {
          throw fail("unexpected character '{}'", c);
        }
        m_symbol = c;
      }

      void upper(char c) {
        //
        std::string symbol = c + std::exchange(m_symbol, "");

        data::Element const* elem = data::elements().find(symbol);

        if (!elem || elem->symbol != symbol) {
          throw fail("unknown symbol '{}'", symbol);
        }

        int massnumber = 0;

        if (m_i > 0 && is_digit(m_formula[m_i - 1])) {
          //
          std::size_t const symbol_pos = m_i;

          --m_i;

          Count iso = read_number();

          if (m_i == 0 || is_opening(m_formula[m_i - 1])) {
            if (iso > std::numeric_limits<int>::max() || elem->isotopes.count(safe_cast<int>(iso)) == 0) {
              throw fail("unknown isotope '{}{}'", iso, symbol);
            }
            massnumber = safe_cast<int>(iso);
          } else {
            // The digits are the count of the preceding term.
            m_i = symbol_pos;
          }
        }

        m_elements[symbol][massnumber] += (m_num == 0 ? 1 : m_num) * m_counts.back();

        m_num = 0;
      }
    };

  }  // namespace

  auto parse(std::string_view formula, bool allow_empty) -> Elements {
    //
    if (formula.empty()) {
      if (allow_empty) {
        return {};
      }
      throw formula_error(formula, 0, "empty formula");
    }

    if (leading_chars.find(formula.front()) == std::string_view::npos) {
      throw formula_error(formula, 0, "unexpected character '{}'", formula.front());
    }

    Elements elements = ReverseScanner{formula}.run();

    if (elements.empty() && !allow_empty) {
      throw formula_error(formula, 0, "invalid formula");
    }

    return elements;
  }

  auto hill_order(std::vector<std::string> symbols) -> std::vector<std::string> {
    //
    std::sort(symbols.begin(), symbols.end());

    symbols.erase(std::unique(symbols.begin(), symbols.end()), symbols.end());

    auto carbon = std::find(symbols.begin(), symbols.end(), "C");

    if (carbon == symbols.end()) {
      return symbols;
    }

    std::rotate(symbols.begin(), carbon, carbon + 1);

    if (auto hydrogen = std::find(symbols.begin(), symbols.end(), "H"); hydrogen != symbols.end()) {
      std::rotate(symbols.begin() + 1, hydrogen, hydrogen + 1);
    }

    return symbols;
  }

  auto Notation::html() -> Notation {
    return {"{}", "{}<sub>{}</sub>", "<sup>{}</sup>{}", "<sup>{}</sup>{}<sub>{}</sub>"};
  }

  auto from_elements(Elements const& elements, Count divisor, int charge, Notation const& notation) -> std::string {
    //
    verify(divisor > 0, "Divisor must be positive, got {}", divisor);

    std::vector<std::string> symbols;

    for (auto const& [symbol, isotopes] : elements) {
      symbols.push_back(symbol);
    }

    std::string formula;

    for (std::string const& symbol : hill_order(std::move(symbols))) {
      for (auto const& [massnumber, total] : elements.find(symbol)->second) {
        //
        Count count = total / divisor;

        if (massnumber != 0) {
          if (count == 1) {
            formula += fmt::format(fmt::runtime(notation.isotope), massnumber, symbol);
          } else {
            formula += fmt::format(fmt::runtime(notation.isotope_count), massnumber, symbol, count);
          }
        } else {
          if (count == 1) {
            formula += fmt::format(fmt::runtime(notation.element), symbol);
          } else {
            formula += fmt::format(fmt::runtime(notation.element_count), symbol, count);
          }
        }
      }
    }

    return join_charge(formula, safe_cast<int>(charge / divisor));
  }

}  // namespace mol::formula
