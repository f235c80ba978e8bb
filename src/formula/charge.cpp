// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/charge.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include "libmol/formula/error.hpp"
#include "libmol/utility/core.hpp"

namespace mol::formula {

  namespace {

    auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

    auto is_sign(char c) -> bool { return c == '+' || c == '-'; }

    auto sign_of(char c) -> int { return c == '+' ? 1 : -1; }

    // Magnitude of the charge written in text[pos, end).
    auto to_int(std::string_view text, std::size_t pos, std::size_t end) -> int {
      int value = 0;
      for (char c : text.substr(pos, end - pos)) {
        value = value * 10 + (c - '0');
        if (value >= 1'000'000) {
          throw formula_error(text, safe_cast<int>(pos), "charge '{}' is too large", text.substr(pos, end - pos));
        }
      }
      return value;
    }

    // True if the bracket opening at text[0] closes at the last character.
    auto enclosed(std::string_view text) -> bool {
      //
      if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
        return false;
      }

      int level = 0;

      for (std::size_t i = 0; i < text.size(); i++) {
        switch (text[i]) {
          case '(':
          case '[':
          case '{':
          case '<':
            ++level;
            break;
          case ')':
          case ']':
          case '}':
          case '>':
            if (--level == 0) {
              return i + 1 == text.size();
            }
            break;
          default:
            break;
        }
      }

      return false;
    }

  }  // namespace

  auto split_charge(std::string_view text) -> std::pair<std::string, int> {
    //
    std::size_t const n = text.size();

    std::size_t j = n;

    while (j > 0 && is_sign(text[j - 1])) {
      --j;
    }

    std::string_view body = text;
    int charge = 0;
    bool matched = false;

    if (j < n) {
      // Trailing run of signs, possibly preceded by a magnitude.
      std::size_t k = j;

      while (k > 0 && is_digit(text[k - 1])) {
        --k;
      }

      if (n - j == 1 && k < j && k > 0 && (text[k - 1] == '_' || text[k - 1] == ']')) {
        charge = sign_of(text[j]) * to_int(text, k, j);
        body = text.substr(0, text[k - 1] == '_' ? k - 1 : k);
      } else {
        for (char c : text.substr(j)) {
          charge += sign_of(c);
        }
        body = text.substr(0, j);

        if (!body.empty() && body.back() == '_') {
          body.remove_suffix(1);
        }
      }

      matched = true;
    } else {
      // Sign followed by a magnitude.
      std::size_t k = n;

      while (k > 0 && is_digit(text[k - 1])) {
        --k;
      }

      if (k < n && k > 0 && is_sign(text[k - 1])) {
        charge = sign_of(text[k - 1]) * to_int(text, k, n);
        body = text.substr(0, k - 1);
        matched = true;
      }
    }

    if (matched && enclosed(body)) {
      body = body.substr(1, body.size() - 2);
    }

    return {std::string(body), charge};
  }

  auto format_charge(int charge, std::string_view prefix) -> std::string {
    switch (charge) {
      case 0:
        return "0";
      case 1:
        return "+";
      case -1:
        return "-";
      default:
        return fmt::format("{}{}{}", prefix, std::abs(charge), charge > 0 ? '+' : '-');
    }
  }

  auto join_charge(std::string_view formula, int charge, std::string_view separator) -> std::string {
    if (charge == 0) {
      return std::string(formula);
    }
    if (separator.empty()) {
      return fmt::format("[{}]{}", formula, format_charge(charge));
    }
    return fmt::format("{}{}", formula, format_charge(charge, separator));
  }

  auto mass_charge_ratio(double mass, int charge) -> double {
    if (charge == 0) {
      return mass;
    }
    return mass / std::abs(charge);
  }

}  // namespace mol::formula
