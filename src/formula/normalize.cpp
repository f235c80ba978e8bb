// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/normalize.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "libmol/formula/charge.hpp"
#include "libmol/formula/error.hpp"
#include "libmol/formula/fractions.hpp"
#include "libmol/formula/groups.hpp"
#include "libmol/formula/sequence.hpp"
#include "libmol/utility/core.hpp"

namespace mol::formula {

  namespace {

    auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

    auto is_lower(char c) -> bool { return c >= 'a' && c <= 'z'; }

    auto is_upper(char c) -> bool { return c >= 'A' && c <= 'Z'; }

    auto is_opening(char c) -> bool { return c == '(' || c == '[' || c == '{' || c == '<'; }

    auto contains(std::string_view text, char c) -> bool { return text.find(c) != std::string_view::npos; }

    // True if every character of text is in alphabet and at least one is in required.
    auto is_sequence(std::string_view text, std::string_view alphabet, std::string_view required) -> bool {
      //
      bool found = false;

      for (char c : text) {
        if (!contains(alphabet, c)) {
          return false;
        }
        found = found || contains(required, c);
      }

      return found;
    }

    auto is_peptide(std::string_view text) -> bool {
      //
      std::string alphabet;

      for (auto const& [code, formula] : amino_acids()) {
        alphabet.push_back(code);
      }

      return is_sequence(text, alphabet, "AEGMLQRT");
    }

    auto expand_calls(std::string formula) -> std::string {
      //
      constexpr std::string_view calls[] = {"peptide", "ssdna", "dsdna", "ssrna", "dsrna"};

      for (std::string_view name : calls) {
        //
        std::string const open = fmt::format("{}(", name);

        std::size_t pos = 0;

        while ((pos = formula.find(open, pos)) != std::string::npos) {
          //
          std::size_t close = formula.find(')', pos + open.size());

          if (close == std::string::npos) {
            break;
          }

          std::string_view arg = std::string_view(formula).substr(pos + open.size(), close - pos - open.size());

          std::string expanded = name == "peptide" ? from_peptide(arg) : from_oligo(arg, parse_oligo(name));

          formula.replace(pos, close + 1 - pos, expanded);

          pos += expanded.size();
        }
      }

      return formula;
    }

    auto expand_deuterium(std::string_view formula) -> std::string {
      //
      std::string out;

      for (std::size_t i = 0; i < formula.size(); i++) {
        if (formula[i] == 'D' && (i + 1 == formula.size() || !is_lower(formula[i + 1]))) {
          out += "[2H]";
        } else {
          out.push_back(formula[i]);
        }
      }

      return out;
    }

  }  // namespace

  auto Normalizer::expand_groups(std::string formula) const -> std::string {
    //
    Groups const& groups = m_opt.groups ? *m_opt.groups : default_groups();

    // Descending order replaces "Valohp" before "Valoh" before "Val".
    for (auto it = groups.rbegin(); it != groups.rend(); ++it) {
      //
      auto const& [key, value] = *it;

      if (key.empty()) {
        continue;
      }

      std::string const replacement = fmt::format("({})", value);

      std::size_t pos = 0;

      while ((pos = formula.find(key, pos)) != std::string::npos) {
        formula.replace(pos, key.size(), replacement);
        pos += replacement.size();
      }
    }

    return formula;
  }

  auto Normalizer::classify(std::string_view formula) const -> InputKind {
    //
    if (m_opt.parse_fractions && contains(formula, ':') && contains(formula, ',')) {
      return InputKind::fractions;
    }

    if (!m_opt.parse_oligos || formula.size() < 2) {
      return InputKind::plain;
    }

    std::string const body = split_charge(formula).first;

    if (is_sequence(body, "ATCG", "ATG")) {
      return InputKind::dna;
    }
    if (is_sequence(body, "AUCG", "AG")) {
      return InputKind::rna;
    }
    if (is_peptide(body)) {
      return InputKind::peptide;
    }

    return InputKind::plain;
  }

  auto Normalizer::expand_arithmetic(std::string const& input) const -> std::string {
    //
    std::string formula = input;

    std::replace(formula.begin(), formula.end(), '.', '+');

    if (!contains(formula, '+') && !contains(formula, '*')) {
      return formula;
    }

    std::string out;

    std::size_t offset = 0;

    for (std::size_t n = 0; offset <= formula.size(); n++) {
      //
      std::size_t end = std::min(formula.find('+', offset), formula.size());

      std::string_view segment = std::string_view(formula).substr(offset, end - offset);

      if (segment.empty()) {
        throw formula_error(formula, safe_cast<int>(offset == 0 ? 0 : offset - 1), "unexpected character '+'");
      }

      std::size_t k = 0;

      while (k < segment.size() && is_digit(segment[k])) {
        ++k;
      }

      std::string_view rest = segment.substr(k);

      if (k > 0 && !rest.empty() && rest.front() == '*') {
        rest.remove_prefix(1);
      }

      if (std::size_t star = rest.find('*'); star != std::string_view::npos) {
        std::size_t pos = offset + segment.size() - rest.size() + star;
        throw formula_error(formula, safe_cast<int>(pos), "unexpected character '*'");
      }

      if (k > 0) {
        out += fmt::format("({}){}", rest, segment.substr(0, k));
      } else if (n > 0 && !is_upper(segment.front()) && !is_opening(segment.front())) {
        throw formula_error(formula, safe_cast<int>(offset), "unexpected character '{}'", segment.front());
      } else {
        out += segment;
      }

      offset = end + 1;
    }

    return out;
  }

  auto Normalizer::operator()(std::string_view input) const -> std::string {
    //
    std::string formula;

    for (char c : input) {
      if (!std::isspace(static_cast<unsigned char>(c))) {
        formula.push_back(c);
      }
    }

    if (m_opt.parse_groups) {
      formula = expand_groups(std::move(formula));
    }

    switch (classify(formula)) {
      case InputKind::fractions:
        return from_fractions(parse_fractions(formula));
      case InputKind::dna:
        return from_oligo(formula, Oligo::ssdna);
      case InputKind::rna:
        return from_oligo(formula, Oligo::ssrna);
      case InputKind::peptide:
        return from_peptide(formula);
      case InputKind::plain:
        break;
    }

    if (m_opt.parse_oligos && formula.size() > 1) {
      formula = expand_calls(std::move(formula));
    }

    auto [body, charge] = split_charge(expand_deuterium(formula));

    if (m_opt.parse_arithmetic) {
      body = expand_arithmetic(body);
    }

    if (std::size_t k = body.find('-'); k != std::string::npos) {
      throw formula_error(body, safe_cast<int>(k), "subtraction not allowed");
    }

    return join_charge(body, charge);
  }

  auto normalize(std::string_view input, Normalizer::Options const& opt) -> std::string { return Normalizer{opt}(input); }

}  // namespace mol::formula
