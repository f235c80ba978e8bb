// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/sequence.hpp"

#include <fmt/core.h>

#include <cctype>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>

#include "libmol/formula/charge.hpp"
#include "libmol/formula/error.hpp"
#include "libmol/formula/groups.hpp"

namespace mol::formula {

  namespace {

    auto strip_whitespace(std::string_view text) -> std::string {
      std::string out;
      for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
          out.push_back(c);
        }
      }
      return out;
    }

  }  // namespace

  auto parse_oligo(std::string_view name) -> Oligo {
    //
    std::string lower;

    for (char c : name) {
      lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "ssdna") {
      return Oligo::ssdna;
    }
    if (lower == "dsdna") {
      return Oligo::dsdna;
    }
    if (lower == "ssrna") {
      return Oligo::ssrna;
    }
    if (lower == "dsrna") {
      return Oligo::dsrna;
    }

    throw formula_error(name, -1, "unknown oligo type '{}'", name);
  }

  auto from_sequence(std::string_view sequence, SequenceItems const& items) -> std::string {
    //
    std::map<char, int> counts;

    for (std::size_t i = 0; i < sequence.size(); i++) {
      if (items.count(sequence[i]) == 0) {
        throw formula_error(sequence, static_cast<int>(i), "unknown sequence item '{}'", sequence[i]);
      }
      ++counts[sequence[i]];
    }

    std::string formula;

    for (auto const& [key, num] : counts) {
      if (num == 1) {
        formula += fmt::format("({})", items.at(key));
      } else {
        formula += fmt::format("({}){}", items.at(key), num);
      }
    }

    return formula;
  }

  auto from_peptide(std::string_view sequence) -> std::string {
    //
    auto [body, charge] = split_charge(strip_whitespace(sequence));

    return join_charge(fmt::format("({}H2O)", from_sequence(body, amino_acids())), charge);
  }

  auto from_oligo(std::string_view sequence, Oligo kind) -> std::string {
    //
    auto [body, charge] = split_charge(strip_whitespace(sequence));

    bool rna = kind == Oligo::ssrna || kind == Oligo::dsrna;

    Nucleotides const& items = rna ? nucleotides() : deoxynucleotides();

    std::string formula;

    if (kind == Oligo::dsdna || kind == Oligo::dsrna) {
      //
      std::string strands = body;

      for (char c : body) {
        if (auto it = items.complements.find(c); it != items.complements.end()) {
          strands.push_back(it->second);
        } else {
          throw formula_error(body, -1, "unknown sequence item '{}'", c);
        }
      }

      formula = fmt::format("({}(H2O)2)", from_sequence(strands, items.formulas));
    } else {
      formula = fmt::format("({}H2O)", from_sequence(body, items.formulas));
    }

    return join_charge(formula, charge);
  }

}  // namespace mol::formula
