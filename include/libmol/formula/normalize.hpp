#pragma once

// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <string>
#include <string_view>

#include "libmol/formula/groups.hpp"

/**
 * \file normalize.hpp
 *
 * @brief Rewrite user input into a canonical formula string.
 */

namespace mol::formula {

  /**
   * @brief The kind of user input, decided once before rewriting.
   */
  enum class InputKind {
    plain,      ///< A formula, possibly with groups, arithmetic and preprocessor calls.
    fractions,  ///< A list of mass fractions like ``O: 0.26, 30Si: 0.74``.
    dna,        ///< A single stranded DNA sequence.
    rna,        ///< A single stranded RNA sequence.
    peptide,    ///< A single letter amino acid sequence.
  };

  /**
   * @brief Rewrites user input into canonical formulas.
   *
   * \rst
   *
   * The canonical form consists of brackets, element and isotope symbols, counts and an optional trailing charge
   * suffix. The input is rewritten in this order:
   *
   * 1. Whitespace is removed.
   * 2. Chemical group abbreviations are expanded, longest keys of a common prefix first, e.g. ``Ph`` to ``(C6H5)``.
   * 3. Mass fraction lists and biological sequences are converted by their expanders.
   * 4. Calls to ``peptide(...)``, ``ssdna(...)``, ``dsdna(...)``, ``ssrna(...)`` and ``dsrna(...)`` are expanded.
   * 5. ``D`` (not part of a two letter symbol) is replaced by ``[2H]``.
   * 6. The charge suffix is split off.
   * 7. Arithmetic is expanded, ``.`` is an alias of ``+`` and ``5*H2O`` or ``5H2O`` become ``(H2O)5``.
   * 8. The charge is rejoined as ``[formula]<charge>``.
   *
   * \endrst
   */
  class Normalizer {
  public:
    /**
     * @brief Used to configure the normalizer.
     */
    struct Options {
      /** @brief Expand abbreviations of chemical groups. */
      bool parse_groups = true;
      /** @brief Recognise lists of mass fractions. */
      bool parse_fractions = true;
      /** @brief Recognise DNA, RNA and peptide sequences and preprocessor calls. */
      bool parse_oligos = true;
      /** @brief Expand ``+``, ``.`` and ``*`` arithmetic. */
      bool parse_arithmetic = true;
      /** @brief Abbreviations to expand, ``nullptr`` selects default_groups(). */
      Groups const* groups = nullptr;
    };

    /**
     * @brief Construct a new Normalizer object.
     */
    explicit Normalizer(Options const& opt) : m_opt(opt) {}

    /**
     * @brief Classify input with its whitespace removed and groups expanded.
     */
    auto classify(std::string_view formula) const -> InputKind;

    /**
     * @brief Rewrite ``input`` into a canonical formula, throws FormulaError on malformed input.
     */
    auto operator()(std::string_view input) const -> std::string;

  private:
    Options m_opt;

    auto expand_groups(std::string formula) const -> std::string;

    auto expand_arithmetic(std::string const& formula) const -> std::string;
  };

  /**
   * @brief Shorthand for ``Normalizer{opt}(input)``.
   */
  auto normalize(std::string_view input, Normalizer::Options const& opt = {}) -> std::string;

}  // namespace mol::formula
