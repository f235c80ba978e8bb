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
 * \file sequence.hpp
 *
 * @brief Formulas of biological polymers from their sequences.
 */

namespace mol::formula {

  /**
   * @brief Kind of nucleic acid polymer.
   */
  enum class Oligo {
    ssdna,  ///< Single stranded DNA.
    dsdna,  ///< Double stranded DNA.
    ssrna,  ///< Single stranded RNA.
    dsrna,  ///< Double stranded RNA.
  };

  /**
   * @brief Parse the (case insensitive) name of an Oligo, e.g. ``"dsDNA"``.
   */
  auto parse_oligo(std::string_view name) -> Oligo;

  /**
   * @brief Histogram of the items in a sequence as a formula.
   *
   * Each distinct item contributes ``(<formula>)<count>`` in order of the item letters.
   *
   * @param sequence Sequence of item letters.
   * @param items Mapping from item letter to formula.
   * @return Formula string, empty if ``sequence`` is empty.
   */
  auto from_sequence(std::string_view sequence, SequenceItems const& items) -> std::string;

  /**
   * @brief Formula of a polymer of unmodified amino acids.
   *
   * Whitespace in the sequence is ignored and an optional charge suffix is carried over, e.g. ``GG_2+`` becomes
   * ``[((C2H3NO)2H2O)]2+``.
   */
  auto from_peptide(std::string_view sequence) -> std::string;

  /**
   * @brief Formula of a polymer of unmodified (deoxy)nucleotides.
   *
   * Each strand includes a 5' monophosphate, double stranded kinds include the complementary strand.
   */
  auto from_oligo(std::string_view sequence, Oligo kind) -> std::string;

}  // namespace mol::formula
