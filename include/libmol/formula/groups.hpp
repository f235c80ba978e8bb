#pragma once

// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <functional>
#include <map>
#include <string>

/**
 * \file groups.hpp
 *
 * @brief Abbreviations of common chemical groups and the monomers of biological sequences.
 */

namespace mol::formula {

  /**
   * @brief Mapping from the abbreviation of a chemical group to its formula.
   */
  using Groups = std::map<std::string, std::string, std::less<>>;

  /**
   * @brief Mapping from a sequence letter to the formula of the monomer.
   */
  using SequenceItems = std::map<char, std::string>;

  /**
   * @brief Monomers of a nucleic acid and the complementary base of each.
   */
  struct Nucleotides {
    SequenceItems formulas;           ///< Monophosphates minus H2O.
    std::map<char, char> complements;  ///< Watson-Crick pairing.
  };

  /**
   * @brief Common chemical groups, e.g. ``Ph`` is ``C6H5``, and amino acid residues.
   */
  auto default_groups() -> Groups const&;

  /**
   * @brief Single letter amino acid codes, residues minus H2O.
   */
  auto amino_acids() -> SequenceItems const&;

  /**
   * @brief Deoxynucleotide monophosphates (DNA).
   */
  auto deoxynucleotides() -> Nucleotides const&;

  /**
   * @brief Nucleotide monophosphates (RNA).
   */
  auto nucleotides() -> Nucleotides const&;

}  // namespace mol::formula
