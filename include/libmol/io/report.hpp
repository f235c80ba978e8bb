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

#include "libmol/formula/formula.hpp"

/**
 * \file report.hpp
 *
 * @brief Human readable analysis of a formula.
 */

namespace mol::io {

  /**
   * @brief Used to configure analyze().
   */
  struct AnalyzeOptions {
    /** @brief The mass distribution is only computed for formulas with fewer atoms. */
    int maxatoms = 512;
    /** @brief Bins of the mass distribution with a smaller intensity (in percent) are not reported. */
    double min_intensity = 1e-4;
    /** @brief Print intermediate results to stdout. */
    bool debug = false;
    /** @brief Options used to parse the formula. */
    mol::formula::Formula::Options formula = {};
  };

  /**
   * @brief Analyze a formula and render the result as text.
   *
   * \rst
   *
   * The report lists the formula in Hill and empirical notation, its masses, the elemental composition and the
   * mass distribution. Errors are not thrown but reported on a line starting with ``Error:``.
   *
   * \endrst
   */
  auto analyze(std::string_view text, AnalyzeOptions const &opt = {}) -> std::string;

}  // namespace mol::io
