#pragma once

// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <fmt/core.h>

#include <string>
#include <string_view>
#include <utility>

#include "libmol/utility/core.hpp"

/**
 * \file error.hpp
 *
 * @brief The error raised for malformed chemical formulas.
 */

namespace mol::formula {

  /**
   * @brief Error raised when a formula string can not be interpreted.
   *
   * \rst
   *
   * If the position of the offending character is known ``what()`` renders it beneath the formula:
   *
   * .. code::
   *
   *    unknown isotope '11C'
   *    [11C]
   *    .^
   *
   * \endrst
   */
  class FormulaError : public RuntimeError {
  public:
    /**
     * @brief Construct a new FormulaError.
     *
     * @param message Description of the error.
     * @param formula The offending formula.
     * @param position Index of the offending character in ``formula`` or -1 if not applicable.
     */
    explicit FormulaError(std::string message, std::string formula = "", int position = -1);

    /**
     * @brief Description of the error, without the formula.
     */
    auto message() const noexcept -> std::string const& { return m_message; }

    /**
     * @brief The offending formula.
     */
    auto formula() const noexcept -> std::string const& { return m_formula; }

    /**
     * @brief Index of the offending character, -1 if not applicable.
     */
    auto position() const noexcept -> int { return m_position; }

  private:
    std::string m_message;
    std::string m_formula;
    int m_position;
  };

  /**
   * @brief Utility to make a FormulaError using the `{fmt}` library to format the message.
   *
   * @param formula The offending formula.
   * @param position Index of the offending character or -1.
   * @param fmt Format string.
   * @param args Format arguments (forwarded to ``fmt::format``).
   */
  template <typename... Args>
  auto formula_error(std::string_view formula, int position, fmt::format_string<Args...> fmt, Args&&... args) -> FormulaError {
    return FormulaError{fmt::format(fmt, std::forward<Args>(args)...), std::string(formula), position};
  }

}  // namespace mol::formula
