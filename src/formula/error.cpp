// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/formula/error.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <string>
#include <utility>

namespace mol::formula {

  namespace {

    auto render(std::string const& message, std::string const& formula, int position) -> std::string {
      if (position < 0) {
        return message;
      }
      return fmt::format("{}\n{}\n{}^", message, formula, std::string(static_cast<std::size_t>(position), '.'));
    }

  }  // namespace

  FormulaError::FormulaError(std::string message, std::string formula, int position)
      : RuntimeError(render(message, formula, position)),
        m_message(std::move(message)),
        m_formula(std::move(formula)),
        m_position(position) {}

}  // namespace mol::formula
