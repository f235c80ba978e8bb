// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/utility/version.hpp"

#include <catch2/catch.hpp>

TEST_CASE("Version number macros", "[version]") {
  REQUIRE(MOL_VERSION_MAJOR >= 0);
  REQUIRE(MOL_VERSION_MINOR >= 0);
  REQUIRE(MOL_VERSION_PATCH >= 0);
}
