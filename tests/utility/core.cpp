// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/utility/core.hpp"

#include <catch2/catch.hpp>
#include <cstdint>
#include <string>
#include <vector>

TEST_CASE("error", "[utility]") {
  //
  mol::RuntimeError err = mol::error("bad {} at {}", "thing", 3);

  CHECK(std::string(err.what()) == "bad thing at 3");

  REQUIRE_THROWS_AS(mol::verify(false, "x = {}", 1), mol::RuntimeError);
  REQUIRE_NOTHROW(mol::verify(true, "x = {}", 1));
}

TEST_CASE("gcd", "[utility]") {
  //
  using V = std::vector<std::int64_t>;

  CHECK(mol::gcd(V{}) == 1);
  CHECK(mol::gcd(V{4}) == 4);
  CHECK(mol::gcd(V{3, 6}) == 3);
  CHECK(mol::gcd(V{6, 7}) == 1);
  CHECK(mol::gcd(V{1000, 1000}) == 1000);
}

TEST_CASE("precision_digits", "[utility]") {
  CHECK(mol::precision_digits(0.0, 9) == 7);
  CHECK(mol::precision_digits(0.5, 9) == 7);
  CHECK(mol::precision_digits(18.015, 9) == 6);
  CHECK(mol::precision_digits(194.19, 9) == 5);
  CHECK(mol::precision_digits(-18.015, 9) == 5);
  CHECK(mol::precision_digits(1e12, 9) == 1);
}

TEST_CASE("near", "[utility]") {
  CHECK(mol::near(1.0, 1.0));
  CHECK(mol::near(1.0, 1.00001));
  CHECK(!mol::near(1.0, 1.1));
  CHECK(mol::near(0.0, 1e-11));
}

TEST_CASE("safe_cast", "[utility]") {
  CHECK(mol::safe_cast<int>(std::int64_t{42}) == 42);
  CHECK(mol::safe_cast<int>(std::int64_t{-7}) == -7);
#ifndef NDEBUG
  REQUIRE_THROWS_AS(mol::safe_cast<int>(std::int64_t{1} << 40), mol::RuntimeError);
#endif
}

TEST_CASE("defer", "[utility]") {
  //
  int i = 0;

  {
    mol::Defer _ = [&i]() noexcept { i = 1; };

    CHECK(i == 0);
  }

  CHECK(i == 1);

  try {
    mol::Defer _ = [&i]() noexcept { i = 2; };
    CHECK(i == 1);
    throw mol::error("{}", "!");
  } catch (mol::RuntimeError const &) {
    CHECK(i == 2);
  }
}

TEST_CASE("timeit", "[utility]") {
  //
  int calls = 0;

  int x = mol::timeit("square", [&calls](int n) {
    ++calls;
    return n * n;
  }, 7);

  CHECK(x == 49);
  CHECK(calls == 1);
}
