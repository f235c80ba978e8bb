// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/mass/mass.hpp"

#include <cmath>

#include "libmol/data/elements.hpp"
#include "libmol/formula/parse.hpp"
#include "libmol/utility/core.hpp"

namespace mol::mass {

  auto average_mass(formula::Elements const &elements, int charge) -> double {
    //
    double mass = 0.0;

    for (auto const &[symbol, isotopes] : elements) {
      //
      data::Element const &ele = data::elements()[symbol];

      for (auto const &[massnumber, count] : isotopes) {
        if (massnumber == 0) {
          mass += ele.mass * static_cast<double>(count);
        } else {
          mass += ele.isotope(massnumber).mass * static_cast<double>(count);
        }
      }
    }

    return mass - data::electron.mass * charge;
  }

  auto monoisotopic(formula::Elements const &elements, int charge) -> data::Isotope {
    //
    data::Isotope result{0.0, 1.0, 0, charge};

    for (auto const &[symbol, isotopes] : elements) {
      //
      data::Element const &ele = data::elements()[symbol];

      for (auto const &[massnumber, count] : isotopes) {
        //
        data::Isotope const &iso = massnumber == 0 ? ele.isotope(ele.nominalmass) : ele.isotope(massnumber);

        int number = massnumber == 0 ? ele.nominalmass : massnumber;

        result.mass += iso.mass * static_cast<double>(count);
        result.abundance *= std::pow(iso.abundance, static_cast<double>(count));
        result.massnumber += number * count;
      }
    }

    result.mass -= data::electron.mass * charge;

    return result;
  }

  auto count_atoms(formula::Elements const &elements) -> formula::Count {
    //
    formula::Count atoms = 0;

    for (auto const &[symbol, isotopes] : elements) {
      for (auto const &[massnumber, count] : isotopes) {
        atoms += count;
      }
    }

    return atoms;
  }

}  // namespace mol::mass
