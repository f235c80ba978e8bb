// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <fmt/core.h>

#include "libmol/formula/formula.hpp"
#include "libmol/mass/spectrum.hpp"

void example_spectrum() {
  //
  mol::formula::Formula f{"SO4_2-"};

  mol::mass::Spectrum::Options opt;

  opt.min_intensity = 0.1;  // Percent of the peak.

  mol::mass::Spectrum const& s = f.spectrum(opt);

  for (mol::mass::SpectrumEntry const& e : s) {
    fmt::print("{:>3} {:12.6f} {:10.6f}\n", e.massnumber, e.mz, e.intensity);
  }

  fmt::print("Peak at {} with mean {:.6f}\n", s.peak().massnumber, s.mean());

  fmt::print("{}\n", s.to_string());
}

int main() {
  example_spectrum();
  return 0;
}
