// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/mass/spectrum.hpp"

#include <catch2/catch.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "libmol/formula/formula.hpp"
#include "libmol/utility/core.hpp"

namespace {

  struct Bin {
    int massnumber;
    double mass;
    double fraction;
    double intensity;
  };

  auto spectrum_of(char const *formula) -> mol::mass::Spectrum {
    //
    mol::formula::Formula f{formula};

    mol::mass::Spectrum::Options opt;

    opt.min_intensity = std::string_view(formula).size() > 3 ? 0.1 : 1e-16;

    return f.spectrum(opt);
  }

  void check_bins(mol::mass::Spectrum const &s, std::vector<Bin> const &expect) {
    //
    REQUIRE(s.size() == expect.size());

    auto it = s.begin();

    for (Bin const &bin : expect) {
      CHECK(it->massnumber == bin.massnumber);
      CHECK(it->mass == Approx(bin.mass).margin(1e-6));
      CHECK(it->fraction == Approx(bin.fraction).margin(1e-6));
      CHECK(it->intensity == Approx(bin.intensity).margin(1e-6));
      ++it;
    }
  }

}  // namespace

TEST_CASE("Spectra of hydrogen and deuterium", "[mass]") {
  //
  mol::mass::Spectrum d = spectrum_of("D");

  check_bins(d, {{2, 2.0141018, 1.0, 100.0}});
  CHECK(d.mean() == Approx(2.0141018).margin(1e-6));

  mol::mass::Spectrum d2 = spectrum_of("D2");

  REQUIRE(d2.size() == 1);
  CHECK(d2.begin()->massnumber == 4);
  CHECK(d2.mean() == Approx(4.0282036).margin(1e-6));

  mol::mass::Spectrum h = spectrum_of("H");

  check_bins(h, {{1, 1.0078250, 0.999885, 100.0}, {2, 2.0141017, 0.000115, 0.0115013}});
  CHECK(h.mean() == Approx(1.0079408).margin(1e-6));
  CHECK(h.range() == std::pair<int, int>{1, 2});
  CHECK(h.peak().massnumber == 1);

  mol::mass::Spectrum hp = spectrum_of("H+");

  REQUIRE(hp.size() == 2);
  CHECK(hp.at(1).mass == Approx(1.0072765).margin(1e-6));
  CHECK(hp.at(2).mass == Approx(2.0135532).margin(1e-6));
  CHECK(hp.mean() == Approx(1.0073922).margin(1e-6));

  mol::mass::Spectrum dh = spectrum_of("DH");

  CHECK(dh.range() == std::pair<int, int>{3, 4});
  CHECK(dh.mean() == Approx(3.0220425).margin(1e-6));
}

TEST_CASE("Spectrum of semi-heavy water", "[mass]") {
  //
  mol::mass::Spectrum s = spectrum_of("DHO");

  check_bins(s,
             {
                 {19, 19.0168414, 0.9974553, 100.0},
                 {20, 20.0215362, 0.00049468, 0.04959389},
                 {21, 21.0210866, 0.00204981, 0.20550374},
                 {22, 22.0273632, 2.3575e-07, 2.36351448e-05},
             });

  CHECK(s.mean() == Approx(19.0214475).margin(1e-6));
}

TEST_CASE("Spectrum of sulfate", "[mass]") {
  //
  mol::mass::Spectrum s = spectrum_of("SO4_2-");

  check_bins(s,
             {
                 {96, 95.9528268, 0.9407006, 100.0},
                 {97, 96.9529958, 0.0088607, 0.9419271},
                 {98, 97.9499357, 0.0498331, 5.2974427},
             });

  CHECK(s.charge() == -2);
  CHECK(s.at(96).mz == Approx(47.9764134).margin(1e-6));
  CHECK(s.at(97).mz == Approx(48.4764979).margin(1e-6));
  CHECK(s.at(98).mz == Approx(48.9749678).margin(1e-6));
  CHECK(s.mean() == Approx(96.0030982).margin(1e-6));

  CHECK(s.find(99) == nullptr);
  REQUIRE_THROWS_AS(s.at(99), mol::RuntimeError);
}

TEST_CASE("Spectrum of ethanol", "[mass]") {
  //
  mol::formula::Formula etoh{"EtOH"};

  mol::mass::Spectrum::Options opt;

  opt.min_intensity = 1e-9;

  mol::mass::Spectrum const &s = etoh.spectrum(opt);

  REQUIRE(s.size() == 6);
  CHECK(s.range() == std::pair<int, int>{46, 51});
  CHECK(s.at(47).mass == Approx(47.04532293299781).margin(1e-9));
  CHECK(s.at(47).fraction == Approx(0.022149945780234485).margin(1e-12));
  CHECK(s.peak().massnumber == 46);
  CHECK(s.peak().intensity == 100.0);
  CHECK(s.mean() == Approx(46.06852122027406).margin(1e-6));

  // Cached for the same options, recomputed for others.
  CHECK(&etoh.spectrum(opt) == &s);
  CHECK(etoh.spectrum().size() == 6);
  CHECK(etoh.spectrum(opt).size() == 6);

  opt.min_intensity = 1.0;

  CHECK(etoh.spectrum(opt).size() == 2);
}

TEST_CASE("Fractions are conserved", "[mass]") {
  //
  for (char const *formula : {"C8H10N4O2", "SO4_2-", "[13C]Cl4", "CuSO4.5H2O"}) {
    //
    INFO(formula);

    mol::formula::Formula f{formula};

    double sum = 0.0;

    for (mol::mass::SpectrumEntry const &e : f.spectrum()) {
      sum += e.fraction;
    }

    CHECK(sum == Approx(1.0).margin(1e-6));
    CHECK(f.spectrum().peak().intensity == 100.0);
  }
}

TEST_CASE("Spectrum table", "[mass]") {
  //
  mol::mass::Spectrum s = spectrum_of("H");

  std::string expect = "A  Relative mass  Fraction %  Intensity %\n"
                       "1      1.0078250   99.988500   100.000000\n"
                       "2      2.0141018    0.011500     0.011501";

  CHECK(s.to_string() == expect);

  CHECK(mol::mass::Spectrum{}.to_string().empty());
}
