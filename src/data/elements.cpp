// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/data/elements.hpp"

#include <fmt/core.h>

#include <cmath>
#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "libmol/utility/core.hpp"

namespace mol::data {

  auto Element::exact_mass() const -> double {
    double sum = 0.0;
    for (auto const &[massnumber, iso] : isotopes) {
      sum += iso.mass * iso.abundance;
    }
    return sum;
  }

  auto Element::most_abundant() const -> Isotope const & {
    //
    verify(!isotopes.empty(), "Element {} has no isotopes", symbol);

    Isotope const *best = &isotopes.begin()->second;

    for (auto const &[massnumber, iso] : isotopes) {
      if (iso.abundance > best->abundance) {
        best = &iso;
      }
    }

    return *best;
  }

  auto Element::isotope(int massnumber) const -> Isotope const & {
    if (auto it = isotopes.find(massnumber); it != isotopes.end()) {
      return it->second;
    }
    throw error("Element {} has no isotope with mass number {}", symbol, massnumber);
  }

  auto Element::eleconfig_dict() const -> ElectronConfig {
    //
    ElectronConfig config;

    std::istringstream tokens{eleconfig};
    std::string tok;

    while (tokens >> tok) {
      if (tok.front() == '[') {
        // Noble gas core.
        verify(tok.size() > 2 && tok.back() == ']', "Invalid core '{}' in configuration of {}", tok, symbol);
        config = elements()[std::string_view(tok).substr(1, tok.size() - 2)].eleconfig_dict();
        continue;
      }

      verify(tok.size() >= 2 && tok[0] >= '1' && tok[0] <= '9', "Invalid orbital '{}' in configuration of {}", tok, symbol);

      config[{tok[0] - '0', tok[1]}] = tok.size() > 2 ? std::stoi(tok.substr(2)) : 1;
    }

    return config;
  }

  auto Element::eleshells() const -> std::vector<int> {
    //
    std::vector<int> shells(7, 0);

    for (auto const &[orbital, count] : eleconfig_dict()) {
      verify(orbital.first <= 7, "Shell {} out of range for {}", orbital.first, symbol);
      shells[safe_cast<std::size_t>(orbital.first - 1)] += count;
    }

    std::vector<int> occupied;

    for (int n : shells) {
      if (n != 0) {
        occupied.push_back(n);
      }
    }

    return occupied;
  }

  auto Element::validate() const -> void {
    //
    verify(period >= 1 && period <= 7, "{} - invalid period {}", symbol, period);
    verify(group >= 1 && group <= 18, "{} - invalid group {}", symbol, group);
    verify(std::string_view("spdfg").find(block) != std::string_view::npos, "{} - invalid block '{}'", symbol, block);
    verify(series >= 1 && series < ssize(series_names()), "{} - invalid series {}", symbol, series);

    int shell_sum = 0;

    for (int n : eleshells()) {
      shell_sum += n;
    }

    verify(number == protons(), "{} - atomic number must equal proton number", symbol);
    verify(protons() == shell_sum, "{} - number of protons must equal electrons", symbol);

    for (std::size_t i = 1; i < ionenergy.size(); i++) {
      verify(ionenergy[i] > ionenergy[i - 1], "{} - ionenergy not increasing", symbol);
    }

    double frac = 0.0;

    for (auto const &[massnumber, iso] : isotopes) {
      frac += iso.abundance;
    }

    verify(std::abs(exact_mass() - mass) <= 0.03,
           "{} - average of isotope masses ({:.4f}) != mass ({:.4f})",
           symbol,
           exact_mass(),
           mass);

    verify(std::abs(frac - 1.0) <= 1e-9, "{} - sum of isotope abundances != 1.0", symbol);
  }

  auto series_names() -> std::vector<std::string_view> const & {
    static std::vector<std::string_view> const names{
        "",
        "Nonmetals",
        "Noble gases",
        "Alkali metals",
        "Alkaline earth metals",
        "Metalloids",
        "Halogens",
        "Poor metals",
        "Transition metals",
        "Lanthanides",
        "Actinides",
    };
    return names;
  }

  ElementTable::ElementTable(std::vector<Element> elements) : m_elements(std::move(elements)) {
    for (std::size_t i = 0; i < m_elements.size(); i++) {
      //
      Element &elem = m_elements[i];

      verify(elem.number == safe_cast<int>(i) + 1, "Elements must be added in order, got {} at {}", elem.number, i + 1);

      int nominal = 0;
      double max_abundance = 0;

      for (auto const &[massnumber, iso] : elem.isotopes) {
        if (iso.abundance > max_abundance) {
          max_abundance = iso.abundance;
          nominal = massnumber;
        }
      }

      elem.nominalmass = nominal;

      m_index.emplace(elem.symbol, i);
      m_index.emplace(elem.name, i);
    }
  }

  auto ElementTable::find(std::string_view key) const -> Element const * {
    if (auto it = m_index.find(key); it != m_index.end()) {
      return &m_elements[it->second];
    }
    return nullptr;
  }

  auto ElementTable::operator[](std::string_view key) const -> Element const & {
    if (Element const *elem = find(key)) {
      return *elem;
    }
    throw error("Unknown element '{}'", key);
  }

  auto ElementTable::operator[](int number) const -> Element const & {
    verify(number >= 1 && number <= ssize(m_elements), "No element with atomic number {}", number);
    return m_elements[safe_cast<std::size_t>(number - 1)];
  }

  namespace {

    auto build_elements() -> std::vector<Element> {
      return {
      {1, "H", "Hydrogen", 1, 1, 's', 1, 1.007941,
       2.2, 0.75420375, 0.32, 0.79, 1.2, 20.28, 13.81, 0.084,
       "1s", "1*, -1",
       {13.5984},
       {{1, {1.00782503223, 0.999885, 1}}, {2, {2.01410177812, 0.000115, 2}}}},
      {2, "He", "Helium", 18, 1, 's', 2, 4.002602,
       0.0, 0.0, 0.93, 0.49, 1.4, 4.216, 0.95, 0.1785,
       "1s2", "*",
       {24.5874, 54.416},
       {{3, {3.0160293201, 1.34e-06, 3}}, {4, {4.00260325413, 0.99999866, 4}}}},
      {3, "Li", "Lithium", 1, 2, 's', 3, 6.94,
       0.98, 0.618049, 1.23, 2.05, 1.82, 1615.0, 453.7, 0.53,
       "[He] 2s", "1*",
       {5.3917, 75.638, 122.451},
       {{6, {6.0151228874, 0.0759, 6}}, {7, {7.0160034366, 0.9241, 7}}}},
      {4, "Be", "Beryllium", 2, 2, 's', 4, 9.0121831,
       1.57, 0.0, 0.9, 1.4, 0.0, 3243.0, 1560.0, 1.85,
       "[He] 2s2", "2*",
       {9.3227, 18.211, 153.893, 217.713},
       {{9, {9.012183065, 1.0, 9}}}},
      {5, "B", "Boron", 13, 2, 'p', 5, 10.811,
       2.04, 0.279723, 0.82, 1.17, 0.0, 4275.0, 2365.0, 2.46,
       "[He] 2s2 2p", "3*",
       {8.298, 25.154, 37.93, 59.368, 340.217},
       {{10, {10.01293695, 0.199, 10}}, {11, {11.00930536, 0.801, 11}}}},
      {6, "C", "Carbon", 14, 2, 'p', 1, 12.01074,
       2.55, 1.262118, 0.77, 0.91, 1.7, 5100.0, 3825.0, 3.51,
       "[He] 2s2 2p2", "4*, 2, -4*",
       {11.2603, 24.383, 47.877, 64.492, 392.077, 489.981},
       {{12, {12.0, 0.9893, 12}}, {13, {13.00335483507, 0.0107, 13}}}},
      {7, "N", "Nitrogen", 15, 2, 'p', 1, 14.006703,
       3.04, -0.07, 0.75, 0.75, 1.55, 77.344, 63.15, 1.17,
       "[He] 2s2 2p3", "5, 4, 3, 2, -3*",
       {14.5341, 39.601, 47.488, 77.472, 97.888, 522.057,
        667.029},
       {{14, {14.00307400443, 0.99636, 14}}, {15, {15.00010889888, 0.00364, 15}}}},
      {8, "O", "Oxygen", 16, 2, 'p', 1, 15.999405,
       3.44, 1.461112, 0.73, 0.65, 1.52, 90.188, 54.8, 1.33,
       "[He] 2s2 2p4", "-2*, -1",
       {13.6181, 35.116, 54.934, 77.412, 113.896, 138.116,
        739.315, 871.387},
       {{16, {15.99491461957, 0.99757, 16}}, {17, {16.9991317565, 0.00038, 17}}, {18, {17.99915961286, 0.00205, 18}}}},
      {9, "F", "Fluorine", 17, 2, 'p', 6, 18.998403163,
       3.98, 3.4011887, 0.72, 0.57, 1.47, 85.0, 53.55, 1.58,
       "[He] 2s2 2p5", "-1*",
       {17.4228, 34.97, 62.707, 87.138, 114.24, 157.161,
        185.182, 953.886, 1103.089},
       {{19, {18.99840316273, 1.0, 19}}}},
      {10, "Ne", "Neon", 18, 2, 'p', 2, 20.1797,
       0.0, 0.0, 0.71, 0.51, 1.54, 27.1, 24.55, 0.8999,
       "[He] 2s2 2p6", "*",
       {21.5645, 40.962, 63.45, 97.11, 126.21, 157.93,
        207.27, 239.09, 1195.797, 1362.164},
       {{20, {19.9924401762, 0.9048, 20}}, {21, {20.993846685, 0.0027, 21}}, {22, {21.991385114, 0.0925, 22}}}},
      {11, "Na", "Sodium", 1, 3, 's', 3, 22.98976928,
       0.93, 0.547926, 1.54, 2.23, 2.27, 1156.0, 371.0, 0.97,
       "[Ne] 3s", "1*",
       {5.1391, 47.286, 71.64, 98.91, 138.39, 172.15,
        208.47, 264.18, 299.87, 1465.091, 1648.659},
       {{23, {22.989769282, 1.0, 23}}}},
      {12, "Mg", "Magnesium", 2, 3, 's', 4, 24.3051,
       1.31, 0.0, 1.36, 1.72, 1.73, 1380.0, 922.0, 1.74,
       "[Ne] 3s2", "2*",
       {7.6462, 15.035, 80.143, 109.24, 141.26, 186.5,
        224.94, 265.9, 327.95, 367.53, 1761.802, 1962.613},
       {{24, {23.985041697, 0.7899, 24}}, {25, {24.985836976, 0.1, 25}}, {26, {25.982592968, 0.1101, 26}}}},
      {13, "Al", "Aluminium", 13, 3, 'p', 7, 26.9815385,
       1.61, 0.43283, 1.18, 1.82, 0.0, 2740.0, 933.5, 2.7,
       "[Ne] 3s2 3p", "3*",
       {5.9858, 18.828, 28.447, 119.99, 153.71, 190.47,
        241.43, 284.59, 330.21, 398.57, 442.07, 2085.983,
        2304.08},
       {{27, {26.98153853, 1.0, 27}}}},
      {14, "Si", "Silicon", 14, 3, 'p', 5, 28.0855,
       1.9, 1.389521, 1.11, 1.46, 2.1, 2630.0, 1683.0, 2.33,
       "[Ne] 3s2 3p2", "4*, -4",
       {8.1517, 16.345, 33.492, 45.141, 166.77, 205.05,
        246.52, 303.17, 351.1, 401.43, 476.06, 523.5,
        2437.676, 2673.108},
       {{28, {27.97692653465, 0.92223, 28}}, {29, {28.9764946649, 0.04685, 29}}, {30, {29.973770136, 0.03092, 30}}}},
      {15, "P", "Phosphorus", 15, 3, 'p', 1, 30.973761998,
       2.19, 0.7465, 1.06, 1.23, 1.8, 553.0, 317.3, 1.82,
       "[Ne] 3s2 3p3", "5*, 3, -3",
       {10.4867, 19.725, 30.18, 51.37, 65.023, 220.43,
        263.22, 309.41, 371.73, 424.5, 479.57, 560.41,
        611.85, 2816.943, 3069.762},
       {{31, {30.97376199842, 1.0, 31}}}},
      {16, "S", "Sulfur", 16, 3, 'p', 1, 32.0648,
       2.58, 2.0771029, 1.02, 1.09, 1.8, 717.82, 392.2, 2.06,
       "[Ne] 3s2 3p4", "6*, 4, 2, -2",
       {10.36, 23.33, 34.83, 47.3, 72.68, 88.049,
        280.93, 328.23, 379.1, 447.09, 504.78, 564.65,
        651.63, 707.14, 3223.836, 3494.099},
       {{32, {31.9720711744, 0.9499, 32}}, {33, {32.9714589098, 0.0075, 33}}, {34, {33.967867004, 0.0425, 34}},
        {36, {35.96708071, 0.0001, 36}}}},
      {17, "Cl", "Chlorine", 17, 3, 'p', 6, 35.4529,
       3.16, 3.612724, 0.99, 0.97, 1.75, 239.18, 172.17, 2.95,
       "[Ne] 3s2 3p5", "7, 5, 3, 1, -1*",
       {12.9676, 23.81, 39.61, 53.46, 67.8, 98.03,
        114.193, 348.28, 400.05, 455.62, 529.97, 591.97,
        656.69, 749.75, 809.39, 3658.425, 3946.193},
       {{35, {34.968852682, 0.7576, 35}}, {37, {36.965902602, 0.2424, 37}}}},
      {18, "Ar", "Argon", 18, 3, 'p', 2, 39.948,
       0.0, 0.0, 0.98, 0.88, 1.88, 87.45, 83.95, 1.66,
       "[Ne] 3s2 3p6", "*",
       {15.7596, 27.629, 40.74, 59.81, 75.02, 91.007,
        124.319, 143.456, 422.44, 478.68, 538.95, 618.24,
        686.09, 755.73, 854.75, 918.0, 4120.778, 4426.114},
       {{36, {35.967545105, 0.003336, 36}}, {38, {37.96273211, 0.000629, 38}}, {40, {39.9623831237, 0.996035, 40}}}},
      {19, "K", "Potassium", 1, 4, 's', 3, 39.0983,
       0.82, 0.501459, 2.03, 2.77, 2.75, 1033.0, 336.8, 0.86,
       "[Ar] 4s", "1*",
       {4.3407, 31.625, 45.72, 60.91, 82.66, 100.0,
        117.56, 154.86, 175.814, 503.44, 564.13, 629.09,
        714.02, 787.13, 861.77, 968.0, 1034.0, 4610.955,
        4933.931},
       {{39, {38.9637064864, 0.932581, 39}}, {40, {39.963998166, 0.000117, 40}}, {41, {40.9618252579, 0.067302, 41}}}},
      {20, "Ca", "Calcium", 2, 4, 's', 4, 40.078,
       1.0, 0.02455, 1.74, 2.23, 0.0, 1757.0, 1112.0, 1.54,
       "[Ar] 4s2", "2*",
       {6.1132, 11.71, 50.908, 67.1, 84.41, 108.78,
        127.7, 147.24, 188.54, 211.27, 591.25, 656.39,
        726.03, 816.61, 895.12, 974.0, 1087.0, 1157.0,
        5129.045, 5469.738},
       {{40, {39.962590863, 0.96941, 40}}, {42, {41.95861783, 0.00647, 42}}, {43, {42.95876644, 0.00135, 43}},
        {44, {43.95548156, 0.02086, 44}}, {46, {45.953689, 4e-05, 46}}, {48, {47.95252276, 0.00187, 48}}}},
      {21, "Sc", "Scandium", 3, 4, 'd', 8, 44.955908,
       1.36, 0.188, 1.44, 2.09, 0.0, 3109.0, 1814.0, 2.99,
       "[Ar] 3d 4s2", "3*",
       {6.5615, 12.8, 24.76, 73.47, 91.66, 110.1,
        138.0, 158.7, 180.02, 225.32, 249.8, 685.89,
        755.47, 829.79, 926.0},
       {{45, {44.95590828, 1.0, 45}}}},
      {22, "Ti", "Titanium", 4, 4, 'd', 8, 47.867,
       1.54, 0.084, 1.32, 2.0, 0.0, 3560.0, 1935.0, 4.51,
       "[Ar] 3d2 4s2", "4*, 3",
       {6.8281, 13.58, 27.491, 43.266, 99.22, 119.36,
        140.8, 168.5, 193.5, 215.91, 265.23, 291.497,
        787.33, 861.33},
       {{46, {45.95262772, 0.0825, 46}}, {47, {46.95175879, 0.0744, 47}}, {48, {47.94794198, 0.7372, 48}},
        {49, {48.94786568, 0.0541, 49}}, {50, {49.94478689, 0.0518, 50}}}},
      {23, "V", "Vanadium", 5, 4, 'd', 8, 50.9415,
       1.63, 0.525, 1.22, 1.92, 0.0, 3650.0, 2163.0, 6.09,
       "[Ar] 3d3 4s2", "5*, 4, 3, 2, 0",
       {6.7462, 14.65, 29.31, 46.707, 65.23, 128.12,
        150.17, 173.7, 205.8, 230.5, 255.04, 308.25,
        336.267, 895.58, 974.02},
       {{50, {49.94715601, 0.0025, 50}}, {51, {50.94395704, 0.9975, 51}}}},
      {24, "Cr", "Chromium", 6, 4, 'd', 8, 51.9961,
       1.66, 0.67584, 1.18, 1.85, 0.0, 2945.0, 2130.0, 7.14,
       "[Ar] 3d5 4s", "6, 3*, 2, 0",
       {6.7665, 16.5, 30.96, 49.1, 69.3, 90.56,
        161.1, 184.7, 209.3, 244.4, 270.8, 298.0,
        355.0, 384.3, 1010.64},
       {{50, {49.94604183, 0.04345, 50}}, {52, {51.94050623, 0.83789, 52}}, {53, {52.94064815, 0.09501, 53}},
        {54, {53.93887916, 0.02365, 54}}}},
      {25, "Mn", "Manganese", 7, 4, 'd', 8, 54.938044,
       1.55, 0.0, 1.17, 1.79, 0.0, 2235.0, 1518.0, 7.44,
       "[Ar] 3d5 4s2", "7, 6, 4, 3, 2*, 0, -1",
       {7.434, 15.64, 33.667, 51.2, 72.4, 95.0,
        119.27, 196.46, 221.8, 248.3, 286.0, 314.4,
        343.6, 404.0, 435.3, 1136.2},
       {{55, {54.93804391, 1.0, 55}}}},
      {26, "Fe", "Iron", 8, 4, 'd', 8, 55.845,
       1.83, 0.151, 1.17, 1.72, 0.0, 3023.0, 1808.0, 7.874,
       "[Ar] 3d6 4s2", "6, 3*, 2, 0, -2",
       {7.9024, 16.18, 30.651, 54.8, 75.0, 99.0,
        125.0, 151.06, 235.04, 262.1, 290.4, 330.8,
        361.0, 392.2, 457.0, 485.5, 1266.1},
       {{54, {53.93960899, 0.05845, 54}}, {56, {55.93493633, 0.91754, 56}}, {57, {56.93539284, 0.02119, 57}},
        {58, {57.93327443, 0.00282, 58}}}},
      {27, "Co", "Cobalt", 9, 4, 'd', 8, 58.933194,
       1.88, 0.6633, 1.16, 1.67, 0.0, 3143.0, 1768.0, 8.89,
       "[Ar] 3d7 4s2", "3, 2*, 0, -1",
       {7.881, 17.06, 33.5, 51.3, 79.5, 102.0,
        129.0, 157.0, 186.13, 276.0, 305.0, 336.0,
        376.0, 411.0, 444.0, 512.0, 546.8, 1403.0},
       {{59, {58.93319429, 1.0, 59}}}},
      {28, "Ni", "Nickel", 10, 4, 'd', 8, 58.6934,
       1.91, 1.15716, 1.15, 1.62, 1.63, 3005.0, 1726.0, 8.91,
       "[Ar] 3d8 4s2", "3, 2*, 0",
       {7.6398, 18.168, 35.17, 54.9, 75.5, 108.0,
        133.0, 162.0, 193.0, 224.5, 321.2, 352.0,
        384.0, 430.0, 464.0, 499.0, 571.0, 607.2,
        1547.0},
       {{58, {57.93534241, 0.68077, 58}}, {60, {59.93078588, 0.26223, 60}}, {61, {60.93105557, 0.011399, 61}},
        {62, {61.92834537, 0.036346, 62}}, {64, {63.92796682, 0.009255, 64}}}},
      {29, "Cu", "Copper", 11, 4, 'd', 8, 63.546,
       1.9, 1.23578, 1.17, 1.57, 1.4, 2840.0, 1356.6, 8.92,
       "[Ar] 3d10 4s", "2*, 1",
       {7.7264, 20.292, 26.83, 55.2, 79.9, 103.0,
        139.0, 166.0, 199.0, 232.0, 266.0, 368.8,
        401.0, 435.0, 484.0, 520.0, 557.0, 633.0,
        671.0, 1698.0},
       {{63, {62.92959772, 0.6915, 63}}, {65, {64.9277897, 0.3085, 65}}}},
      {30, "Zn", "Zinc", 12, 4, 'd', 8, 65.38,
       1.65, 0.0, 1.25, 1.53, 1.39, 1180.0, 692.73, 7.14,
       "[Ar] 3d10 4s2", "2*",
       {9.3942, 17.964, 39.722, 59.4, 82.6, 108.0,
        134.0, 174.0, 203.0, 238.0, 274.0, 310.8,
        419.7, 454.0, 490.0, 542.0, 579.0, 619.0,
        698.8, 738.0, 1856.0},
       {{64, {63.92914201, 0.4917, 64}}, {66, {65.92603381, 0.2773, 66}}, {67, {66.92712775, 0.0404, 67}},
        {68, {67.92484455, 0.1845, 68}}, {70, {69.9253192, 0.0061, 70}}}},
      {31, "Ga", "Gallium", 13, 4, 'p', 7, 69.723,
       1.81, 0.41, 1.26, 1.81, 1.87, 2478.0, 302.92, 5.91,
       "[Ar] 3d10 4s2 4p", "3*",
       {5.9993, 20.51, 30.71, 64.0},
       {{69, {68.9255735, 0.60108, 69}}, {71, {70.92470258, 0.39892, 71}}}},
      {32, "Ge", "Germanium", 14, 4, 'p', 5, 72.63,
       2.01, 1.232712, 1.22, 1.52, 0.0, 3107.0, 1211.5, 5.32,
       "[Ar] 3d10 4s2 4p2", "4*",
       {7.8994, 15.934, 34.22, 45.71, 93.5},
       {{70, {69.92424875, 0.2057, 70}}, {72, {71.922075826, 0.2745, 72}}, {73, {72.923458956, 0.0775, 73}},
        {74, {73.921177761, 0.365, 74}}, {76, {75.921402726, 0.0773, 76}}}},
      {33, "As", "Arsenic", 15, 4, 'p', 5, 74.921595,
       2.18, 0.814, 1.2, 1.33, 1.85, 876.0, 1090.0, 5.72,
       "[Ar] 3d10 4s2 4p3", "5, 3*, -3",
       {9.7886, 18.633, 28.351, 50.13, 62.63, 127.6},
       {{75, {74.92159457, 1.0, 75}}}},
      {34, "Se", "Selenium", 16, 4, 'p', 1, 78.971,
       2.55, 2.02067, 1.16, 1.22, 1.9, 958.0, 494.0, 4.82,
       "[Ar] 3d10 4s2 4p4", "6, 4*, -2",
       {9.7524, 21.9, 30.82, 42.944, 68.3, 81.7,
        155.4},
       {{74, {73.922475934, 0.0089, 74}}, {76, {75.919213704, 0.0937, 76}}, {77, {76.919914154, 0.0763, 77}},
        {78, {77.91730928, 0.2377, 78}}, {80, {79.9165218, 0.4961, 80}}, {82, {81.9166995, 0.0873, 82}}}},
      {35, "Br", "Bromine", 17, 4, 'p', 6, 79.9035,
       2.96, 3.363588, 1.14, 1.12, 1.85, 331.85, 265.95, 3.14,
       "[Ar] 3d10 4s2 4p5", "7, 5, 3, 1, -1*",
       {11.8138, 21.8, 36.0, 47.3, 59.7, 88.6,
        103.0, 192.8},
       {{79, {78.9183376, 0.5069, 79}}, {81, {80.9162897, 0.4931, 81}}}},
      {36, "Kr", "Krypton", 18, 4, 'p', 2, 83.798,
       0.0, 0.0, 1.12, 1.03, 2.02, 120.85, 116.0, 4.48,
       "[Ar] 3d10 4s2 4p6", "2*",
       {13.9996, 24.359, 36.95, 52.5, 64.7, 78.5,
        110.0, 126.0, 230.39},
       {{78, {77.92036494, 0.00355, 78}}, {80, {79.91637808, 0.02286, 80}}, {82, {81.91348273, 0.11593, 82}},
        {83, {82.91412716, 0.115, 83}}, {84, {83.9114977282, 0.56987, 84}}, {86, {85.9106106269, 0.17279, 86}}}},
      {37, "Rb", "Rubidium", 1, 5, 's', 3, 85.4678,
       0.82, 0.485916, 2.16, 2.98, 0.0, 961.0, 312.63, 1.53,
       "[Kr] 5s", "1*",
       {4.1771, 27.28, 40.0, 52.6, 71.0, 84.4,
        99.2, 136.0, 150.0, 277.1},
       {{85, {84.9117897379, 0.7217, 85}}, {87, {86.909180531, 0.2783, 87}}}},
      {38, "Sr", "Strontium", 2, 5, 's', 4, 87.62,
       0.95, 0.05206, 1.91, 2.45, 0.0, 1655.0, 1042.0, 2.63,
       "[Kr] 5s2", "2*",
       {5.6949, 11.03, 43.6, 57.0, 71.6, 90.8,
        106.0, 122.3, 162.0, 177.0, 324.1},
       {{84, {83.9134191, 0.0056, 84}}, {86, {85.9092606, 0.0986, 86}}, {87, {86.9088775, 0.07, 87}},
        {88, {87.9056125, 0.8258, 88}}}},
      {39, "Y", "Yttrium", 3, 5, 'd', 8, 88.90584,
       1.22, 0.307, 1.62, 2.27, 0.0, 3611.0, 1795.0, 4.47,
       "[Kr] 4d 5s2", "3*",
       {6.2173, 12.24, 20.52, 61.8, 77.0, 93.0,
        116.0, 129.0, 146.52, 191.0, 206.0, 374.0},
       {{89, {88.9058403, 1.0, 89}}}},
      {40, "Zr", "Zirconium", 4, 5, 'd', 8, 91.224,
       1.33, 0.426, 1.45, 2.16, 0.0, 4682.0, 2128.0, 6.51,
       "[Kr] 4d2 5s2", "4*",
       {6.6339, 13.13, 22.99, 34.34, 81.5},
       {{90, {89.9046977, 0.5145, 90}}, {91, {90.9056396, 0.1122, 91}}, {92, {91.9050347, 0.1715, 92}},
        {94, {93.9063108, 0.1738, 94}}, {96, {95.9082714, 0.028, 96}}}},
      {41, "Nb", "Niobium", 5, 5, 'd', 8, 92.90637,
       1.6, 0.893, 1.34, 2.08, 0.0, 5015.0, 2742.0, 8.58,
       "[Kr] 4d4 5s", "5*, 3",
       {6.7589, 14.32, 25.04, 38.3, 50.55, 102.6,
        125.0},
       {{93, {92.906373, 1.0, 93}}}},
      {42, "Mo", "Molybdenum", 6, 5, 'd', 8, 95.95,
       2.16, 0.7472, 1.3, 2.01, 0.0, 4912.0, 2896.0, 10.28,
       "[Kr] 4d5 5s", "6*, 5, 4, 3, 2, 0",
       {7.0924, 16.15, 27.16, 46.4, 61.2, 68.0,
        126.8, 153.0},
       {{92, {91.90680796, 0.1453, 92}}, {94, {93.9050849, 0.0915, 94}}, {95, {94.90583877, 0.1584, 95}},
        {96, {95.90467612, 0.1667, 96}}, {97, {96.90601812, 0.096, 97}}, {98, {97.90540482, 0.2439, 98}},
        {100, {99.9074718, 0.0982, 100}}}},
      {43, "Tc", "Technetium", 7, 5, 'd', 8, 97.9072,
       1.9, 0.55, 1.27, 1.95, 0.0, 4538.0, 2477.0, 11.49,
       "[Kr] 4d5 5s2", "7*",
       {7.28, 15.26, 29.54},
       {{98, {97.9072124, 1.0, 98}}}},
      {44, "Ru", "Ruthenium", 8, 5, 'd', 8, 101.07,
       2.2, 1.04638, 1.25, 1.89, 0.0, 4425.0, 2610.0, 12.45,
       "[Kr] 4d7 5s", "8, 6, 4*, 3*, 2, 0, -2",
       {7.3605, 16.76, 28.47},
       {{96, {95.90759025, 0.0554, 96}}, {98, {97.9052868, 0.0187, 98}}, {99, {98.9059341, 0.1276, 99}},
        {100, {99.9042143, 0.126, 100}}, {101, {100.9055769, 0.1706, 101}}, {102, {101.9043441, 0.3155, 102}},
        {104, {103.9054275, 0.1862, 104}}}},
      {45, "Rh", "Rhodium", 9, 5, 'd', 8, 102.9055,
       2.28, 1.14289, 1.25, 1.83, 0.0, 3970.0, 2236.0, 12.41,
       "[Kr] 4d8 5s", "5, 4, 3*, 1*, 2, 0",
       {7.4589, 18.08, 31.06},
       {{103, {102.905498, 1.0, 103}}}},
      {46, "Pd", "Palladium", 10, 5, 'd', 8, 106.42,
       2.2, 0.56214, 1.28, 1.79, 1.63, 3240.0, 1825.0, 12.02,
       "[Kr] 4d10", "4, 2*, 0",
       {8.3369, 19.43, 32.93},
       {{102, {101.9056022, 0.0102, 102}}, {104, {103.9040305, 0.1114, 104}}, {105, {104.9050796, 0.2233, 105}},
        {106, {105.9034804, 0.2733, 106}}, {108, {107.9038916, 0.2646, 108}}, {110, {109.9051722, 0.1172, 110}}}},
      {47, "Ag", "Silver", 11, 5, 'd', 8, 107.8682,
       1.93, 1.30447, 1.34, 1.75, 1.72, 2436.0, 1235.1, 10.49,
       "[Kr] 4d10 5s", "2, 1*",
       {7.5762, 21.49, 34.83},
       {{107, {106.9050916, 0.51839, 107}}, {109, {108.9047553, 0.48161, 109}}}},
      {48, "Cd", "Cadmium", 12, 5, 'd', 8, 112.414,
       1.69, 0.0, 1.48, 1.71, 1.58, 1040.0, 594.26, 8.64,
       "[Kr] 4d10 5s2", "2*",
       {8.9938, 16.908, 37.48},
       {{106, {105.9064599, 0.0125, 106}}, {108, {107.9041834, 0.0089, 108}}, {110, {109.90300661, 0.1249, 110}},
        {111, {110.90418287, 0.128, 111}}, {112, {111.90276287, 0.2413, 112}}, {113, {112.90440813, 0.1222, 113}},
        {114, {113.90336509, 0.2873, 114}}, {116, {115.90476315, 0.0749, 116}}}},
      {49, "In", "Indium", 13, 5, 'p', 7, 114.818,
       1.78, 0.404, 1.44, 2.0, 1.93, 2350.0, 429.78, 7.31,
       "[Kr] 4d10 5s2 5p", "3*",
       {5.7864, 18.869, 28.03, 55.45},
       {{113, {112.90406184, 0.0429, 113}}, {115, {114.903878776, 0.9571, 115}}}},
      {50, "Sn", "Tin", 14, 5, 'p', 7, 118.71,
       1.96, 1.112066, 1.41, 1.72, 2.17, 2876.0, 505.12, 7.29,
       "[Kr] 4d10 5s2 5p2", "4*, 2*",
       {7.3439, 14.632, 30.502, 40.734, 72.28},
       {{112, {111.90482387, 0.0097, 112}}, {114, {113.9027827, 0.0066, 114}}, {115, {114.903344699, 0.0034, 115}},
        {116, {115.9017428, 0.1454, 116}}, {117, {116.90295398, 0.0768, 117}}, {118, {117.90160657, 0.2422, 118}},
        {119, {118.90331117, 0.0859, 119}}, {120, {119.90220163, 0.3258, 120}}, {122, {121.9034438, 0.0463, 122}},
        {124, {123.9052766, 0.0579, 124}}}},
      {51, "Sb", "Antimony", 15, 5, 'p', 5, 121.76,
       2.05, 1.047401, 1.4, 1.53, 0.0, 1860.0, 903.91, 6.69,
       "[Kr] 4d10 5s2 5p3", "5, 3*, -3",
       {8.6084, 16.53, 25.3, 44.2, 56.0, 108.0},
       {{121, {120.903812, 0.5721, 121}}, {123, {122.9042132, 0.4279, 123}}}},
      {52, "Te", "Tellurium", 16, 5, 'p', 5, 127.6,
       2.1, 1.970875, 1.36, 1.42, 2.06, 1261.0, 722.72, 6.25,
       "[Kr] 4d10 5s2 5p4", "6, 4*, -2",
       {9.0096, 18.6, 27.96, 37.41, 58.75, 70.7,
        137.0},
       {{120, {119.9040593, 0.0009, 120}}, {122, {121.9030435, 0.0255, 122}}, {123, {122.9042698, 0.0089, 123}},
        {124, {123.9028171, 0.0474, 124}}, {125, {124.9044299, 0.0707, 125}}, {126, {125.9033109, 0.1884, 126}},
        {128, {127.90446128, 0.3174, 128}}, {130, {129.906222748, 0.3408, 130}}}},
      {53, "I", "Iodine", 17, 5, 'p', 6, 126.90447,
       2.66, 3.059038, 1.33, 1.32, 1.98, 457.5, 386.7, 4.94,
       "[Kr] 4d10 5s2 5p5", "7, 5, 1, -1*",
       {10.4513, 19.131, 33.0},
       {{127, {126.9044719, 1.0, 127}}}},
      {54, "Xe", "Xenon", 18, 5, 'p', 2, 131.293,
       0.0, 0.0, 1.31, 1.24, 2.16, 165.1, 161.39, 4.49,
       "[Kr] 4d10 5s2 5p6", "2, 4, 6",
       {12.1298, 21.21, 32.1},
       {{124, {123.905892, 0.000952, 124}}, {126, {125.9042983, 0.00089, 126}}, {128, {127.903531, 0.019102, 128}},
        {129, {128.9047808611, 0.264006, 129}}, {130, {129.903509349, 0.04071, 130}}, {131, {130.90508406, 0.212324, 131}},
        {132, {131.9041550856, 0.269086, 132}}, {134, {133.90539466, 0.104357, 134}}, {136, {135.907214484, 0.088573, 136}}}},
      {55, "Cs", "Caesium", 1, 6, 's', 3, 132.90545196,
       0.79, 0.471626, 2.35, 3.34, 0.0, 944.0, 301.54, 1.9,
       "[Xe] 6s", "1*",
       {3.8939, 25.1},
       {{133, {132.905451961, 1.0, 133}}}},
      {56, "Ba", "Barium", 2, 6, 's', 4, 137.327,
       0.89, 0.14462, 1.98, 2.78, 0.0, 2078.0, 1002.0, 3.65,
       "[Xe] 6s2", "2*",
       {5.2117, 100.004},
       {{130, {129.9063207, 0.00106, 130}}, {132, {131.9050611, 0.00101, 132}}, {134, {133.90450818, 0.02417, 134}},
        {135, {134.90568838, 0.06592, 135}}, {136, {135.90457573, 0.07854, 136}}, {137, {136.90582714, 0.11232, 137}},
        {138, {137.905247, 0.71698, 138}}}},
      {57, "La", "Lanthanum", 3, 6, 'f', 9, 138.90547,
       1.1, 0.47, 1.69, 2.74, 0.0, 3737.0, 1191.0, 6.16,
       "[Xe] 5d 6s2", "3*",
       {5.5769, 11.06, 19.175},
       {{138, {137.9071149, 0.0008881, 138}}, {139, {138.9063563, 0.9991119, 139}}}},
      {58, "Ce", "Cerium", 3, 6, 'f', 9, 140.116,
       1.12, 0.5, 1.65, 2.7, 0.0, 3715.0, 1071.0, 6.77,
       "[Xe] 4f 5d 6s2", "4, 3*",
       {5.5387, 10.85, 20.2, 36.72},
       {{136, {135.90712921, 0.00185, 136}}, {138, {137.905991, 0.00251, 138}}, {140, {139.9054431, 0.8845, 140}},
        {142, {141.9092504, 0.11114, 142}}}},
      {59, "Pr", "Praseodymium", 3, 6, 'f', 9, 140.90766,
       1.13, 0.5, 1.65, 2.67, 0.0, 3785.0, 1204.0, 6.48,
       "[Xe] 4f3 6s2", "4, 3*",
       {5.473, 10.55, 21.62, 38.95, 57.45},
       {{141, {140.9076576, 1.0, 141}}}},
      {60, "Nd", "Neodymium", 3, 6, 'f', 9, 144.242,
       1.14, 0.5, 1.64, 2.64, 0.0, 3347.0, 1294.0, 7.0,
       "[Xe] 4f4 6s2", "3*",
       {5.525, 10.72},
       {{142, {141.907729, 0.27152, 142}}, {143, {142.90982, 0.12174, 143}}, {144, {143.910093, 0.23798, 144}},
        {145, {144.9125793, 0.08293, 145}}, {146, {145.9131226, 0.17189, 146}}, {148, {147.9168993, 0.05756, 148}},
        {150, {149.9209022, 0.05638, 150}}}},
      {61, "Pm", "Promethium", 3, 6, 'f', 9, 144.9128,
       1.13, 0.5, 1.63, 2.62, 0.0, 3273.0, 1315.0, 7.22,
       "[Xe] 4f5 6s2", "3*",
       {5.582, 10.9},
       {{145, {144.9127559, 1.0, 145}}}},
      {62, "Sm", "Samarium", 3, 6, 'f', 9, 150.36,
       1.17, 0.5, 1.62, 2.59, 0.0, 2067.0, 1347.0, 7.54,
       "[Xe] 4f6 6s2", "3*, 2",
       {5.6437, 11.07},
       {{144, {143.9120065, 0.0307, 144}}, {147, {146.9149044, 0.1499, 147}}, {148, {147.9148292, 0.1124, 148}},
        {149, {148.9171921, 0.1382, 149}}, {150, {149.9172829, 0.0738, 150}}, {152, {151.9197397, 0.2675, 152}},
        {154, {153.9222169, 0.2275, 154}}}},
      {63, "Eu", "Europium", 3, 6, 'f', 9, 151.964,
       1.2, 0.5, 1.85, 2.56, 0.0, 1800.0, 1095.0, 5.25,
       "[Xe] 4f7 6s2", "3*, 2",
       {5.6704, 11.25},
       {{151, {150.9198578, 0.4781, 151}}, {153, {152.921238, 0.5219, 153}}}},
      {64, "Gd", "Gadolinium", 3, 6, 'f', 9, 157.25,
       1.2, 0.5, 1.61, 2.54, 0.0, 3545.0, 1585.0, 7.89,
       "[Xe] 4f7 5d 6s2", "3*",
       {6.1498, 12.1},
       {{152, {151.9197995, 0.002, 152}}, {154, {153.9208741, 0.0218, 154}}, {155, {154.9226305, 0.148, 155}},
        {156, {155.9221312, 0.2047, 156}}, {157, {156.9239686, 0.1565, 157}}, {158, {157.9241123, 0.2484, 158}},
        {160, {159.9270624, 0.2186, 160}}}},
      {65, "Tb", "Terbium", 3, 6, 'f', 9, 158.92535,
       1.2, 0.5, 1.59, 2.51, 0.0, 3500.0, 1629.0, 8.25,
       "[Xe] 4f9 6s2", "4, 3*",
       {5.8638, 11.52},
       {{159, {158.9253547, 1.0, 159}}}},
      {66, "Dy", "Dysprosium", 3, 6, 'f', 9, 162.5,
       1.22, 0.5, 1.59, 2.49, 0.0, 2840.0, 1685.0, 8.56,
       "[Xe] 4f10 6s2", "3*",
       {5.9389, 11.67},
       {{156, {155.9242847, 0.00056, 156}}, {158, {157.9244159, 0.00095, 158}}, {160, {159.9252046, 0.02329, 160}},
        {161, {160.9269405, 0.18889, 161}}, {162, {161.9268056, 0.25475, 162}}, {163, {162.9287383, 0.24896, 163}},
        {164, {163.9291819, 0.2826, 164}}}},
      {67, "Ho", "Holmium", 3, 6, 'f', 9, 164.93033,
       1.23, 0.5, 1.58, 2.47, 0.0, 2968.0, 1747.0, 8.78,
       "[Xe] 4f11 6s2", "3*",
       {6.0215, 11.8},
       {{165, {164.9303288, 1.0, 165}}}},
      {68, "Er", "Erbium", 3, 6, 'f', 9, 167.259,
       1.24, 0.5, 1.57, 2.45, 0.0, 3140.0, 1802.0, 9.05,
       "[Xe] 4f12 6s2", "3*",
       {6.1077, 11.93},
       {{162, {161.9287884, 0.00139, 162}}, {164, {163.9292088, 0.01601, 164}}, {166, {165.9302995, 0.33503, 166}},
        {167, {166.9320546, 0.22869, 167}}, {168, {167.9323767, 0.26978, 168}}, {170, {169.9354702, 0.1491, 170}}}},
      {69, "Tm", "Thulium", 3, 6, 'f', 9, 168.93422,
       1.25, 0.5, 1.56, 2.42, 0.0, 2223.0, 1818.0, 9.32,
       "[Xe] 4f13 6s2", "3*, 2",
       {6.1843, 12.05, 23.71},
       {{169, {168.9342179, 1.0, 169}}}},
      {70, "Yb", "Ytterbium", 3, 6, 'f', 9, 173.054,
       1.1, 0.5, 1.74, 2.4, 0.0, 1469.0, 1092.0, 9.32,
       "[Xe] 4f14 6s2", "3*, 2",
       {6.2542, 12.17, 25.2},
       {{168, {167.9338896, 0.00123, 168}}, {170, {169.9347664, 0.02982, 170}}, {171, {170.9363302, 0.1409, 171}},
        {172, {171.9363859, 0.2168, 172}}, {173, {172.9382151, 0.16103, 173}}, {174, {173.9388664, 0.32026, 174}},
        {176, {175.9425764, 0.12996, 176}}}},
      {71, "Lu", "Lutetium", 3, 6, 'd', 9, 174.9668,
       1.27, 0.5, 1.56, 2.25, 0.0, 3668.0, 1936.0, 9.84,
       "[Xe] 4f14 5d 6s2", "3*",
       {5.4259, 13.9},
       {{175, {174.9407752, 0.97401, 175}}, {176, {175.9426897, 0.02599, 176}}}},
      {72, "Hf", "Hafnium", 4, 6, 'd', 8, 178.49,
       1.3, 0.0, 1.44, 2.16, 0.0, 4875.0, 2504.0, 13.31,
       "[Xe] 4f14 5d2 6s2", "4*",
       {6.8251, 14.9, 23.3, 33.3},
       {{174, {173.9400461, 0.0016, 174}}, {176, {175.9414076, 0.0526, 176}}, {177, {176.9432277, 0.186, 177}},
        {178, {177.9437058, 0.2728, 178}}, {179, {178.9458232, 0.1362, 179}}, {180, {179.946557, 0.3508, 180}}}},
      {73, "Ta", "Tantalum", 5, 6, 'd', 8, 180.94788,
       1.5, 0.322, 1.34, 2.09, 0.0, 5730.0, 3293.0, 16.68,
       "[Xe] 4f14 5d3 6s2", "5*",
       {7.5496},
       {{180, {179.9474648, 0.0001201, 180}}, {181, {180.9479958, 0.9998799, 181}}}},
      {74, "W", "Tungsten", 6, 6, 'd', 8, 183.84,
       2.36, 0.815, 1.3, 2.02, 0.0, 5825.0, 3695.0, 19.26,
       "[Xe] 4f14 5d4 6s2", "6*, 5, 4, 3, 2, 0",
       {7.864},
       {{180, {179.9467108, 0.0012, 180}}, {182, {181.94820394, 0.265, 182}}, {183, {182.95022275, 0.1431, 183}},
        {184, {183.95093092, 0.3064, 184}}, {186, {185.9543628, 0.2843, 186}}}},
      {75, "Re", "Rhenium", 7, 6, 'd', 8, 186.207,
       1.9, 0.15, 1.28, 1.97, 0.0, 5870.0, 3455.0, 21.03,
       "[Xe] 4f14 5d5 6s2", "7, 6, 4, 2, -1",
       {7.8335},
       {{185, {184.9529545, 0.374, 185}}, {187, {186.9557501, 0.626, 187}}}},
      {76, "Os", "Osmium", 8, 6, 'd', 8, 190.23,
       2.2, 1.0778, 1.26, 1.92, 0.0, 5300.0, 3300.0, 22.61,
       "[Xe] 4f14 5d6 6s2", "8, 6, 4*, 3, 2, 0, -2",
       {8.4382},
       {{184, {183.9524885, 0.0002, 184}}, {186, {185.953835, 0.0159, 186}}, {187, {186.9557474, 0.0196, 187}},
        {188, {187.9558352, 0.1324, 188}}, {189, {188.9581442, 0.1615, 189}}, {190, {189.9584437, 0.2626, 190}},
        {192, {191.961477, 0.4078, 192}}}},
      {77, "Ir", "Iridium", 9, 6, 'd', 8, 192.217,
       2.2, 1.56436, 1.27, 1.87, 0.0, 4700.0, 2720.0, 22.65,
       "[Xe] 4f14 5d7 6s2", "6, 4*, 3, 2, 1*, 0, -1",
       {8.967},
       {{191, {190.9605893, 0.373, 191}}, {193, {192.9629216, 0.627, 193}}}},
      {78, "Pt", "Platinum", 10, 6, 'd', 8, 195.084,
       2.28, 2.1251, 1.3, 1.83, 1.75, 4100.0, 2042.1, 21.45,
       "[Xe] 4f14 5d9 6s", "4*, 2*, 0",
       {8.9588, 18.563},
       {{190, {189.9599297, 0.00012, 190}}, {192, {191.9610387, 0.00782, 192}}, {194, {193.9626809, 0.3286, 194}},
        {195, {194.9647917, 0.3378, 195}}, {196, {195.96495209, 0.2521, 196}}, {198, {197.9678949, 0.07356, 198}}}},
      {79, "Au", "Gold", 11, 6, 'd', 8, 196.966569,
       2.54, 2.30861, 1.34, 1.79, 1.66, 3130.0, 1337.58, 19.32,
       "[Xe] 4f14 5d10 6s", "3*, 1",
       {9.2255, 20.5},
       {{197, {196.96656879, 1.0, 197}}}},
      {80, "Hg", "Mercury", 12, 6, 'd', 8, 200.592,
       2.0, 0.0, 1.49, 1.76, 0.0, 629.88, 234.31, 13.55,
       "[Xe] 4f14 5d10 6s2", "2*, 1",
       {10.4375, 18.756, 34.2},
       {{196, {195.9658326, 0.0015, 196}}, {198, {197.9667686, 0.0997, 198}}, {199, {198.96828064, 0.1687, 199}},
        {200, {199.96832659, 0.231, 200}}, {201, {200.97030284, 0.1318, 201}}, {202, {201.9706434, 0.2986, 202}},
        {204, {203.97349398, 0.0687, 204}}}},
      {81, "Tl", "Thallium", 13, 6, 'p', 7, 204.3834,
       2.04, 0.377, 1.48, 2.08, 1.96, 1746.0, 577.0, 11.85,
       "[Xe] 4f14 5d10 6s2 6p", "3, 1*",
       {6.1082, 20.428, 29.83},
       {{203, {202.9723446, 0.2952, 203}}, {205, {204.9744278, 0.7048, 205}}}},
      {82, "Pb", "Lead", 14, 6, 'p', 7, 207.2,
       2.33, 0.364, 1.47, 1.81, 2.02, 2023.0, 600.65, 11.34,
       "[Xe] 4f14 5d10 6s2 6p2", "4, 2*",
       {7.4167, 15.032, 31.937, 42.32, 68.8},
       {{204, {203.973044, 0.014, 204}}, {206, {205.9744657, 0.241, 206}}, {207, {206.9758973, 0.221, 207}},
        {208, {207.9766525, 0.524, 208}}}},
      {83, "Bi", "Bismuth", 15, 6, 'p', 7, 208.9804,
       2.02, 0.942363, 1.46, 1.63, 0.0, 1837.0, 544.59, 9.8,
       "[Xe] 4f14 5d10 6s2 6p3", "5, 3*",
       {7.2855, 16.69, 25.56, 45.3, 56.0, 88.3},
       {{209, {208.9803991, 1.0, 209}}}},
      {84, "Po", "Polonium", 16, 6, 'p', 5, 208.9824,
       2.0, 1.9, 1.46, 1.53, 0.0, 0.0, 527.0, 9.2,
       "[Xe] 4f14 5d10 6s2 6p4", "6, 4*, 2",
       {8.414},
       {{209, {208.9824308, 1.0, 209}}}},
      {85, "At", "Astatine", 17, 6, 'p', 6, 209.9871,
       2.2, 2.8, 1.45, 1.43, 0.0, 610.0, 575.0, 0.0,
       "[Xe] 4f14 5d10 6s2 6p5", "7, 5, 3, 1, -1*",
       {},
       {{210, {209.9871479, 1.0, 210}}}},
      {86, "Rn", "Radon", 18, 6, 'p', 2, 222.0176,
       0.0, 0.0, 0.0, 1.34, 0.0, 211.4, 202.0, 9.23,
       "[Xe] 4f14 5d10 6s2 6p6", "2*",
       {10.7485},
       {{222, {222.0175782, 1.0, 222}}}},
      {87, "Fr", "Francium", 1, 7, 's', 3, 223.0197,
       0.7, 0.0, 0.0, 0.0, 0.0, 950.0, 300.0, 0.0,
       "[Rn] 7s", "1*",
       {4.0727},
       {{223, {223.019736, 1.0, 223}}}},
      {88, "Ra", "Radium", 2, 7, 's', 4, 226.0254,
       0.9, 0.0, 0.0, 0.0, 0.0, 1413.0, 973.0, 5.5,
       "[Rn] 7s2", "2*",
       {5.2784, 10.147},
       {{226, {226.0254103, 1.0, 226}}}},
      {89, "Ac", "Actinium", 3, 7, 'f', 10, 227.0278,
       1.1, 0.0, 0.0, 0.0, 0.0, 3470.0, 1324.0, 10.07,
       "[Rn] 6d 7s2", "3*",
       {5.17, 12.1},
       {{227, {227.0277523, 1.0, 227}}}},
      {90, "Th", "Thorium", 3, 7, 'f', 10, 232.0377,
       1.3, 0.0, 1.65, 0.0, 0.0, 5060.0, 2028.0, 11.72,
       "[Rn] 6d2 7s2", "4*",
       {6.3067, 11.5, 20.0, 28.8},
       {{232, {232.0380558, 1.0, 232}}}},
      {91, "Pa", "Protactinium", 3, 7, 'f', 10, 231.03588,
       1.5, 0.0, 0.0, 0.0, 0.0, 4300.0, 1845.0, 15.37,
       "[Rn] 5f2 6d 7s2", "5*, 4",
       {5.89},
       {{231, {231.0358842, 1.0, 231}}}},
      {92, "U", "Uranium", 3, 7, 'f', 10, 238.02891,
       1.38, 0.0, 1.42, 0.0, 1.86, 4407.0, 1408.0, 18.97,
       "[Rn] 5f3 6d 7s2", "6*, 5, 4, 3",
       {6.1941},
       {{234, {234.0409523, 5.4e-05, 234}}, {235, {235.0439301, 0.007204, 235}}, {238, {238.0507884, 0.992742, 238}}}},
      {93, "Np", "Neptunium", 3, 7, 'f', 10, 237.0482,
       1.36, 0.0, 0.0, 0.0, 0.0, 4175.0, 912.0, 20.48,
       "[Rn] 5f4 6d 7s2", "6, 5*, 4, 3",
       {6.2657},
       {{237, {237.0481736, 1.0, 237}}}},
      {94, "Pu", "Plutonium", 3, 7, 'f', 10, 244.0642,
       1.28, 0.0, 0.0, 0.0, 0.0, 3505.0, 913.0, 19.74,
       "[Rn] 5f6 7s2", "6, 5, 4*, 3",
       {6.026},
       {{244, {244.0642053, 1.0, 244}}}},
      {95, "Am", "Americium", 3, 7, 'f', 10, 243.0614,
       1.3, 0.0, 0.0, 0.0, 0.0, 2880.0, 1449.0, 13.67,
       "[Rn] 5f7 7s2", "6, 5, 4, 3*",
       {5.9738},
       {{243, {243.0613813, 1.0, 243}}}},
      {96, "Cm", "Curium", 3, 7, 'f', 10, 247.0704,
       1.3, 0.0, 0.0, 0.0, 0.0, 0.0, 1620.0, 13.51,
       "[Rn] 5f7 6d 7s2", "4, 3*",
       {5.9914},
       {{247, {247.0703541, 1.0, 247}}}},
      {97, "Bk", "Berkelium", 3, 7, 'f', 10, 247.0703,
       1.3, 0.0, 0.0, 0.0, 0.0, 0.0, 1258.0, 13.25,
       "[Rn] 5f9 7s2", "4, 3*",
       {6.1979},
       {{247, {247.0703073, 1.0, 247}}}},
      {98, "Cf", "Californium", 3, 7, 'f', 10, 251.0796,
       1.3, 0.0, 0.0, 0.0, 0.0, 0.0, 1172.0, 15.1,
       "[Rn] 5f10 7s2", "4, 3*",
       {6.2817},
       {{251, {251.0795886, 1.0, 251}}}},
      {99, "Es", "Einsteinium", 3, 7, 'f', 10, 252.083,
       1.3, 0.0, 0.0, 0.0, 0.0, 0.0, 1130.0, 0.0,
       "[Rn] 5f11 7s2", "3*",
       {6.42},
       {{252, {252.08298, 1.0, 252}}}},
      {100, "Fm", "Fermium", 3, 7, 'f', 10, 257.0951,
       1.3, 0.0, 0.0, 0.0, 0.0, 0.0, 1800.0, 0.0,
       "[Rn] 5f12 7s2", "3*",
       {6.5},
       {{257, {257.0951061, 1.0, 257}}}},
      {101, "Md", "Mendelevium", 3, 7, 'f', 10, 258.0984,
       1.3, 0.0, 0.0, 0.0, 0.0, 0.0, 1100.0, 0.0,
       "[Rn] 5f13 7s2", "3*",
       {6.58},
       {{258, {258.0984315, 1.0, 258}}}},
      {102, "No", "Nobelium", 3, 7, 'f', 10, 259.101,
       1.3, 0.0, 0.0, 0.0, 0.0, 0.0, 1100.0, 0.0,
       "[Rn] 5f14 7s2", "3, 2*",
       {6.65},
       {{259, {259.10103, 1.0, 259}}}},
      {103, "Lr", "Lawrencium", 3, 7, 'd', 10, 262.1096,
       1.3, 0.0, 0.0, 0.0, 0.0, 0.0, 1900.0, 0.0,
       "[Rn] 5f14 6d 7s2", "3*",
       {4.9},
       {{262, {262.10961, 1.0, 262}}}},
      {104, "Rf", "Rutherfordium", 4, 7, 'd', 8, 267.1218,
       0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0,
       "[Rn] 5f14 6d2 7s2", "*",
       {6.0},
       {{267, {267.12179, 1.0, 267}}}},
      {105, "Db", "Dubnium", 5, 7, 'd', 8, 268.1257,
       0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0,
       "[Rn] 5f14 6d3 7s2", "*",
       {},
       {{268, {268.12567, 1.0, 268}}}},
      {106, "Sg", "Seaborgium", 6, 7, 'd', 8, 271.1339,
       0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0,
       "[Rn] 5f14 6d4 7s2", "*",
       {},
       {{271, {271.13393, 1.0, 271}}}},
      {107, "Bh", "Bohrium", 7, 7, 'd', 8, 272.1383,
       0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0,
       "[Rn] 5f14 6d5 7s2", "*",
       {},
       {{272, {272.13826, 1.0, 272}}}},
      {108, "Hs", "Hassium", 8, 7, 'd', 8, 270.1343,
       0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0,
       "[Rn] 5f14 6d6 7s2", "*",
       {},
       {{270, {270.13429, 1.0, 270}}}},
      {109, "Mt", "Meitnerium", 9, 7, 'd', 8, 276.1516,
       0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0,
       "[Rn] 5f14 6d7 7s2", "*",
       {},
       {{276, {276.15159, 1.0, 276}}}},
      };
    }

  }  // namespace

  auto elements() -> ElementTable const & {
    static ElementTable const table{build_elements()};
    return table;
  }

}  // namespace mol::data
