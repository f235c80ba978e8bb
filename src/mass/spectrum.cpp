// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/mass/spectrum.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "libmol/data/elements.hpp"
#include "libmol/formula/parse.hpp"
#include "libmol/utility/core.hpp"

namespace mol::mass {

  namespace {

    struct Bin {
      double mass = 0.0;
      double fraction = 0.0;
    };

    using Bins = std::map<int, Bin>;

    struct Peak {
      int massnumber;
      double mass;
      double abundance;
    };

    /**
     * @brief Fold every peak into every bin with at least ``min_fraction``.
     */
    auto convolve(Bins const &bins, std::vector<Peak> const &peaks, double min_fraction) -> Bins {
      //
      Bins out;

      for (auto const &[key, bin] : bins) {
        //
        if (bin.fraction < min_fraction) {
          continue;
        }

        for (Peak const &p : peaks) {
          //
          double f = bin.fraction * p.abundance;
          double m = bin.mass + p.mass;

          Bin &dst = out[key + p.massnumber];

          if (dst.fraction > 0) {
            dst.mass = (dst.fraction * dst.mass + f * m) / (dst.fraction + f);
            dst.fraction += f;
          } else {
            dst = {m, f};
          }
        }
      }

      return out;
    }

  }  // namespace

  Spectrum::Spectrum(formula::Elements const &elements, int charge, Options const &opt) : m_charge(charge) {
    //
    verify(opt.min_fraction >= 0 && opt.min_fraction < 1, "Minimum fraction must be in [0, 1), got {}", opt.min_fraction);

    if (elements.empty()) {
      return;
    }

    formula::Count heaviest = 0;

    for (auto const &[symbol, isotopes] : elements) {
      //
      int top = data::elements()[symbol].isotopes.rbegin()->first;

      for (auto const &[massnumber, count] : isotopes) {
        heaviest += (massnumber == 0 ? top : massnumber) * count;
      }
    }

    verify(heaviest <= std::numeric_limits<int>::max(), "Mass number {} is too large for a mass distribution", heaviest);

    Bins bins{{0, {0.0, 1.0}}};

    for (auto const &[symbol, isotopes] : elements) {
      //
      data::Element const &ele = data::elements()[symbol];

      std::vector<Peak> natural;

      for (auto const &[massnumber, iso] : ele.isotopes) {
        natural.push_back({massnumber, iso.mass, iso.abundance});
      }

      for (auto const &[massnumber, count] : isotopes) {
        if (massnumber != 0) {
          //
          double mass = ele.isotope(massnumber).mass * static_cast<double>(count);

          bins = convolve(bins, {{safe_cast<int>(massnumber * count), mass, 1.0}}, opt.min_fraction);
        } else {
          for (formula::Count i = 0; i < count; ++i) {
            bins = convolve(bins, natural, opt.min_fraction);
          }
        }
      }
    }

    double max_fraction = 0.0;

    for (auto const &[key, bin] : bins) {
      max_fraction = std::max(max_fraction, bin.fraction);
    }

    // Everything pruned.
    if (max_fraction <= 0) {
      return;
    }

    int divisor = std::max(1, std::abs(charge));

    for (auto const &[key, bin] : bins) {
      //
      double mass = bin.mass - data::electron.mass * charge;
      double intensity = bin.fraction / max_fraction * 100.0;

      if (opt.min_intensity && intensity < *opt.min_intensity) {
        continue;
      }

      m_entries.push_back({key, mass, bin.fraction, intensity, mass / divisor});
    }
  }

  auto Spectrum::find(int massnumber) const -> SpectrumEntry const * {
    //
    auto it = std::lower_bound(m_entries.begin(), m_entries.end(), massnumber, [](SpectrumEntry const &e, int key) {
      return e.massnumber < key;
    });

    if (it != m_entries.end() && it->massnumber == massnumber) {
      return &*it;
    }

    return nullptr;
  }

  auto Spectrum::at(int massnumber) const -> SpectrumEntry const & {
    if (SpectrumEntry const *entry = find(massnumber)) {
      return *entry;
    }
    throw error("No bin with mass number {} in spectrum", massnumber);
  }

  auto Spectrum::peak() const -> SpectrumEntry const & {
    //
    verify(!m_entries.empty(), "Peak of an empty spectrum");

    auto it = std::max_element(m_entries.begin(), m_entries.end(), [](SpectrumEntry const &a, SpectrumEntry const &b) {
      return a.fraction < b.fraction;
    });

    return *it;
  }

  auto Spectrum::mean() const -> double {
    //
    double sum = 0.0;

    for (SpectrumEntry const &e : m_entries) {
      sum += e.mass * e.fraction;
    }

    return sum;
  }

  auto Spectrum::range() const -> std::pair<int, int> {
    //
    verify(!m_entries.empty(), "Range of an empty spectrum");

    return {m_entries.front().massnumber, m_entries.back().massnumber};
  }

  auto Spectrum::to_string() const -> std::string {
    //
    if (m_entries.empty()) {
      return "";
    }

    int width = std::max(1, static_cast<int>(fmt::format("{}", m_entries.back().massnumber).size()));

    int prec = precision_digits(peak().mass, 9);

    std::string table = fmt::format("{:<{}}  {:>13}  {:>10}  {:>11}", "A", width, "Relative mass", "Fraction %", "Intensity %");

    if (m_charge != 0) {
      table += fmt::format("  {:>13}", "m/z");
    }

    for (SpectrumEntry const &e : m_entries) {
      //
      table += fmt::format("\n{:<{}}  {:>13.{}f}  {:>10.6f}  {:>11.6f}", e.massnumber, width, e.mass, prec, e.fraction * 100, e.intensity);

      if (m_charge != 0) {
        table += fmt::format("  {:>13.{}f}", e.mz, prec);
      }
    }

    return table;
  }

}  // namespace mol::mass
