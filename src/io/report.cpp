// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include "libmol/io/report.hpp"

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>
#include <vector>

#include "libmol/formula/formula.hpp"
#include "libmol/mass/composition.hpp"
#include "libmol/mass/spectrum.hpp"
#include "libmol/utility/core.hpp"

namespace mol::io {

  namespace {

    auto join(std::vector<std::string> const &lines) -> std::string {
      //
      std::string out;

      for (std::string const &line : lines) {
        if (!out.empty()) {
          out += '\n';
        }
        out += line;
      }

      return out;
    }

  }  // namespace

  auto analyze(std::string_view text, AnalyzeOptions const &opt) -> std::string {
    //
    std::vector<std::string> lines;

    try {
      formula::Formula const f{text, opt.formula};

      dprint(opt.debug, "Normalized '{}' to '{}'\n", text, f.formula());

      if (text.size() <= 50) {
        lines.push_back(fmt::format("Formula: {}", text));
      }

      if (f.hill() != text) {
        lines.push_back(fmt::format("Hill notation: {}", f.hill()));
      }

      if (f.empirical() != f.hill()) {
        lines.push_back(fmt::format("Empirical formula: {}", f.empirical()));
      }

      int prec = precision_digits(f.mass(), 9);

      data::Isotope const &iso = f.isotope();

      lines.push_back("");
      lines.push_back(fmt::format("Nominal mass: {}", iso.massnumber));
      lines.push_back(fmt::format("Average mass: {:.{}f}", f.mass(), prec));
      lines.push_back(fmt::format("Monoisotopic mass: {:.{}f} ({:.3f}%)", iso.mass, prec, iso.abundance * 100));

      if (f.charge() != 0) {
        lines.push_back(fmt::format("m/z: {:.{}f}", f.mz(), prec));
      }

      mass::Spectrum const *spectrum = nullptr;

      if (f.atoms() < opt.maxatoms) {
        //
        mass::Spectrum::Options sopt;

        sopt.min_intensity = opt.min_intensity;

        spectrum = &f.spectrum(sopt);

        dprint(opt.debug, "Spectrum of {} atoms has {} bins\n", f.atoms(), spectrum->size());

        if (!spectrum->empty()) {
          //
          mass::SpectrumEntry const &peak = spectrum->peak();

          lines.push_back(fmt::format("Most abundant mass: {:.{}f} ({:.3f}%)", peak.mass, prec, peak.fraction * 100));
          lines.push_back(fmt::format("Mean of distribution: {:.{}f}", spectrum->mean(), prec));
        }
      } else {
        dprint(opt.debug, "Skipped spectrum, {} atoms exceeds limit of {}\n", f.atoms(), opt.maxatoms);
      }

      lines.push_back(fmt::format("Number of atoms: {}", f.atoms()));

      if (mass::Composition const &comp = f.composition(); !comp.empty()) {
        lines.push_back("");
        lines.push_back("Elemental Composition");
        lines.push_back("");
        lines.push_back(comp.to_string());
      }

      if (spectrum && !spectrum->empty()) {
        lines.push_back("");
        lines.push_back("Mass Distribution");
        lines.push_back("");
        lines.push_back(spectrum->to_string());
      }

    } catch (std::exception const &err) {
      lines.push_back(fmt::format("Error: {}", err.what()));
    }

    return join(lines);
  }

}  // namespace mol::io
