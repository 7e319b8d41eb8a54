/**
 * ==========================================================================
 * MinusHalf: automated minus-half self-energy corrections
 *
 * Copyright (c) 2022-2025 The MinusHalf developer team
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 * 
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 * ==========================================================================
 */



#ifndef ATOMIC_ATOMIC_POTENTIAL_HPP
#define ATOMIC_ATOMIC_POTENTIAL_HPP

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>
#include "nda/nda.hpp"
#include "configuration.hpp"
#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "utilities/integration.hpp"
#include "dft/concepts.hpp"
#include "atomic/vtotal.h"
#include "atomic/trimming.hpp"

namespace atomic
{

/*
 * Self-energy correction of the local part of a pseudopotential.
 *
 * The self-energy potential V_S = V_occ - V_ae is the difference between the spin down
 * potentials of the atom with and without the fractional occupation. It is trimmed at
 * the cut radius, converted to eV and Angstrom and added, in reciprocal space, to the
 * local potential of the DFT pseudopotential file.
 */
template<dft::PotentialFile PotFile>
class atomic_potential
{
public:

  atomic_potential(radial_potential ae, radial_potential occ, PotFile pot) :
    vtotal_ae(std::move(ae)),
    vtotal_occ(std::move(occ)),
    potfile(std::move(pot))
  {
    utils::check<utils::format_error>(vtotal_ae.size() == vtotal_occ.size(),
        "atomic_potential: Radial grids of the reference ({}) and occupied ({}) potentials differ in size.",
        vtotal_ae.size(), vtotal_occ.size());
    for(long i=0; i<vtotal_ae.size(); ++i)
      utils::check<utils::format_error>(std::abs(vtotal_ae.radius(i) - vtotal_occ.radius(i)) <=
                                        1e-8 * std::max(1.0, std::abs(vtotal_ae.radius(i))),
          "atomic_potential: Radial grids of the reference and occupied potentials differ at index {}.", i);
  }

  // V_S on the atomic radial grid (bohr, Ry)
  radial_potential self_energy_potential() const
  {
    return radial_potential{vtotal_ae.radius, nda::array<double,1>(vtotal_occ.potential - vtotal_ae.potential)};
  }

  /*
   * Fourier transform of a radial potential (Angstrom, eV) on the momentum grid of the
   * potential file, q_i = i * q_max / N:
   *   dV(q) = 4 pi \int r^2 V(r) sin(qr)/(qr) dr
   */
  nda::array<double,1> fourier_transform(radial_potential const& v) const
  {
    auto local = potfile.local_potential();
    long nq = local.size();
    double qmax = potfile.maximum_wave_vector();
    nda::array<double,1> dv(nq);
    nda::array<double,1> integrand(v.size());
    for(long iq=0; iq<nq; ++iq) {
      double q = double(iq) * qmax / double(nq);
      for(long i=0; i<v.size(); ++i) {
        double r = v.radius(i);
        double qr = q * r;
        double sinc = (std::abs(qr) < 1e-12 ? 1.0 : std::sin(qr) / qr);
        integrand(i) = r * r * v.potential(i) * sinc;
      }
      dv(iq) = 4.0 * constants::pi * utils::trapezoid_rule_array(v.radius, integrand);
    }
    return dv;
  }

  /**
   * Local potential of the pseudopotential file with the trimmed self-energy added.
   * @param cut - cut radius in Angstrom
   * @param amplitude - decay rate of the trimming function
   * @param is_conduction - conduction band correction
   */
  nda::array<double,1> correct_potential(double cut, double amplitude, bool is_conduction = false) const
  {
    auto trimmed = correct(self_energy_potential(), cut / constants::bohr_to_angstrom, amplitude, is_conduction);
    trimmed.radius *= constants::bohr_to_angstrom;
    trimmed.potential *= constants::rydberg_to_ev;
    app_debug(2, "  atomic_potential: correcting {} with cut: {:.4f} A, amplitude: {}", potfile.name(), cut, amplitude);
    return nda::array<double,1>(potfile.local_potential() + fourier_transform(trimmed));
  }

  std::vector<std::string> get_corrected_file_lines(nda::array<double,1> const& potential) const
  {
    return potfile.corrected_lines(potential);
  }

  PotFile const& potential_file() const { return potfile; }

private:

  radial_potential vtotal_ae;
  radial_potential vtotal_occ;
  PotFile potfile;

};

}

#endif
