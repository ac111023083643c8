/*
 * fringe.hpp
 *
 * Interference pattern of a baseline across the sky.
 */

#ifndef EORSKY_FRINGEH
#define EORSKY_FRINGEH

#include <complex>
#include <vector>

namespace Fringe
{ //begin namespace

/* fringe[p * nfreqs + f] = exp(2 pi i u_f . l_p), where
 *   l_p = (sin az sin za, cos az sin za, cos za) for pixel p and
 *   u_f = enu / wavelength(freqs[f]).
 * az, za in radians unless degrees is true. enu in metres (East, North, Up). */
std::vector< std::complex<double> > make_fringe
(
    const std::vector<double>& az,
    const std::vector<double>& za,
    const std::vector<double>& freqs,
    const double enu[3],
    bool degrees = false
);

} // end namespace

#endif
