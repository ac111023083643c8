/*
 * units.hpp
 *
 * Physical constants and the brightness temperature to flux density
 * conversion used to express visibilities in Jansky.
 */

#ifndef EORSKY_UNITSH
#define EORSKY_UNITSH

#include <cmath>
#include <vector>

/* speed of light, m/s */
#define C_LIGHT_MS (299792458.0)
/* speed of light, cm/s */
#define C_LIGHT_CMS (C_LIGHT_MS * 100.0)
/* Boltzmann constant, erg/K */
#define K_BOLTZ_CGS (1.380658e-16)

#define DEG2RAD (M_PI / 180.0)
#define RAD2DEG (180.0 / M_PI)

namespace Units
{ //begin namespace

/* [K sr] / [Jy] at frequency f (Hz) for a reference area bm (sr). */
double jy2Tstr(double f, double bm = 1.0);

/* same as above, for every frequency in f. */
std::vector<double> jy2Tstr(const std::vector<double>& f, double bm = 1.0);

/* wavelength (m) of frequency f (Hz). */
double wavelength(double f);

} // end namespace

#endif
