#include "units.hpp"

#include <cmath>
#include <stdexcept>

double Units::jy2Tstr(double f, double bm)
/**
 * Returns the conversion factor in [K sr] / [Jy] at frequency f (Hz) for
 * a reference area bm (sr). Dividing a temperature [K] by it gives a
 * flux density [Jy]:
 *
 *   1e-23 * lambda^2 / (2 k_B bm),  lambda in cm.
 *
 * Throws invalid_argument if f or bm are not positive.
 */
{
    double lam;

    if(!(f > 0.0)) {
        throw std::invalid_argument("[ERROR] jy2Tstr: frequency must be positive.");
    }
    if(!(bm > 0.0)) {
        throw std::invalid_argument("[ERROR] jy2Tstr: reference area must be positive.");
    }
    lam = C_LIGHT_CMS / f;
    return 1e-23 * lam * lam / (2.0 * K_BOLTZ_CGS * bm);
}

std::vector<double> Units::jy2Tstr(const std::vector<double>& f, double bm)
{
    std::vector<double> conv(f.size());
    for(size_t i = 0; i < f.size(); i++) {
        conv[i] = jy2Tstr(f[i], bm);
    }
    return conv;
}

double Units::wavelength(double f)
{
    if(!(f > 0.0)) {
        throw std::invalid_argument("[ERROR] frequency must be positive.");
    }
    return C_LIGHT_MS / f;
}
