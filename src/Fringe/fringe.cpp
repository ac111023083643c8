#include "Fringe/fringe.hpp"
#include "Units/units.hpp"

#include <cmath>
#include <stdexcept>

std::vector< std::complex<double> > Fringe::make_fringe
(
    const std::vector<double>& az,
    const std::vector<double>& za,
    const std::vector<double>& freqs,
    const double enu[3],
    bool degrees
)
{
    size_t npix = az.size();
    size_t nfreqs = freqs.size();
    double conv = degrees ? DEG2RAD : 1.0;
    std::vector<double> inv_lambda(nfreqs);
    std::vector< std::complex<double> > fringe(npix * nfreqs);

    if(za.size() != npix) {
        throw std::invalid_argument("[ERROR] az and za must have the same size.");
    }
    for(size_t f = 0; f < nfreqs; f++) {
        inv_lambda[f] = 1.0 / Units::wavelength(freqs[f]);
    }
    for(size_t p = 0; p < npix; p++)
    {
        double a = az[p] * conv;
        double z = za[p] * conv;
        double pos_l = sin(a) * sin(z);
        double pos_m = cos(a) * sin(z);
        double pos_n = cos(z);
        // baseline . direction, metres
        double bdotl = enu[0] * pos_l + enu[1] * pos_m + enu[2] * pos_n;
        for(size_t f = 0; f < nfreqs; f++)
        {
            double phase = 2.0 * M_PI * bdotl * inv_lambda[f];
            fringe[p * nfreqs + f] = std::complex<double>(cos(phase), sin(phase));
        }
    }
    return fringe;
}
