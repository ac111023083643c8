#include "Baseline/baseline.hpp"
#include "Fringe/fringe.hpp"
#include "Units/units.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

Baseline::Baseline(const double ant1_enu[3], const double ant2_enu[3])
{
    init(ant1_enu, ant2_enu);
}

Baseline::Baseline(const std::vector<double>& ant1_enu, const std::vector<double>& ant2_enu)
{
    if(ant1_enu.size() != 3 || ant2_enu.size() != 3) {
        throw std::invalid_argument("[ERROR] Antenna positions must have 3 components (E, N, U).");
    }
    init(ant1_enu.data(), ant2_enu.data());
}

void Baseline::init(const double ant1_enu[3], const double ant2_enu[3])
{
    for(int i = 0; i < 3; i++) {
        enu[i] = ant1_enu[i] - ant2_enu[i];
    }
    if(is_autocorrelation()) {
        std::cerr << "[WARNING] Zero length baseline, fringe is 1 everywhere." << std::endl;
    }
}

double Baseline::get_length(void) const
{
    return sqrt(enu[0] * enu[0] + enu[1] * enu[1] + enu[2] * enu[2]);
}

bool Baseline::is_autocorrelation(void) const
{
    return enu[0] == 0.0 && enu[1] == 0.0 && enu[2] == 0.0;
}

std::vector<double> Baseline::get_uvw(double freq) const
{
    double lambda = Units::wavelength(freq);
    std::vector<double> uvw(3);

    for(int i = 0; i < 3; i++) {
        uvw[i] = enu[i] / lambda;
    }
    return uvw;
}

std::vector< std::complex<double> > Baseline::get_fringe
(
    const std::vector<double>& az,
    const std::vector<double>& za,
    const std::vector<double>& freqs,
    bool degrees
) const
{
    return Fringe::make_fringe(az, za, freqs, enu, degrees);
}
