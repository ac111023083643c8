/*
 * baseline.hpp
 *
 * A pair of antennas, stored as the separation vector ant1 - ant2 in
 * local East-North-Up coordinates (metres).
 */

#ifndef EORSKY_BASELINEH
#define EORSKY_BASELINEH

#include <complex>
#include <vector>

class Baseline
{
    public:

        Baseline(const double ant1_enu[3], const double ant2_enu[3]);
        Baseline(const std::vector<double>& ant1_enu, const std::vector<double>& ant2_enu);

        const double* get_enu(void) const { return enu; };
        double get_length(void) const;
        bool is_autocorrelation(void) const;
        /* baseline vector in wavelengths at freq (Hz). */
        std::vector<double> get_uvw(double freq) const;
        /* see Fringe::make_fringe(). */
        std::vector< std::complex<double> > get_fringe
        (
            const std::vector<double>& az,
            const std::vector<double>& za,
            const std::vector<double>& freqs,
            bool degrees = false
        ) const;

    private:

        void init(const double ant1_enu[3], const double ant2_enu[3]);

        double enu[3];
};

#endif
