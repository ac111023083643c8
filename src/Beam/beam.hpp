/*
 * beam.hpp
 *
 * Beam is the primary beam power response of an antenna as a function of
 * direction (azimuth, zenith angle, radians) and, optionally, frequency
 * (Hz). Three kinds are available:
 *
 *   uniform  : 1 everywhere.
 *   gaussian : exp(-za^2 / (2 sigma^2)), peak normalized.
 *   power    : tabulated beam read from a file (see beamtable.hpp).
 *
 * Beams are immutable once built. make_beam() validates the type name and
 * the parameters the kind needs, so that a bad configuration fails before
 * any beam is evaluated.
 */

#ifndef EORSKY_BEAMH
#define EORSKY_BEAMH

#include <memory>
#include <string>
#include <vector>

#include "Beam/beamtable.hpp"

class Beam
{
    public:

        virtual ~Beam() {};

        /* type name, as accepted by make_beam(). */
        virtual std::string get_type(void) const = 0;
        /* power at (az, za) at the beam's default frequency. */
        virtual double beam_val(double az, double za) const = 0;
        /* power at (az, za) at frequency freq. */
        virtual double beam_val(double az, double za, double freq) const = 0;

        /* beam_val() for every (az[i], za[i]). */
        virtual std::vector<double> evaluate
        (
            const std::vector<double>& az,
            const std::vector<double>& za
        ) const;
        virtual std::vector<double> evaluate
        (
            const std::vector<double>& az,
            const std::vector<double>& za,
            double freq
        ) const;
};

class UniformBeam : public Beam
{
    public:

        std::string get_type(void) const { return "uniform"; };
        double beam_val(double az, double za) const;
        double beam_val(double az, double za, double freq) const;
};

class GaussianBeam : public Beam
{
    public:

        /* sigma in degrees. */
        GaussianBeam(double sigma);

        std::string get_type(void) const { return "gaussian"; };
        /* sigma in radians. */
        double get_sigma(void) const { return sigma; };
        double beam_val(double az, double za) const;
        double beam_val(double az, double za, double freq) const;

        /* sigma of a Gaussian with full width at half maximum fwhm. */
        static double sigma_from_fwhm(double fwhm);

    private:

        double sigma;
};

class PowerBeam : public Beam
{
    public:

        PowerBeam(const BeamTable& table, int pol = 0);
        /* loads the table from a text file. */
        PowerBeam(const std::string& path, int pol = 0, bool peakNormalize = false);

        std::string get_type(void) const { return "power"; };
        const BeamTable& get_table(void) const { return table; };
        /* first tabulated channel, Hz. */
        double get_default_freq(void) const { return table.get_freqs().front(); };
        double beam_val(double az, double za) const;
        double beam_val(double az, double za, double freq) const;
        std::vector<double> evaluate
        (
            const std::vector<double>& az,
            const std::vector<double>& za
        ) const;
        std::vector<double> evaluate
        (
            const std::vector<double>& az,
            const std::vector<double>& za,
            double freq
        ) const;

    private:

        void check_pol(void) const;

        BeamTable table;
        int pol;
};

/* parameters understood by make_beam(). */
struct BeamParams
{
    BeamParams() : sigma(0.0), hasSigma(false), pol(0), peakNormalize(false) {};

    /* gaussian: width in degrees. */
    double sigma;
    bool hasSigma;
    /* power: beam table file, polarization index. */
    std::string path;
    int pol;
    bool peakNormalize;
};

/* builds a beam of the given type. Throws invalid_argument for unknown
 * types or missing parameters. */
std::unique_ptr<Beam> make_beam(const std::string& type, const BeamParams& params = BeamParams());

#endif
