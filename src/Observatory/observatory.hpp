/*
 * observatory.hpp
 *
 * Observatory ties a site, an array of baselines, a set of frequency
 * channels and a primary beam together and computes the visibilities
 * those baselines measure while the site drifts under a HEALPix sky
 * shell. The shell's longitude and latitude are taken as RA and Dec.
 *
 * Typical use:
 *
 *   Observatory obs(latitude, longitude, baselines, freqs);
 *   obs.set_fov(fov);
 *   obs.set_beam("gaussian", params);
 *   obs.set_pointings(times);
 *   VisibilitySet vis = obs.make_visibilities(shell, nworkers);
 *
 */

#ifndef EORSKY_OBSERVATORYH
#define EORSKY_OBSERVATORYH

#include <memory>
#include <string>
#include <vector>

#include "Baseline/baseline.hpp"
#include "Beam/beam.hpp"
#include "Observatory/visibilities.hpp"
#include "Projector/projector.hpp"
#include "Sky/skyshell.hpp"

/* RA and Dec of the zenith at one time sample, degrees. */
struct PointingCenter
{
    double ra;
    double dec;
};

class Observatory
{
    public:

        /* latitude, longitude in degrees, altitude in meters. */
        Observatory
        (
            double latitude, double longitude,
            const std::vector<Baseline>& array = std::vector<Baseline>(),
            const std::vector<double>& freqs = std::vector<double>(),
            double altitude = 0.0
        );
       ~Observatory();

        double get_latitude(void) const { return lat; };
        double get_longitude(void) const { return lon; };
        double get_altitude(void) const { return alt; };

        void set_array(const std::vector<Baseline>& array);
        const std::vector<Baseline>& get_array(void) const { return array; };
        int get_nbls(void) const { return int(array.size()); };

        void set_frequencies(const std::vector<double>& freqs);
        const std::vector<double>& get_frequencies(void) const { return freqs; };
        int get_nfreqs(void) const { return int(freqs.size()); };

        /* field of view (diameter), degrees. */
        void set_fov(double fov);
        double get_fov(void) const;
        bool has_fov(void) const { return fovOK; };

        /* builds the beam with make_beam(). */
        void set_beam(const std::string& type, const BeamParams& params = BeamParams());
        void set_beam(std::unique_ptr<Beam> beam);
        const Beam& get_beam(void) const;

        /* UT1-UTC (s) and polar motion (arcsec) used by set_pointings(). */
        void set_earth_orientation(double dut1, double xp = 0.0, double yp = 0.0);
        /* one pointing center per Julian date (UTC), same order. */
        void set_pointings(const std::vector<double>& times);
        /* sets pointing centers computed elsewhere. */
        void set_pointings(const std::vector<double>& times,
            const std::vector<PointingCenter>& centers);
        const std::vector<PointingCenter>& get_pointing_centers(void) const;
        const std::vector<double>& get_times(void) const { return timesJD; };
        long get_ntimes(void) const { return long(timesJD.size()); };

        /* visible pixels and their local coordinates for one pointing. */
        SkyPatch calc_azza(int nside, const PointingCenter& center) const;
        /* pixels sampled by every pointing. */
        std::vector< std::vector<int> > get_observed_region(int nside) const;
        /* sum of beam^2 times pixel area over the first pointing's patch, sr. */
        double beam_squared_integral(int nside) const;

        /* visibilities (Jy) of a shell in Kelvin, split over nworkers. */
        VisibilitySet make_visibilities(const SkyShell& shell, int nworkers = 1) const;

        /* progress reporting of make_visibilities(). */
        void set_verbose(bool v) { verbose = v; };

    private:

        void check_ready(void) const;

        double lat;
        double lon;
        double alt;
        double dut1;
        double xpole;
        double ypole;
        std::vector<Baseline> array;
        std::vector<double> freqs;
        std::unique_ptr<Beam> beam;
        double fov;
        bool fovOK;
        std::vector<double> timesJD;
        std::vector<PointingCenter> pointingCenters;
        bool pointingsOK;
        bool verbose;
};

#endif
