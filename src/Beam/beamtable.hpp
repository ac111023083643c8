/*
 * beamtable.hpp
 *
 * BeamTable holds a tabulated power beam sampled on a regular
 * (frequency, polarization, zenith angle, azimuth) grid and interpolates
 * it at arbitrary directions with a tensor-product cubic spline (GSL):
 * periodic along azimuth, natural along zenith angle. Splines along
 * azimuth are computed once, when the table is finalized with
 * build_splines(); splines along zenith angle are built per direction in
 * a workspace shared by all directions of one call. Evaluation does not
 * use GSL accelerators, so a finalized table can be shared by several
 * threads.
 *
 */

#ifndef EORSKY_BEAMTABLEH
#define EORSKY_BEAMTABLEH

#include <memory>
#include <string>
#include <vector>

#include <gsl/gsl_errno.h>
#include <gsl/gsl_interp.h>
#include <gsl/gsl_spline.h>

class BeamTable
{
    public:
        /* za and az grids in degrees, strictly increasing. */
        BeamTable
        (
            const std::vector<double>& freqs,
            int npol,
            const std::vector<double>& za,
            const std::vector<double>& az
        );
       ~BeamTable();

        int get_nfreqs(void) const { return int(freqs.size()); };
        int get_npols(void) const { return nPols; };
        int get_nza(void) const { return int(zaGrid.size()); };
        int get_naz(void) const { return int(azGrid.size()); };
        const std::vector<double>& get_freqs(void) const { return freqs; };

        void set_power(int ifreq, int ipol, int iza, int iaz, double value);
        double get_power(int ifreq, int ipol, int iza, int iaz) const;
        /* scales every (freq, pol) plane so that its maximum is 1. */
        void peak_normalize(void);
        /* builds the azimuth splines. Must be called after the last
         * set_power() and before interpolating. */
        void build_splines(void);
        bool splines_ready(void) const { return splinesOK; };

        /* power at (az, za), radians, for channel ifreq. */
        double interpolate(int ifreq, int ipol, double az, double za) const;
        std::vector<double> interpolate
        (
            int ifreq, int ipol,
            const std::vector<double>& az,
            const std::vector<double>& za
        ) const;
        /* same, linearly interpolated between the channels that bracket freq (Hz). */
        double interpolate_freq(double freq, int ipol, double az, double za) const;
        std::vector<double> interpolate_freq
        (
            double freq, int ipol,
            const std::vector<double>& az,
            const std::vector<double>& za
        ) const;

    private:

        size_t index(int ifreq, int ipol, int iza, int iaz) const;
        void check_indices(int ifreq, int ipol) const;
        void bracket_freq(double freq, int& hi, double& w) const;
        std::shared_ptr<gsl_interp> make_za_workspace(void) const;
        double interpolate_at
        (
            int ifreq, int ipol, double az, double za,
            gsl_interp* zaWorkspace, std::vector<double>& column
        ) const;

        std::vector<double> freqs;
        /* grids, radians. */
        std::vector<double> zaGrid;
        std::vector<double> azGrid;
        std::vector<double> power;
        /* azimuth knots of the splines, azGrid closed at az0 + 2 pi. */
        std::vector<double> azKnots;
        /* one azimuth spline per (freq, pol, za) row. Immutable once built,
         * copies of the table share them. */
        std::vector< std::shared_ptr<gsl_spline> > azSplines;
        int nPols;
        bool splinesOK;
};

/* reads a tabulated beam from a text file. Electric field tables are
 * converted to power. */
BeamTable load_beam_table_from_txt(const std::string& path);

#endif
