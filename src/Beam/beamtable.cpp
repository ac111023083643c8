#include "Beam/beamtable.hpp"
#include "Units/units.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace
{

/* cubic spline through (x, y) along azimuth, periodic over the last
 * node. GSL needs two points for it. */
std::shared_ptr<gsl_spline> make_periodic_spline(const double* x, const double* y, size_t n)
{
    std::shared_ptr<gsl_spline> spline(gsl_spline_alloc(gsl_interp_cspline_periodic, n),
        gsl_spline_free);

    if(!spline) {
        throw std::runtime_error("[ERROR] Could not allocate a beam spline.");
    }
    if(gsl_spline_init(spline.get(), x, y, n) != GSL_SUCCESS) {
        throw std::runtime_error("[ERROR] Could not build a beam spline.");
    }
    return spline;
}

/* spline value at xv, clamped to the ends of the grid. */
double eval_clamped(const gsl_spline* spline, double xv)
{
    double value;
    double xlo = spline->x[0];
    double xhi = spline->x[spline->size - 1];

    if(xv < xlo)xv = xlo;
    if(xv > xhi)xv = xhi;
    if(gsl_spline_eval_e(spline, xv, NULL, &value) != GSL_SUCCESS) {
        throw std::runtime_error("[ERROR] Beam spline evaluation failed.");
    }
    return value;
}

} // namespace

BeamTable::BeamTable
(
    const std::vector<double>& _freqs,
    int npol,
    const std::vector<double>& za,
    const std::vector<double>& az
)
{
    if(_freqs.empty() || npol < 1 || za.empty() || az.empty()) {
        throw std::invalid_argument("[ERROR] Beam table dimensions must be positive.");
    }
    for(size_t i = 1; i < za.size(); i++) {
        if(!(za[i] > za[i - 1])) {
            throw std::invalid_argument("[ERROR] Beam zenith angles must be strictly increasing.");
        }
    }
    for(size_t i = 1; i < az.size(); i++) {
        if(!(az[i] > az[i - 1])) {
            throw std::invalid_argument("[ERROR] Beam azimuths must be strictly increasing.");
        }
    }
    if(az.back() - az.front() > 360.0 + 1.0e-9) {
        throw std::invalid_argument("[ERROR] Beam azimuths must span at most 360 degrees.");
    }
    for(size_t i = 1; i < _freqs.size(); i++) {
        if(!(_freqs[i] > _freqs[i - 1])) {
            throw std::invalid_argument("[ERROR] Beam frequencies must be strictly increasing.");
        }
    }
    freqs = _freqs;
    nPols = npol;
    zaGrid.resize(za.size());
    azGrid.resize(az.size());
    for(size_t i = 0; i < za.size(); i++) {
        zaGrid[i] = za[i] * DEG2RAD;
    }
    for(size_t i = 0; i < az.size(); i++) {
        azGrid[i] = az[i] * DEG2RAD;
    }
    power.assign(freqs.size() * nPols * zaGrid.size() * azGrid.size(), 0.0);
    splinesOK = false;
}

BeamTable::~BeamTable()
{
}

size_t BeamTable::index(int ifreq, int ipol, int iza, int iaz) const
{
    return ((size_t(ifreq) * nPols + ipol) * zaGrid.size() + iza) * azGrid.size() + iaz;
}

void BeamTable::set_power(int ifreq, int ipol, int iza, int iaz, double value)
{
    power[index(ifreq, ipol, iza, iaz)] = value;
    splinesOK = false;
}

double BeamTable::get_power(int ifreq, int ipol, int iza, int iaz) const
{
    return power[index(ifreq, ipol, iza, iaz)];
}

void BeamTable::peak_normalize(void)
{
    size_t plane = zaGrid.size() * azGrid.size();

    for(size_t p = 0; p < freqs.size() * nPols; p++)
    {
        double* first = power.data() + p * plane;
        double peak = *std::max_element(first, first + plane);
        if(!(peak > 0.0)) {
            std::cerr << "[WARNING] Beam plane " << p << " has no positive power." << std::endl;
            continue;
        }
        for(size_t i = 0; i < plane; i++) {
            first[i] /= peak;
        }
    }
    splinesOK = false;
}

void BeamTable::build_splines(void)
/** Azimuth splines are periodic. Unless the grid already closes the circle,
 * the first azimuth is repeated 2 pi after itself so that azimuths past
 * the last node are interpolated towards the first one.
 */
{
    size_t naz = azGrid.size();
    size_t nrows = power.size() / naz;
    bool closed;
    std::vector<double> row;

    azSplines.clear();
    azKnots.clear();
    // a single azimuth is constant along azimuth
    if(naz > 1)
    {
        closed = std::fabs(azGrid.back() - azGrid.front() - 2.0 * M_PI) < 1.0e-9;
        azKnots = azGrid;
        if(!closed) {
            azKnots.push_back(azGrid.front() + 2.0 * M_PI);
        }
        azSplines.reserve(nrows);
        for(size_t r = 0; r < nrows; r++)
        {
            row.assign(power.begin() + r * naz, power.begin() + (r + 1) * naz);
            if(!closed) {
                row.push_back(row.front());
            }
            azSplines.push_back(make_periodic_spline(azKnots.data(), row.data(), row.size()));
        }
    }
    splinesOK = true;
}

void BeamTable::check_indices(int ifreq, int ipol) const
{
    if(!splinesOK) {
        throw std::logic_error("[ERROR] Beam table splines have not been built.");
    }
    if(ifreq < 0 || ifreq >= get_nfreqs() || ipol < 0 || ipol >= nPols) {
        throw std::out_of_range("[ERROR] Beam channel or polarization out of range.");
    }
}

std::shared_ptr<gsl_interp> BeamTable::make_za_workspace(void) const
/** Natural cubic spline workspace along zenith angle, two nodes give a
 * straight line. Null for a single zenith angle.
 */
{
    size_t nza = zaGrid.size();
    std::shared_ptr<gsl_interp> workspace;

    if(nza < 2) {
        return workspace;
    }
    workspace.reset(gsl_interp_alloc(nza >= 3 ? gsl_interp_cspline : gsl_interp_linear, nza),
        gsl_interp_free);
    if(!workspace) {
        throw std::runtime_error("[ERROR] Could not allocate a beam spline.");
    }
    return workspace;
}

double BeamTable::interpolate_at
(
    int ifreq, int ipol, double az, double za,
    gsl_interp* zaWorkspace, std::vector<double>& column
) const
/** Interpolates along azimuth on every tabulated zenith angle with the
 * cached splines, then along zenith angle through those values. Returns
 * zero outside the tabulated zenith angle range. Never negative.
 */
{
    int nza = int(zaGrid.size());
    int naz = int(azGrid.size());
    double value;

    if(za < zaGrid.front() - 1.0e-12 || za > zaGrid.back() + 1.0e-12) {
        return 0.0;
    }
    if(za < zaGrid.front())za = zaGrid.front();
    if(za > zaGrid.back())za = zaGrid.back();
    // into [az0, az0 + 2 pi)
    az = std::fmod(az - azGrid.front(), 2.0 * M_PI);
    if(az < 0.0)az += 2.0 * M_PI;
    az += azGrid.front();

    for(int iza = 0; iza < nza; iza++)
    {
        size_t row = index(ifreq, ipol, iza, 0);
        if(naz == 1) {
            column[iza] = power[row];
        }
        else {
            column[iza] = eval_clamped(azSplines[row / naz].get(), az);
        }
    }
    if(nza == 1) {
        value = column[0];
    }
    else
    {
        if(gsl_interp_init(zaWorkspace, zaGrid.data(), column.data(), nza) != GSL_SUCCESS
            || gsl_interp_eval_e(zaWorkspace, zaGrid.data(), column.data(), za, NULL, &value)
            != GSL_SUCCESS)
        {
            throw std::runtime_error("[ERROR] Beam spline evaluation failed.");
        }
    }
    return value > 0.0 ? value : 0.0;
}

double BeamTable::interpolate(int ifreq, int ipol, double az, double za) const
{
    std::vector<double> column(zaGrid.size());

    check_indices(ifreq, ipol);
    std::shared_ptr<gsl_interp> workspace = make_za_workspace();
    return interpolate_at(ifreq, ipol, az, za, workspace.get(), column);
}

std::vector<double> BeamTable::interpolate
(
    int ifreq, int ipol,
    const std::vector<double>& az,
    const std::vector<double>& za
) const
/** Same as above for every (az[i], za[i]), sharing one zenith angle
 * workspace across directions.
 */
{
    std::vector<double> values(az.size());
    std::vector<double> column(zaGrid.size());

    if(az.size() != za.size()) {
        throw std::invalid_argument("[ERROR] az and za must have the same size.");
    }
    check_indices(ifreq, ipol);
    std::shared_ptr<gsl_interp> workspace = make_za_workspace();
    for(size_t i = 0; i < az.size(); i++) {
        values[i] = interpolate_at(ifreq, ipol, az[i], za[i], workspace.get(), column);
    }
    return values;
}

void BeamTable::bracket_freq(double freq, int& hi, double& w) const
{
    double tol = 1.0e-9 * freqs.back();

    if(freq < freqs.front() - tol || freq > freqs.back() + tol) {
        throw std::out_of_range("[ERROR] Frequency outside the tabulated beam range.");
    }
    hi = int(std::upper_bound(freqs.begin(), freqs.end(), freq) - freqs.begin());
    if(hi >= get_nfreqs())hi = get_nfreqs() - 1;
    if(hi < 1)hi = 1;
    w = (freq - freqs[hi - 1]) / (freqs[hi] - freqs[hi - 1]);
    if(w < 0.0)w = 0.0;
    if(w > 1.0)w = 1.0;
}

double BeamTable::interpolate_freq(double freq, int ipol, double az, double za) const
{
    int hi;
    double w;

    if(freqs.size() == 1) {
        return interpolate(0, ipol, az, za);
    }
    bracket_freq(freq, hi, w);
    return (1.0 - w) * interpolate(hi - 1, ipol, az, za)
         + w * interpolate(hi, ipol, az, za);
}

std::vector<double> BeamTable::interpolate_freq
(
    double freq, int ipol,
    const std::vector<double>& az,
    const std::vector<double>& za
) const
{
    int hi;
    double w;

    if(freqs.size() == 1) {
        return interpolate(0, ipol, az, za);
    }
    bracket_freq(freq, hi, w);
    std::vector<double> lo = interpolate(hi - 1, ipol, az, za);
    std::vector<double> up = interpolate(hi, ipol, az, za);
    for(size_t i = 0; i < lo.size(); i++) {
        lo[i] = (1.0 - w) * lo[i] + w * up[i];
    }
    return lo;
}

namespace
{

/* next line that is neither blank nor a comment. */
bool next_data_line(std::ifstream& in, std::string& line)
{
    while(std::getline(in, line))
    {
        size_t first = line.find_first_not_of(" \t\r");
        if(first == std::string::npos || line[first] == '#') {
            continue;
        }
        return true;
    }
    return false;
}

std::vector<double> read_axis(std::ifstream& in, int n, const char* what)
{
    std::string line;
    std::vector<double> axis(n);

    if(!next_data_line(in, line)) {
        throw std::runtime_error(std::string("[ERROR] Missing beam ") + what + " axis.");
    }
    std::istringstream iss(line);
    for(int i = 0; i < n; i++)
    {
        if(!(iss >> axis[i])) {
            throw std::runtime_error(std::string("[ERROR] Could not parse beam ") + what + " axis.");
        }
    }
    return axis;
}

} // namespace

BeamTable load_beam_table_from_txt(const std::string& path)
/** Loads a tabulated beam from a text file.
 *
 * Blank lines and lines starting with '#' are skipped. The first line is
 *
 *   nfreq npol nza naz kind
 *
 * where kind is "power" or "efield", followed by one line with the
 * frequencies (Hz), one with the zenith angles (degrees) and one with the
 * azimuths (degrees). Then nfreq*npol*nza*naz lines ordered by frequency,
 * polarization, zenith angle and azimuth (fastest). A power line has one
 * column. An efield line has four: magnitude and phase of the co-polarized
 * component, magnitude and phase of the cross-polarized component, and is
 * stored as |Eco|^2 + |Ecx|^2.
 *
 * This routine throws a runtime error if the file cannot be opened or parsed.
 */
{
    int nfreq;
    int npol;
    int nza;
    int naz;
    bool efield;
    std::string kind;
    std::string line;
    std::ifstream beamDataFile(path.c_str());

    #ifdef BEAM_DEBUG
    std::cerr << "load_beam_table_from_txt" << std::endl;
    std::cerr << "  reading beam data from file " << path << std::endl;
    #endif
    if(!beamDataFile.is_open()) {
        throw std::runtime_error("[ERROR] Could not open file " + path);
    }
    if(!next_data_line(beamDataFile, line)) {
        throw std::runtime_error("[ERROR] Beam file is empty: " + path);
    }
    std::istringstream header(line);
    if(!(header >> nfreq >> npol >> nza >> naz >> kind)) {
        throw std::runtime_error("[ERROR] Could not parse the beam file header.");
    }
    if(kind == "power") {
        efield = false;
    }
    else if(kind == "efield") {
        efield = true;
    }
    else {
        throw std::runtime_error("[ERROR] Unknown beam table kind " + kind);
    }
    if(nfreq < 1 || npol < 1 || nza < 1 || naz < 1) {
        throw std::runtime_error("[ERROR] Beam table dimensions must be positive.");
    }

    std::vector<double> freqs = read_axis(beamDataFile, nfreq, "frequency");
    std::vector<double> za = read_axis(beamDataFile, nza, "zenith angle");
    std::vector<double> az = read_axis(beamDataFile, naz, "azimuth");
    BeamTable table(freqs, npol, za, az);

    for(int f = 0; f < nfreq; f++)
    for(int p = 0; p < npol; p++)
    for(int i = 0; i < nza; i++)
    for(int j = 0; j < naz; j++)
    {
        double value;
        if(!next_data_line(beamDataFile, line)) {
            throw std::runtime_error("[ERROR] Not enough data in the beam file.");
        }
        std::istringstream iss(line);
        if(efield)
        {
            double magEco;
            double phsEco;
            double magEcx;
            double phsEcx;
            if(!(iss >> magEco >> phsEco >> magEcx >> phsEcx)) {
                throw std::runtime_error("[ERROR] Could not parse the contents of the file.");
            }
            /* scalar co-polarized component. */
            std::complex<double> Eco = std::polar(magEco, phsEco);
            /* scalar cross-polarized component. */
            std::complex<double> Ecx = std::polar(magEcx, phsEcx);
            value = std::norm(Eco) + std::norm(Ecx);
        }
        else
        {
            if(!(iss >> value)) {
                throw std::runtime_error("[ERROR] Could not parse the contents of the file.");
            }
        }
        table.set_power(f, p, i, j, value);
    }
    beamDataFile.close();
    table.build_splines();
    return table;
}
