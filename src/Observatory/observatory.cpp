#include "Observatory/observatory.hpp"
#include "Bpoint/BPoint.h"
#include "Executor/executor.hpp"
#include "Units/units.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

Observatory::Observatory
(
    double latitude, double longitude,
    const std::vector<Baseline>& _array,
    const std::vector<double>& _freqs,
    double altitude
)
{
    if(latitude < -90.0 || latitude > 90.0) {
        throw std::invalid_argument("[ERROR] Latitude must be in [-90, 90] degrees.");
    }
    lat = latitude;
    lon = longitude;
    alt = altitude;
    dut1 = 0.0;
    xpole = 0.0;
    ypole = 0.0;
    array = _array;
    fov = 0.0;
    fovOK = false;
    pointingsOK = false;
    verbose = true;
    if(!_freqs.empty()) {
        set_frequencies(_freqs);
    }
}

Observatory::~Observatory()
{
}

void Observatory::set_array(const std::vector<Baseline>& _array)
{
    array = _array;
}

void Observatory::set_frequencies(const std::vector<double>& _freqs)
{
    for(size_t i = 0; i < _freqs.size(); i++) {
        if(!(_freqs[i] > 0.0)) {
            throw std::invalid_argument("[ERROR] Frequencies must be positive.");
        }
    }
    freqs = _freqs;
}

void Observatory::set_fov(double _fov)
{
    if(!(_fov > 0.0 && _fov <= 360.0)) {
        throw std::invalid_argument("[ERROR] Field of view must be in (0, 360] degrees.");
    }
    fov = _fov;
    fovOK = true;
}

double Observatory::get_fov(void) const
{
    if(!fovOK) {
        throw std::logic_error("[ERROR] Need to set a field of view in degrees.");
    }
    return fov;
}

void Observatory::set_beam(const std::string& type, const BeamParams& params)
{
    beam = make_beam(type, params);
}

void Observatory::set_beam(std::unique_ptr<Beam> _beam)
{
    if(!_beam) {
        throw std::invalid_argument("[ERROR] Beam must not be null.");
    }
    beam = std::move(_beam);
}

const Beam& Observatory::get_beam(void) const
{
    if(!beam) {
        throw std::logic_error("[ERROR] Need to set a beam.");
    }
    return *beam;
}

void Observatory::set_earth_orientation(double _dut1, double xp, double yp)
{
    dut1 = _dut1;
    xpole = xp;
    ypole = yp;
}

void Observatory::set_pointings(const std::vector<double>& times)
/** Pointing centers are the ICRS coordinates of the local zenith at every
 * time (Julian date, UTC).
 */
{
    double ra;
    double dec;
    std::vector<PointingCenter> centers(times.size());
    BPoint bpoint(lon * DEG2RAD, lat * DEG2RAD, alt, CLK_UTC);

    if(times.empty()) {
        throw std::invalid_argument("[ERROR] Need at least one time sample.");
    }
    bpoint.set_earth_orientation(dut1, xpole, ypole);
    for(size_t i = 0; i < times.size(); i++)
    {
        if(!bpoint.zenith_to_icrs(times[i], &ra, &dec)) {
            throw std::runtime_error("[ERROR] Could not compute the zenith at JD "
                + std::to_string(times[i]));
        }
        centers[i].ra = ra * RAD2DEG;
        centers[i].dec = dec * RAD2DEG;
    }
    #ifdef OBSERVATORY_DEBUG
    std::cerr << "Observatory::set_pointings" << std::endl;
    std::cerr << "  first center (" << centers.front().ra << ", ";
    std::cerr << centers.front().dec << ")" << std::endl;
    #endif
    set_pointings(times, centers);
}

void Observatory::set_pointings(const std::vector<double>& times,
    const std::vector<PointingCenter>& centers)
{
    if(times.empty() || times.size() != centers.size()) {
        throw std::invalid_argument("[ERROR] Need one pointing center per time sample.");
    }
    timesJD = times;
    pointingCenters = centers;
    pointingsOK = true;
}

const std::vector<PointingCenter>& Observatory::get_pointing_centers(void) const
{
    if(!pointingsOK) {
        throw std::logic_error("[ERROR] Pointing centers have not been set.");
    }
    return pointingCenters;
}

SkyPatch Observatory::calc_azza(int nside, const PointingCenter& center) const
{
    Projector projector(nside);
    projector.set_fov(get_fov());
    return projector.calc_azza(center.ra, center.dec);
}

std::vector< std::vector<int> > Observatory::get_observed_region(int nside) const
{
    std::vector< std::vector<int> > pixels;
    const std::vector<PointingCenter>& centers = get_pointing_centers();
    Projector projector(nside);

    projector.set_fov(get_fov());
    for(size_t i = 0; i < centers.size(); i++) {
        pixels.push_back(projector.query_pixels(centers[i].ra, centers[i].dec));
    }
    return pixels;
}

double Observatory::beam_squared_integral(int nside) const
{
    double sum = 0.0;
    SkyPatch patch = calc_azza(nside, get_pointing_centers().front());
    std::vector<double> power = get_beam().evaluate(patch.az, patch.za);

    for(size_t i = 0; i < power.size(); i++) {
        sum += power[i] * power[i];
    }
    return sum * 4.0 * M_PI / (12.0 * double(nside) * double(nside));
}

void Observatory::check_ready(void) const
{
    if(!fovOK) {
        throw std::logic_error("[ERROR] Need to set a field of view in degrees.");
    }
    if(!beam) {
        throw std::logic_error("[ERROR] Need to set a beam.");
    }
    if(!pointingsOK) {
        throw std::logic_error("[ERROR] Pointing centers have not been set.");
    }
    if(array.empty()) {
        throw std::invalid_argument("[ERROR] Need at least one baseline.");
    }
    if(freqs.empty()) {
        throw std::invalid_argument("[ERROR] Need at least one frequency.");
    }
}

VisibilitySet Observatory::make_visibilities(const SkyShell& shell, int nworkers) const
/** Projects the part of the shell within the field of view of every
 * pointing onto its tangent plane, multiplies it by the beam and by the
 * fringe of every baseline and sums over pixels:
 *
 *   vis[sky, f] = sum_pix shell[sky, pix, f] * beam[pix] * fringe[pix, f]
 *
 * Time samples are split in nworkers contiguous chunks processed in
 * parallel. The shell is read only. Rows of the result are sorted by
 * baseline and then by time; values are converted from K sr to Jy.
 */
{
    int nside;
    int nskies = shell.get_nskies();
    int nfreqs = get_nfreqs();
    int nbls = get_nbls();
    long ntimes;
    long expected;
    double pixArea;
    std::vector<double> conv;

    // validate everything before starting any worker
    check_ready();
    if(shell.get_nfreqs() != nfreqs) {
        throw std::invalid_argument("[ERROR] Shell has " + std::to_string(shell.get_nfreqs())
            + " channels while the observatory has " + std::to_string(nfreqs) + ".");
    }
    nside = SkyShell::npix2nside(shell.get_npixels());
    ntimes = get_ntimes();
    expected = ntimes * nbls;
    ParallelExecutor executor(nworkers);
    executor.set_verbose(verbose);
    Projector projector(nside);
    projector.set_fov(fov);
    pixArea = 4.0 * M_PI / double(shell.get_npixels());
    conv = Units::jy2Tstr(freqs, pixArea);

    #ifdef OBSERVATORY_DEBUG
    std::cerr << "Observatory::make_visibilities" << std::endl;
    std::cerr << "  Nside " << nside << ", " << ntimes << " times, " << nbls;
    std::cerr << " baselines, " << nfreqs << " channels, " << nskies << " skies, ";
    std::cerr << nworkers << " workers." << std::endl;
    std::cerr << "  shell = " << shell.nbytes() / 1.0e6 << " MB" << std::endl;
    #endif

    const Beam& pbeam = *beam;
    ParallelExecutor::Task task =
        [&](long begin, long end, ResultChannel& channel)
    {
        for(long t = begin; t < end; t++)
        {
            const PointingCenter& center = pointingCenters[t];
            SkyPatch patch = projector.calc_azza(center.ra, center.dec);
            // beam is the same for every channel
            std::vector<double> power = pbeam.evaluate(patch.az, patch.za);
            for(int bi = 0; bi < nbls; bi++)
            {
                std::vector< std::complex<double> > fringe =
                    array[bi].get_fringe(patch.az, patch.za, freqs);
                VisibilityPacket packet;
                packet.timeIndex = t;
                packet.baselineIndex = bi;
                packet.vis.assign(size_t(nskies) * nfreqs, std::complex<double>(0.0, 0.0));
                for(int s = 0; s < nskies; s++)
                {
                    std::complex<double>* vis = &packet.vis[size_t(s) * nfreqs];
                    for(size_t p = 0; p < patch.size(); p++)
                    {
                        const double* T = shell.get_pixel(s, patch.pixels[p]);
                        const std::complex<double>* fr = &fringe[p * nfreqs];
                        for(int f = 0; f < nfreqs; f++) {
                            vis[f] += (T[f] * power[p]) * fr[f];
                        }
                    }
                }
                channel.push(std::move(packet));
            }
            channel.increment_progress();
        }
    };
    std::vector<VisibilityPacket> packets = executor.run(ntimes, expected, task);

    std::stable_sort(packets.begin(), packets.end(),
        [](const VisibilityPacket& a, const VisibilityPacket& b)
        {
            if(a.baselineIndex != b.baselineIndex) {
                return a.baselineIndex < b.baselineIndex;
            }
            return a.timeIndex < b.timeIndex;
        });

    VisibilitySet result;
    result.nblts = expected;
    result.nskies = nskies;
    result.nfreqs = nfreqs;
    result.data.resize(size_t(expected) * nskies * nfreqs);
    result.time_array.resize(expected);
    result.time_index.resize(expected);
    result.baseline_array.resize(expected);
    for(long k = 0; k < expected; k++)
    {
        const VisibilityPacket& packet = packets[k];
        // after sorting, row k must be baseline k / ntimes at time k % ntimes
        if(packet.baselineIndex != int(k / ntimes) || packet.timeIndex != k % ntimes) {
            throw std::runtime_error("[ERROR] Duplicate or missing (time, baseline) results.");
        }
        result.time_index[k] = packet.timeIndex;
        result.time_array[k] = timesJD[packet.timeIndex];
        result.baseline_array[k] = packet.baselineIndex;
        for(int s = 0; s < nskies; s++)
        {
            for(int f = 0; f < nfreqs; f++)
            {
                size_t i = size_t(s) * nfreqs + f;
                result.data[size_t(k) * nskies * nfreqs + i] = packet.vis[i] / conv[f];
            }
        }
    }
    return result;
}
