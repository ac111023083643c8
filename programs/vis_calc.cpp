/*
 * vis_calc.cpp
 *
 * Computes the visibilities of one or more baselines drifting under a
 * HEALPix sky shell and writes them to a text table. The sky is either
 * read from disk or drawn from a zero mean Gaussian distribution.
 *
 * Usage: vis_calc.x <JSON configuration file>
 *
 * Example configuration (all angles in degrees, frequencies in Hz):
 *
 * {
 *     "latitude": -30.7215277777, "longitude": 21.4283055554, "altitude": 1073.0,
 *     "fov": 100.0, "nside": 128,
 *     "t0": 2451545.0, "ntimes": 7854, "integration_time": 11.0,
 *     "freq_start": 1.0e8, "freq_end": 1.3e8, "nfreqs": 384,
 *     "baseline_length": 14.6,
 *     "beam": {"type": "gaussian", "fwhm": 50.0},
 *     "sky": {"sigma": 2.0, "nskies": 1, "seed": 0},
 *     "nworkers": 1,
 *     "output_path": "eorsky_vis.txt"
 * }
 *
 */
#include <Sky/skyshell.hpp>
#include <Baseline/baseline.hpp>
#include <Beam/beam.hpp>
#include <Observatory/observatory.hpp>

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// json parsing
#include <nlohmann/json.hpp>
using json = nlohmann::json;

int main(int argc, char* argv[])
{
    // site parameters
    double latitude;
    double longitude;
    double altitude = 0.0;
    double fov;

    // time parameters
    double t0;
    int ntimes;
    double integration_time;

    // frequency parameters
    double freq_start;
    double freq_end;
    int nfreqs;

    // sky parameters
    int nside;
    int nskies = 1;
    double sky_sigma = 0.0;
    unsigned int seed = 0;
    std::string input_sky_path;

    // other parameters
    int nworkers = 1;
    std::string output_path;

    // Argument parsing
    if(argc != 2) {
        std::cerr << "Usage: vis_calc.x <JSON configuration file>" << std::endl;
        return 1;
    }

    try
    {
        // parse configuration file
        std::ifstream configfile(argv[1]);
        if(!configfile.is_open()) {
            std::cerr << "[ERROR] Could not open file " << argv[1] << std::endl;
            return 1;
        }
        json config = json::parse(configfile);
        // site
        config.at("latitude").get_to(latitude);
        config.at("longitude").get_to(longitude);
        if(config.contains("altitude")) {
            config.at("altitude").get_to(altitude);
        }
        config.at("fov").get_to(fov);
        // times
        config.at("t0").get_to(t0);
        config.at("ntimes").get_to(ntimes);
        config.at("integration_time").get_to(integration_time);
        // frequencies
        config.at("freq_start").get_to(freq_start);
        config.at("freq_end").get_to(freq_end);
        config.at("nfreqs").get_to(nfreqs);
        // sky
        config.at("nside").get_to(nside);
        const json& skyconfig = config.at("sky");
        if(skyconfig.contains("nskies")) {
            skyconfig.at("nskies").get_to(nskies);
        }
        if(skyconfig.contains("path")) {
            skyconfig.at("path").get_to(input_sky_path);
        }
        else {
            skyconfig.at("sigma").get_to(sky_sigma);
        }
        if(skyconfig.contains("seed")) {
            skyconfig.at("seed").get_to(seed);
        }
        // beam
        const json& beamconfig = config.at("beam");
        std::string beam_type = beamconfig.at("type").get<std::string>();
        BeamParams beam_params;
        if(beamconfig.contains("fwhm")) {
            beam_params.sigma = GaussianBeam::sigma_from_fwhm(beamconfig.at("fwhm").get<double>());
            beam_params.hasSigma = true;
        }
        if(beamconfig.contains("sigma")) {
            beamconfig.at("sigma").get_to(beam_params.sigma);
            beam_params.hasSigma = true;
        }
        if(beamconfig.contains("path")) {
            beamconfig.at("path").get_to(beam_params.path);
        }
        if(beamconfig.contains("pol")) {
            beamconfig.at("pol").get_to(beam_params.pol);
        }
        if(beamconfig.contains("peak_normalize")) {
            beamconfig.at("peak_normalize").get_to(beam_params.peakNormalize);
        }
        // baselines
        std::vector<Baseline> baselines;
        if(config.contains("baselines"))
        {
            for(const json& bl : config.at("baselines"))
            {
                std::vector<double> ant1 = bl.at(0).get< std::vector<double> >();
                std::vector<double> ant2 = bl.at(1).get< std::vector<double> >();
                baselines.push_back(Baseline(ant1, ant2));
            }
        }
        else
        {
            // single North-South baseline
            double bllen = config.at("baseline_length").get<double>();
            double ant1[3] = {0.0, 0.0, 0.0};
            double ant2[3] = {0.0, bllen, 0.0};
            baselines.push_back(Baseline(ant1, ant2));
        }
        // workers, the batch system wins
        if(config.contains("nworkers")) {
            config.at("nworkers").get_to(nworkers);
        }
        if(std::getenv("SLURM_CPUS_PER_TASK") != NULL) {
            nworkers = std::atoi(std::getenv("SLURM_CPUS_PER_TASK"));
        }
        config.at("output_path").get_to(output_path);

        if(ntimes < 1 || nfreqs < 1) {
            throw std::invalid_argument("[ERROR] ntimes and nfreqs must be positive.");
        }

        // time samples, integration_time seconds apart
        std::vector<double> times(ntimes);
        for(int i = 0; i < ntimes; i++) {
            times[i] = t0 + i * integration_time / 86400.0;
        }
        // frequency channels, end points included
        std::vector<double> freqs(nfreqs);
        for(int i = 0; i < nfreqs; i++) {
            freqs[i] = nfreqs > 1 ? freq_start + i * (freq_end - freq_start) / (nfreqs - 1) : freq_start;
        }

        Observatory obs(latitude, longitude, baselines, freqs, altitude);
        obs.set_fov(fov);
        obs.set_beam(beam_type, beam_params);
        std::cerr << "computing pointing centers... " << std::endl;
        obs.set_pointings(times);

        SkyShell shell(12L * nside * nside, nfreqs, nskies);
        if(!input_sky_path.empty()) {
            shell.load_sky_data_from_txt(input_sky_path);
        }
        else {
            std::cerr << "making skies... " << std::endl;
            shell.make_gaussian_random_sky(sky_sigma, seed);
        }
        std::cerr << "Nworkers: " << nworkers << std::endl;
        std::cerr << "Shell = " << std::fixed << std::setprecision(4);
        std::cerr << shell.nbytes() / 1.0e6 << "MB" << std::endl;
        std::cerr.unsetf(std::ios_base::floatfield);

        VisibilitySet vis = obs.make_visibilities(shell, nworkers);
        double bsq_int = obs.beam_squared_integral(nside);

        // write visibilities
        std::ofstream outdata(output_path);
        if(!outdata) {
            std::cerr << "[ERROR] Could not open file " << output_path << std::endl;
            return 1;
        }
        outdata << "# eorsky visibilities, Jy" << std::endl;
        outdata << "# nblts " << vis.nblts << " nskies " << vis.nskies;
        outdata << " nfreqs " << vis.nfreqs << " nside " << nside;
        outdata << " fov " << fov << " bsq_int " << bsq_int << std::endl;
        outdata << "# freqs";
        for(int f = 0; f < nfreqs; f++) {
            outdata << " " << freqs[f];
        }
        outdata << std::endl;
        outdata << "# time_jd baseline sky (re im) x nfreqs" << std::endl;
        outdata << std::setprecision(12);
        for(long k = 0; k < vis.nblts; k++)
        {
            for(int s = 0; s < vis.nskies; s++)
            {
                outdata << vis.time_array[k] << " " << vis.baseline_array[k] << " " << s;
                for(int f = 0; f < vis.nfreqs; f++) {
                    outdata << " " << vis.at(k, s, f).real() << " " << vis.at(k, s, f).imag();
                }
                outdata << std::endl;
            }
        }
        outdata.close();
        std::cerr << "visibilities written to " << output_path << std::endl;
    }
    catch(const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
