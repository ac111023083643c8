#include "Beam/beam.hpp"
#include "Units/units.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

std::vector<double> Beam::evaluate
(
    const std::vector<double>& az,
    const std::vector<double>& za
) const
{
    std::vector<double> power(az.size());

    if(az.size() != za.size()) {
        throw std::invalid_argument("[ERROR] az and za must have the same size.");
    }
    for(size_t i = 0; i < az.size(); i++) {
        power[i] = beam_val(az[i], za[i]);
    }
    return power;
}

std::vector<double> Beam::evaluate
(
    const std::vector<double>& az,
    const std::vector<double>& za,
    double freq
) const
{
    std::vector<double> power(az.size());

    if(az.size() != za.size()) {
        throw std::invalid_argument("[ERROR] az and za must have the same size.");
    }
    for(size_t i = 0; i < az.size(); i++) {
        power[i] = beam_val(az[i], za[i], freq);
    }
    return power;
}

double UniformBeam::beam_val(double az, double za) const
{
    return 1.0;
}

double UniformBeam::beam_val(double az, double za, double freq) const
{
    return 1.0;
}

GaussianBeam::GaussianBeam(double _sigma)
{
    if(!(_sigma > 0.0)) {
        throw std::invalid_argument("[ERROR] Sigma required for gaussian beam.");
    }
    sigma = _sigma * DEG2RAD;
}

double GaussianBeam::sigma_from_fwhm(double fwhm)
{
    // FWHM = 2 \sqrt{2 \ln{2}} \sigma ~ 2.35482 \sigma
    return fwhm / 2.35482;
}

double GaussianBeam::beam_val(double az, double za) const
{
    return exp(-(za * za) / (2.0 * sigma * sigma));
}

double GaussianBeam::beam_val(double az, double za, double freq) const
{
    return beam_val(az, za);
}

PowerBeam::PowerBeam(const BeamTable& _table, int _pol) : table(_table)
{
    pol = _pol;
    check_pol();
    if(!table.splines_ready()) {
        table.build_splines();
    }
}

PowerBeam::PowerBeam(const std::string& path, int _pol, bool peakNormalize)
    : table(load_beam_table_from_txt(path))
{
    pol = _pol;
    check_pol();
    if(peakNormalize) {
        table.peak_normalize();
        table.build_splines();
    }
    #ifdef BEAM_DEBUG
    std::cerr << "PowerBeam::PowerBeam" << std::endl;
    std::cerr << "  " << table.get_nfreqs() << " channels, ";
    std::cerr << table.get_npols() << " polarizations, ";
    std::cerr << table.get_nza() << " x " << table.get_naz() << " grid." << std::endl;
    #endif
}

void PowerBeam::check_pol(void) const
{
    if(pol < 0 || pol >= table.get_npols()) {
        throw std::invalid_argument("[ERROR] Beam polarization index out of range.");
    }
}

double PowerBeam::beam_val(double az, double za) const
{
    return table.interpolate(0, pol, az, za);
}

double PowerBeam::beam_val(double az, double za, double freq) const
{
    return table.interpolate_freq(freq, pol, az, za);
}

std::vector<double> PowerBeam::evaluate
(
    const std::vector<double>& az,
    const std::vector<double>& za
) const
{
    return table.interpolate(0, pol, az, za);
}

std::vector<double> PowerBeam::evaluate
(
    const std::vector<double>& az,
    const std::vector<double>& za,
    double freq
) const
{
    return table.interpolate_freq(freq, pol, az, za);
}

std::unique_ptr<Beam> make_beam(const std::string& type, const BeamParams& params)
{
    if(type == "uniform") {
        return std::unique_ptr<Beam>(new UniformBeam());
    }
    if(type == "gaussian") {
        if(!params.hasSigma) {
            throw std::invalid_argument("[ERROR] Sigma required for gaussian beam.");
        }
        return std::unique_ptr<Beam>(new GaussianBeam(params.sigma));
    }
    if(type == "power") {
        if(params.path.empty()) {
            throw std::invalid_argument("[ERROR] Beam file path required for power beam.");
        }
        return std::unique_ptr<Beam>(
            new PowerBeam(params.path, params.pol, params.peakNormalize));
    }
    throw std::invalid_argument("[ERROR] Beam type " + type + " not available.");
}
