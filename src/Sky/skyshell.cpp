#include "skyshell.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

#include <sys/mman.h>

#include <healpix_base.h>
#include <pointing.h>

SkyShell::SkyShell(long npix, int nfreqs, int nskies)
{
    if(npix <= 0 || nfreqs <= 0 || nskies <= 0) {
        throw std::invalid_argument("[ERROR] SkyShell dimensions must be positive.");
    }
    nPixels = npix;
    nFreqs = nfreqs;
    nSkies = nskies;
    skyBufferSize = sizeof(double) * size_t(nskies) * size_t(npix) * size_t(nfreqs);
    buffersOK = false;
    allocate_buffers();
}

SkyShell::~SkyShell(void)
{
    if(buffersOK) {
        free_buffers();
    }
}

int SkyShell::npix2nside(long npix)
{
    long nside;

    if(npix < 12 || npix % 12 != 0) {
        throw std::invalid_argument("[ERROR] Invalid number of HEALPix pixels.");
    }
    nside = std::lround(std::sqrt(double(npix / 12)));
    if(12 * nside * nside != npix) {
        throw std::invalid_argument("[ERROR] Invalid number of HEALPix pixels.");
    }
    return int(nside);
}

int SkyShell::get_nside(void) const
{
    return npix2nside(nPixels);
}

const double* SkyShell::get_data(void) const
{
    const double* x = T;
    return x;
}

void SkyShell::allocate_buffers(void)
/**
 * Maps an anonymous shared region to store the shell. Pages are zero
 * filled by the kernel.
 */
{
    void* region;

    #ifdef SKY_DEBUG
    std::cerr << "SkyShell::allocate_buffers." << std::endl;
    std::cerr << "  mapping " << skyBufferSize << " bytes." << std::endl;
    #endif
    region = mmap(NULL, skyBufferSize, PROT_READ | PROT_WRITE,
        MAP_SHARED | MAP_ANONYMOUS, -1, 0);
    if(region == MAP_FAILED) {
        throw std::runtime_error("[ERROR] Could not allocate the sky shell buffer.");
    }
    T = static_cast<double*>(region);
    buffersOK = true;
}

void SkyShell::free_buffers(void)
{
    #ifdef SKY_DEBUG
    std::cerr << "SkyShell::free_buffers." << std::endl;
    #endif
    if(munmap(T, skyBufferSize) != 0) {
        std::cerr << "[WARNING] Could not unmap the sky shell buffer." << std::endl;
    }
    T = NULL;
    buffersOK = false;
}

void SkyShell::fill(double value)
{
    size_t n = size_t(nSkies) * size_t(nPixels) * size_t(nFreqs);
    for(size_t i = 0; i < n; i++) {
        T[i] = value;
    }
}

void SkyShell::load_sky_data_from_txt(std::string path, int sky)
/**
 * Loads one sky realization from a text file specified by the path
 * argument. The file must contain one line per pixel, in RING order, with
 * one column per frequency channel.
 */
{
    long pix;
    int f;
    std::string line;
    std::ifstream skyDataFile(path);

    #ifdef SKY_DEBUG
    std::cerr << "SkyShell::load_sky_data_from_txt." << std::endl;
    std::cerr << "  reading sky data from file " << path << std::endl;
    #endif
    if(sky < 0 || sky >= nSkies) {
        throw std::invalid_argument("[ERROR] Sky realization out of range.");
    }
    if(!skyDataFile.is_open()) {
        throw std::runtime_error("[ERROR] Could not open file " + path);
    }
    pix = 0;
    while(pix < nPixels && std::getline(skyDataFile, line))
    {
        std::istringstream iss(line);
        for(f = 0; f < nFreqs; f++)
        {
            double value;
            if(!(iss >> value)) {
                throw std::length_error("[ERROR] Not enough channels in line "
                    + std::to_string(pix + 1) + " of " + path);
            }
            set_value(sky, pix, f, value);
        }
        pix++;
    }
    if(pix != nPixels) {
        throw std::length_error("[ERROR] Only " + std::to_string(pix)
            + " pixels were read while " + std::to_string(nPixels) + " were expected.");
    }
}

void SkyShell::make_gaussian_random_sky(double sigma, unsigned int seed)
{
    if(!(sigma > 0.0)) {
        throw std::invalid_argument("[ERROR] Sky sigma must be positive.");
    }
    std::mt19937 generator(seed);
    std::normal_distribution<double> normal(0.0, sigma);
    size_t n = size_t(nSkies) * size_t(nPixels) * size_t(nFreqs);

    for(size_t i = 0; i < n; i++) {
        T[i] = normal(generator);
    }
}

void SkyShell::make_point_source_sky(double ra0, double dec0, double T0)
/**
 * Sets the shell to zero everywhere except the pixel that contains
 * (ra0, dec0), both in radians, which gets T0 in every channel and
 * realization.
 */
{
    pointing ptgpix;
    int pix;
    Healpix_Base hpxBase(get_nside(), RING, SET_NSIDE);

    fill(0.0);
    ptgpix.theta = M_PI_2 - dec0;
    ptgpix.phi = ra0;
    pix = hpxBase.ang2pix(ptgpix);
    for(int s = 0; s < nSkies; s++) {
        for(int f = 0; f < nFreqs; f++) {
            set_value(s, pix, f, T0);
        }
    }
}
