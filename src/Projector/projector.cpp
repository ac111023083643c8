#include "Projector/projector.hpp"
#include "Sphtrigo/sphtrigo.hpp"
#include "Units/units.hpp"

#include <iostream>
#include <stdexcept>

#include <pointing.h>
#include <rangeset.h>
#include <vec3.h>

Projector::Projector(int _nside)
{
    if(_nside < 1) {
        throw std::invalid_argument("[ERROR] Nside must be positive.");
    }
    nside = _nside;
    hpxBase.SetNside(nside, RING);
    fov = 0.0;
    fovOK = false;
}

Projector::~Projector()
{
}

void Projector::set_fov(double _fov)
{
    if(!(_fov > 0.0 && _fov <= 360.0)) {
        throw std::invalid_argument("[ERROR] Field of view must be in (0, 360] degrees.");
    }
    fov = _fov;
    fovOK = true;
}

double Projector::get_fov(void) const
{
    if(!fovOK) {
        throw std::logic_error("[ERROR] Need to set a field of view in degrees.");
    }
    return fov;
}

std::vector<int> Projector::query_pixels(double lon, double lat) const
/** Spherical cap query. Returns every pixel whose center lies within
 * fov/2 of (lon, lat), in ascending order.
 */
{
    int rn;
    std::vector<int> pixels;
    rangeset<int> capRanges;
    double radius = 0.5 * get_fov() * DEG2RAD;
    pointing center(M_PI_2 - lat * DEG2RAD, lon * DEG2RAD);

    hpxBase.query_disc(center, radius, capRanges);
    pixels.reserve(capRanges.nval());
    for(rn = 0; rn < int(capRanges.nranges()); rn++)
    {
        for(int pix = capRanges.ivbegin(rn); pix < capRanges.ivend(rn); pix++)
        {
            pixels.push_back(pix);
        }
    }
    return pixels;
}

SkyPatch Projector::calc_azza(double lon, double lat) const
/** Orthographic projection of the visible cap around (lon, lat), degrees.
 *
 * The projection is exact at the tangent point and distorts towards the
 * edge of the cap, which is acceptable for the fields of view this is
 * used with.
 */
{
    double zvec[3];
    double xvec[3];
    double yvec[3];
    double svec[3];
    SkyPatch patch;

    patch.pixels = query_pixels(lon, lat);
    patch.za.resize(patch.size());
    patch.az.resize(patch.size());

    SphericalTransformations::tangent_frame(
        lon * DEG2RAD, lat * DEG2RAD, zvec, xvec, yvec);
    for(size_t i = 0; i < patch.size(); i++)
    {
        vec3 s = hpxBase.pix2vec(patch.pixels[i]);
        svec[0] = s.x;
        svec[1] = s.y;
        svec[2] = s.z;
        SphericalTransformations::za_az_pix(
            &patch.za[i], &patch.az[i], zvec, xvec, yvec, svec);
    }
    #ifdef PROJECTOR_DEBUG
    std::cerr << "Projector::calc_azza" << std::endl;
    std::cerr << "  center (" << lon << ", " << lat << ") selected ";
    std::cerr << patch.size() << " pixels." << std::endl;
    #endif
    return patch;
}
