/*
 * projector.hpp
 *
 * Projector selects the pixels of a HEALPix sphere that fall inside the
 * field of view around a pointing center and expresses their directions
 * as zenith angle and azimuth in the plane tangent to that center.
 *
 */

#ifndef EORSKY_PROJECTORH
#define EORSKY_PROJECTORH

#include <vector>

#include <healpix_base.h>

/* sky pixels seen from one pointing and their local coordinates. */
struct SkyPatch
{
    /* RING pixel indices, ascending. */
    std::vector<int> pixels;
    /* zenith angle of every pixel, radians. */
    std::vector<double> za;
    /* azimuth of every pixel, radians, North = 0 towards East. */
    std::vector<double> az;

    size_t size(void) const { return pixels.size(); };
};

class Projector
{
    public:

        Projector(int nside);
       ~Projector();

        int get_nside(void) const { return nside; };
        /* field of view (diameter), degrees. */
        void set_fov(double fov);
        double get_fov(void) const;
        bool has_fov(void) const { return fovOK; };
        /* pixels within fov/2 of (lon, lat), degrees. */
        std::vector<int> query_pixels(double lon, double lat) const;
        /* query_pixels() plus local (za, az) of every pixel. */
        SkyPatch calc_azza(double lon, double lat) const;

        Healpix_Base hpxBase;

    private:

        int nside;
        double fov;
        bool fovOK;
};

#endif
