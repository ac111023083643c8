#ifndef EORSKY_SPHTRIGOH
#define EORSKY_SPHTRIGOH

#include <math.h>

namespace SphericalTransformations
{ //begin namespace

void tangent_frame
(
    double lon_c, double lat_c,
    double zvec[3], double xvec[3], double yvec[3]
);

void za_az_pix
(
    double *za, double *az,
    const double zvec[3], const double xvec[3], const double yvec[3],
    const double svec[3]
);

double angular_separation
(
    double lon1, double lat1,
    double lon2, double lat2
);

} // end namespace

#endif
