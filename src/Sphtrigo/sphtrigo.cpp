#include "sphtrigo.hpp"

void SphericalTransformations::tangent_frame
(
    double lon_c, double lat_c,
    double zvec[3], double xvec[3], double yvec[3]
)
/*   Builds the orthonormal frame of the plane tangent to the sphere at
 *   (lon_c, lat_c).
 *
 *   Outputs:  zvec is the unit vector towards the tangent point (local zenith)
 *             xvec points East
 *             yvec points North, y = z cross x
 *
 *   Inputs:   lon_c  longitude (RA) of the tangent point, radians
 *             lat_c  latitude (Dec) of the tangent point, radians
 *
 *   x is the cross product of the polar axis with z. At the poles it
 *   vanishes and the East vector of lon_c is used instead, which is the
 *   limit of the cross product as lat_c approaches +-pi/2.
 */
{
  double clat = cos(lat_c);
  double slat = sin(lat_c);
  double clon = cos(lon_c);
  double slon = sin(lon_c);
  double norm;

  zvec[0] = clat * clon;
  zvec[1] = clat * slon;
  zvec[2] = slat;

  // (0, 0, 1) x z
  xvec[0] = -zvec[1];
  xvec[1] =  zvec[0];
  xvec[2] =  0.0;
  norm = sqrt(xvec[0] * xvec[0] + xvec[1] * xvec[1]);
  if(norm > 1.0e-12) {
    xvec[0] /= norm;
    xvec[1] /= norm;
  }
  else {
    xvec[0] = -slon;
    xvec[1] =  clon;
  }

  yvec[0] = zvec[1] * xvec[2] - zvec[2] * xvec[1];
  yvec[1] = zvec[2] * xvec[0] - zvec[0] * xvec[2];
  yvec[2] = zvec[0] * xvec[1] - zvec[1] * xvec[0];
}

void SphericalTransformations::za_az_pix
(
    double *za, double *az,
    const double zvec[3], const double xvec[3], const double yvec[3],
    const double svec[3]
)
/*   Zenith angle and azimuth of direction svec in the tangent frame built
 *   by tangent_frame(). This is an orthographic projection onto the
 *   tangent plane.
 *
 *   Outputs:  za is the angle between svec and zvec, in [0, pi]
 *             az is measured from North (yvec) towards East (xvec), in [0, 2 pi)
 */
{
  double sdotz = svec[0] * zvec[0] + svec[1] * zvec[1] + svec[2] * zvec[2];
  double sdotx = svec[0] * xvec[0] + svec[1] * xvec[1] + svec[2] * xvec[2];
  double sdoty = svec[0] * yvec[0] + svec[1] * yvec[1] + svec[2] * yvec[2];

  if(sdotz > 1.0)sdotz = 1.0;
  else if(sdotz < -1.0)sdotz = -1.0;
  *za = acos(sdotz);

  *az = atan2(sdotx, sdoty);
  if(*az < 0.0)*az += 2.0 * M_PI;
  if(*az >= 2.0 * M_PI)*az -= 2.0 * M_PI;
}

double SphericalTransformations::angular_separation
(
    double lon1, double lat1,
    double lon2, double lat2
)
/*   Great circle distance between two points (radians), Vincenty formula. */
{
  double dlon = lon2 - lon1;
  double sd = sin(dlon);
  double cd = cos(dlon);
  double s1 = sin(lat1);
  double c1 = cos(lat1);
  double s2 = sin(lat2);
  double c2 = cos(lat2);

  double num1 = c2 * sd;
  double num2 = c1 * s2 - s1 * c2 * cd;
  double denom = s1 * s2 + c1 * c2 * cd;

  return atan2(sqrt(num1 * num1 + num2 * num2), denom);
}
