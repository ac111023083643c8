#ifndef INCBPointh
#define INCBPointh

#include <sofa.h>

#define TAIMGPS 19.0

enum ClockType {
  CLK_UTC,
  CLK_UT1,
  CLK_TAI,
  CLK_GPS
};

struct AstroTime {
  double jd_tt[2];
  double jd_ut1[2];
  // TAI-UTC
  double dtai;
  // UT1-UTC
  double dut1;
  ClockType clock;
};

typedef struct AstroTime AstroTime_t;


class BPoint
{

/*  Site-bound transformation from observed (azimuth, zenith distance)
**  to ICRS (RA, Dec), built on SOFA's star-independent astrometry
**  parameters (iauASTROM):
**      eb     double[3]    SSB to observer (vector, au)
**      eh     double[3]    Sun to observer (unit vector)
**      v      double[3]    barycentric observer velocity (vector, c)
**      bpn    double[3][3] bias-precession-nutation matrix
**      along  double       longitude + s' (radians)
**      sphi   double       sine of geodetic latitude
**      cphi   double       cosine of geodetic latitude
**      eral   double       "local" Earth rotation angle (radians)
**      refa   double       refraction constant A (radians)  ***unused***
**      refb   double       refraction constant B (radians)  ***unused***
*/

  private:
    double site_longitude;
    double site_latitude;
    double site_height;
    double xpole;
    double ypole;
    double cip_x;
    double cip_y;
    double cio_s;
    AstroTime_t atime;
    iauASTROM a_sofa;
    double last_nutation_update;
    double nutation_update_interval;
    bool nutations_ok;
    bool debug;

    int compute_times(double jd);

    void get_nutations();

    int update_sofa();

  public:
    // longitude, latitude in radians, height in meters.
    BPoint(double longitude, double lat, double height,
           ClockType clock=CLK_UTC, bool dbg = false);

   ~BPoint() {};

    void set_earth_orientation(double dut1 = 0.0, double xp = 0.0, double yp = 0.0)
    {
      atime.dut1 = dut1; // seconds
      xpole = xp * DAS2R; // arcsec -> radians
      ypole = yp * DAS2R; // arcsec -> radians
    }

    void reprd ( const char* s, double ra, double dc );

    // Observed azimuth (N=0, E=90) and zenith distance to ICRS RA/Dec, all
    // in radians, at Julian date jd of the site clock. Returns 0 on error.
    int observed_to_icrs( double jd, double az, double zd, double *ra_ICRS, double *dec_ICRS );

    // ICRS coordinates of the local zenith.
    int zenith_to_icrs( double jd, double *ra_ICRS, double *dec_ICRS )
    {
      return observed_to_icrs( jd, 0.0, 0.0, ra_ICRS, dec_ICRS );
    }
};

#endif
