#include <math.h>
#include <stdio.h>

#include "BPoint.h"

BPoint::BPoint(double longitude, double lat, double height,
               ClockType clock, bool dbg)
{
    site_longitude = longitude; // radians
    site_latitude = lat; // radians
    site_height = height; // meters
    atime.clock = clock;
    atime.dut1 = 0.0;
    atime.dtai = 0.0;
    xpole = 0.0;
    ypole = 0.0;
    // Update precession/nutations every 60 seconds, which is *overkill*
    nutation_update_interval = 60.0;
    nutations_ok = false;
    last_nutation_update = 0.0;
    debug = dbg;
};

void BPoint::reprd ( const char* s, double ra, double dc )
{
    char pm;
    int i[4];
    printf ( "%25s", s );
    iauA2tf ( 7, ra, &pm, i );
    printf ( " %2.2d %2.2d %2.2d.%7.7d", i[0],i[1],i[2],i[3] );
    iauA2af ( 6, dc, &pm, i );
    printf ( " %c%2.2d %2.2d %2.2d.%6.6d\n", pm, i[0],i[1],i[2],i[3] );
}

int BPoint::compute_times(double jd)
/*
   Forms the two part TT and UT1 Julian dates of a Julian date read from
   the site clock. TAI-UTC is looked up on the calendar day of the sample;
   if a leap second happened since the previous sample the given UT1-UTC
   is corrected by the same amount.
*/
{
    double d1, d2, w, dtai;
    int stat, iy, imo, id;

    // This is SOFA's recommended method for forming the two part Julian date.
    d1 = DJ00;
    d2 = jd - DJ00;

    stat = iauJd2cal(d1, d2, &iy, &imo, &id, &w);
    if (stat != 0)
    {
        fprintf( stderr, "[ERROR] Could not get UTC date of JD %.6f.\n", jd );
        return 0;
    }
    stat = iauDat ( iy, imo, id, w, &dtai);
    if (stat < 0)
    {
        fprintf( stderr, "[ERROR] Could not get TAI-UTC for %04d-%02d-%02d.\n", iy, imo, id );
        return 0;
    }
    if (stat > 0)
    {
        fprintf( stderr, "[WARNING] TAI-UTC for %04d-%02d-%02d is dubious.\n", iy, imo, id );
    }
    if((atime.dtai > 0.0) && (atime.dtai != dtai))
    {
        atime.dut1 += (dtai - atime.dtai);
    }
    atime.dtai = dtai;

    atime.jd_ut1[0] = d1;
    atime.jd_tt[0]  = d1;
    atime.jd_tt[1]  = TTMTAI / DAYSEC;

    switch(atime.clock)
    {
        case CLK_UTC:
            atime.jd_ut1[1] =  d2 + atime.dut1 / DAYSEC;
            atime.jd_tt[1] += (d2 + atime.dtai / DAYSEC);
            break;
        case CLK_UT1:
            atime.jd_ut1[1] =  d2;
            atime.jd_tt[1] += (d2 + (atime.dtai - atime.dut1) / DAYSEC);
            break;
        case CLK_TAI:
            atime.jd_ut1[1] =  d2 + (atime.dut1 - atime.dtai) / DAYSEC;
            atime.jd_tt[1] +=  d2;
            break;
        case CLK_GPS:
            atime.jd_ut1[1] =  d2 + (TAIMGPS + atime.dut1 - atime.dtai) / DAYSEC;
            atime.jd_tt[1] += (d2 +  TAIMGPS / DAYSEC);
            break;
        default:
            fprintf( stderr, "[ERROR] Unknown clock type.\n" );
            return 0;
    }

    return 1;
}

void BPoint::get_nutations()
// This is SOFA's S00b. ~1 mas inaccuracy.
{
    double eqbpn[3][3];

    // Look ahead by half of the nutation_update_interval
    double jd_tt2 = atime.jd_tt[1] + nutation_update_interval / (2.0 * DAYSEC);

    /* Form the equinox based BPN matrix, IAU 2000/2000B. */
    iauPnm00b(atime.jd_tt[0], jd_tt2, eqbpn);

    /* Extract CIP X,Y. */
    iauBpn2xy(eqbpn, &cip_x, &cip_y);

    /* Obtain CIO locator s. */
    cio_s = iauS00(atime.jd_tt[0], jd_tt2, cip_x, cip_y);
}

int BPoint::update_sofa()
{
    double pvh[2][3], pvb[2][3];
    int stat;

    /* Earth position and velocity, heliocentric and barycentric (au, au/day). */
    stat = iauEpv00(atime.jd_tt[0], atime.jd_tt[1], pvh, pvb);
    if (stat != 0)
    {
        fprintf( stderr, "[WARNING] Earth ephemeris used outside 1900-2100.\n" );
    }

    /* TIO locator s'. */
    double sp = 0.0;

    /* Refraction constants A and B. */
    double refa = 0.0;
    double refb = 0.0;

    /* Polar motion */
    double xp = xpole;
    double yp = ypole;

    /* Earth rotation angle. */
    double theta = iauEra00(atime.jd_ut1[0], atime.jd_ut1[1]);

    /* Compute the star-independent astrometry parameters. */
    iauApco(atime.jd_tt[0], atime.jd_tt[1], pvb, pvh[0], cip_x, cip_y, cio_s, theta,
           site_longitude, site_latitude, site_height,
           xp, yp, sp, refa, refb, &a_sofa);

    return 1;
}

int BPoint::observed_to_icrs( double jd, double az, double zd, double *ra_ICRS, double *dec_ICRS )
{
    double ra_CIRS, dec_CIRS;
    double ctime = (jd - DJ00) * DAYSEC;

    if( !compute_times(jd) )
    {
        return 0;
    }
    if( !nutations_ok || fabs(ctime - last_nutation_update) >= nutation_update_interval )
    {
        get_nutations();
        last_nutation_update = ctime;
        nutations_ok = true;
    }
    if( !update_sofa() )
    {
        return 0;
    }
    /* Observed -> CIRS, no refraction. */
    iauAtoiq( "A", az, zd, &a_sofa, &ra_CIRS, &dec_CIRS );
    /* CIRS -> ICRS (aberration and light deflection removed). */
    iauAticq( ra_CIRS, dec_CIRS, &a_sofa, ra_ICRS, dec_ICRS );

    *ra_ICRS = iauAnp(*ra_ICRS);

    if(debug)
    {
        reprd( "observed -> ICRS:", *ra_ICRS, *dec_ICRS );
    }

    return 1;
}
