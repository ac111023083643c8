#include <cmath>
#include <stdexcept>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "Bpoint/BPoint.h"
#include "Observatory/observatory.hpp"
#include "Units/units.hpp"

BOOST_AUTO_TEST_SUITE(tpointing)

namespace {

const double kLatitude = -30.7215277777;
const double kLongitude = 21.4283055554;
const double kAltitude = 1073.0;
// 2000-01-01 12:00 UTC
const double kT0 = 2451545.0;

double WrapDegrees(double angle) {
  angle = std::fmod(angle, 360.0);
  return angle < 0.0 ? angle + 360.0 : angle;
}

}  // namespace

BOOST_AUTO_TEST_CASE(zenith_declination_is_latitude) {
  BPoint bpoint(kLongitude * DEG2RAD, kLatitude * DEG2RAD, kAltitude);
  double ra;
  double dec;
  for (int i = 0; i < 24; ++i) {
    BOOST_REQUIRE(bpoint.zenith_to_icrs(kT0 + i / 24.0, &ra, &dec));
    BOOST_CHECK_GE(ra, 0.0);
    BOOST_CHECK_LT(ra, 2.0 * M_PI);
    // precession, nutation and aberration stay well below 0.05 deg in 2000
    BOOST_CHECK_SMALL(dec * RAD2DEG - kLatitude, 0.05);
  }
}

BOOST_AUTO_TEST_CASE(zenith_drifts_at_sidereal_rate) {
  Observatory obs(kLatitude, kLongitude, std::vector<Baseline>(),
                  std::vector<double>(), kAltitude);
  std::vector<double> times;
  // one hour apart
  for (int i = 0; i < 6; ++i) times.push_back(kT0 + i / 24.0);
  obs.set_pointings(times);

  const std::vector<PointingCenter>& centers = obs.get_pointing_centers();
  BOOST_REQUIRE_EQUAL(centers.size(), times.size());
  BOOST_CHECK_EQUAL(obs.get_ntimes(), 6);
  for (size_t i = 1; i < centers.size(); ++i) {
    double step = WrapDegrees(centers[i].ra - centers[i - 1].ra);
    // 15 deg per hour times 1.00273791 solar to sidereal
    BOOST_CHECK_SMALL(step - 15.0410686, 0.01);
  }
}

BOOST_AUTO_TEST_CASE(zenith_ra_is_local_sidereal_time) {
  // GMST at 2000-01-01 12:00 UT1 is 280.46061837 deg
  const double lst = WrapDegrees(280.46061837 + kLongitude);
  Observatory obs(kLatitude, kLongitude, std::vector<Baseline>(),
                  std::vector<double>(), kAltitude);
  obs.set_pointings(std::vector<double>(1, kT0));

  double diff = WrapDegrees(obs.get_pointing_centers()[0].ra - lst + 180.0) - 180.0;
  BOOST_CHECK_SMALL(diff, 0.05);

  BPoint bpoint(kLongitude * DEG2RAD, kLatitude * DEG2RAD, kAltitude);
  double ra;
  double dec;
  BOOST_REQUIRE(bpoint.zenith_to_icrs(kT0, &ra, &dec));
  diff = WrapDegrees(ra * RAD2DEG - lst + 180.0) - 180.0;
  BOOST_CHECK_SMALL(diff, 0.05);
}

BOOST_AUTO_TEST_CASE(observed_offsets) {
  BPoint bpoint(kLongitude * DEG2RAD, kLatitude * DEG2RAD, kAltitude);
  double ra0;
  double dec0;
  double ra;
  double dec;
  BOOST_REQUIRE(bpoint.zenith_to_icrs(kT0, &ra0, &dec0));
  // 10 deg from the zenith towards the North increases the declination
  BOOST_REQUIRE(bpoint.observed_to_icrs(kT0, 0.0, 10.0 * DEG2RAD, &ra, &dec));
  BOOST_CHECK_SMALL((dec - dec0) * RAD2DEG - 10.0, 0.05);
  BOOST_CHECK_SMALL(WrapDegrees((ra - ra0) * RAD2DEG + 180.0) - 180.0, 0.05);
}

BOOST_AUTO_TEST_CASE(bad_pointings) {
  Observatory obs(kLatitude, kLongitude);
  std::vector<double> times;
  BOOST_CHECK_THROW(obs.set_pointings(times), std::invalid_argument);
  BOOST_CHECK_THROW(obs.get_pointing_centers(), std::logic_error);

  times.push_back(kT0);
  std::vector<PointingCenter> centers(2);
  BOOST_CHECK_THROW(obs.set_pointings(times, centers), std::invalid_argument);
  BOOST_CHECK_THROW(Observatory(91.0, 0.0), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
