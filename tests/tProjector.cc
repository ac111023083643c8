#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

#include <boost/test/unit_test.hpp>

#include <pointing.h>

#include "Projector/projector.hpp"
#include "Sphtrigo/sphtrigo.hpp"
#include "Units/units.hpp"

BOOST_AUTO_TEST_SUITE(tprojector)

namespace {

// pixel containing (lon, lat), degrees
int pixel_at(const Projector& projector, double lon, double lat) {
  return projector.hpxBase.ang2pix(
      pointing(M_PI_2 - lat * DEG2RAD, lon * DEG2RAD));
}

size_t find_pixel(const SkyPatch& patch, int pix) {
  return std::find(patch.pixels.begin(), patch.pixels.end(), pix) -
         patch.pixels.begin();
}

}  // namespace

BOOST_AUTO_TEST_CASE(fov_validation) {
  Projector projector(16);
  BOOST_CHECK(!projector.has_fov());
  BOOST_CHECK_THROW(projector.get_fov(), std::logic_error);
  BOOST_CHECK_THROW(projector.query_pixels(0.0, 0.0), std::logic_error);
  BOOST_CHECK_THROW(projector.set_fov(0.0), std::invalid_argument);
  BOOST_CHECK_THROW(projector.set_fov(361.0), std::invalid_argument);
  projector.set_fov(100.0);
  BOOST_CHECK_EQUAL(projector.get_fov(), 100.0);
  BOOST_CHECK_THROW(Projector(0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(pixels_within_half_fov) {
  const int nsides[] = {8, 32, 64};
  const double fovs[] = {10.0, 100.0, 180.0};
  for (int nside : nsides) {
    for (double fov : fovs) {
      Projector projector(nside);
      projector.set_fov(fov);
      const double lon = 123.0;
      const double lat = -30.7;
      SkyPatch patch = projector.calc_azza(lon, lat);
      BOOST_REQUIRE(patch.size() > 0);
      BOOST_REQUIRE_EQUAL(patch.za.size(), patch.size());
      BOOST_REQUIRE_EQUAL(patch.az.size(), patch.size());
      BOOST_CHECK(std::is_sorted(patch.pixels.begin(), patch.pixels.end()));
      for (size_t i = 0; i < patch.size(); ++i) {
        pointing ptg = projector.hpxBase.pix2ang(patch.pixels[i]);
        double sep = SphericalTransformations::angular_separation(
            lon * DEG2RAD, lat * DEG2RAD, ptg.phi, M_PI_2 - ptg.theta);
        BOOST_CHECK_LE(sep, 0.5 * fov * DEG2RAD + 1.0e-9);
        // zenith angle is the distance to the tangent point
        BOOST_CHECK_SMALL(patch.za[i] - sep, 1.0e-7);
        BOOST_CHECK_GE(patch.az[i], 0.0);
        BOOST_CHECK_LT(patch.az[i], 2.0 * M_PI);
      }
    }
  }
}

BOOST_AUTO_TEST_CASE(full_sky_fov) {
  Projector projector(4);
  projector.set_fov(360.0);
  BOOST_CHECK_EQUAL(projector.query_pixels(10.0, 20.0).size(), 12u * 4 * 4);
}

BOOST_AUTO_TEST_CASE(azimuth_orientation) {
  Projector projector(64);
  projector.set_fov(60.0);
  SkyPatch patch = projector.calc_azza(40.0, 0.0);

  size_t north = find_pixel(patch, pixel_at(projector, 40.0, 15.0));
  size_t east = find_pixel(patch, pixel_at(projector, 55.0, 0.0));
  size_t south = find_pixel(patch, pixel_at(projector, 40.0, -15.0));
  size_t west = find_pixel(patch, pixel_at(projector, 25.0, 0.0));
  BOOST_REQUIRE(north < patch.size());
  BOOST_REQUIRE(east < patch.size());
  BOOST_REQUIRE(south < patch.size());
  BOOST_REQUIRE(west < patch.size());

  // North is 0 and azimuth grows towards East
  BOOST_CHECK(patch.az[north] < 0.1 || patch.az[north] > 2.0 * M_PI - 0.1);
  BOOST_CHECK_SMALL(patch.az[east] - 0.5 * M_PI, 0.1);
  BOOST_CHECK_SMALL(patch.az[south] - M_PI, 0.1);
  BOOST_CHECK_SMALL(patch.az[west] - 1.5 * M_PI, 0.1);
  BOOST_CHECK_SMALL(patch.za[north] - 15.0 * DEG2RAD, 0.02);
}

BOOST_AUTO_TEST_CASE(pole_center) {
  Projector projector(32);
  projector.set_fov(20.0);
  SkyPatch patch = projector.calc_azza(0.0, 90.0);
  BOOST_REQUIRE(patch.size() > 0);
  for (size_t i = 0; i < patch.size(); ++i) {
    BOOST_CHECK(std::isfinite(patch.az[i]));
    BOOST_CHECK_LE(patch.za[i], 10.0 * DEG2RAD + 1.0e-9);
  }
}

BOOST_AUTO_TEST_CASE(angular_separation) {
  using SphericalTransformations::angular_separation;
  BOOST_CHECK_SMALL(angular_separation(1.0, 0.5, 1.0, 0.5), 1.0e-15);
  BOOST_CHECK_CLOSE(angular_separation(0.0, 0.0, M_PI_2, 0.0), M_PI_2, 1.0e-12);
  BOOST_CHECK_CLOSE(angular_separation(0.0, -M_PI_2, 2.0, M_PI_2), M_PI, 1.0e-12);
  BOOST_CHECK_CLOSE(angular_separation(0.3, 0.0, 0.3, 0.2), 0.2, 1.0e-10);
}

BOOST_AUTO_TEST_SUITE_END()
