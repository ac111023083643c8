#include <cmath>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include <boost/test/unit_test.hpp>

#include "Sky/skyshell.hpp"

BOOST_AUTO_TEST_SUITE(tskyshell)

BOOST_AUTO_TEST_CASE(npix2nside) {
  BOOST_CHECK_EQUAL(SkyShell::npix2nside(12), 1);
  BOOST_CHECK_EQUAL(SkyShell::npix2nside(12L * 64 * 64), 64);
  BOOST_CHECK_EQUAL(SkyShell::npix2nside(12L * 1024 * 1024), 1024);
  BOOST_CHECK_THROW(SkyShell::npix2nside(0), std::invalid_argument);
  BOOST_CHECK_THROW(SkyShell::npix2nside(13), std::invalid_argument);
  BOOST_CHECK_THROW(SkyShell::npix2nside(36), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(layout) {
  SkyShell shell(12 * 4 * 4, 3, 2);
  BOOST_CHECK_EQUAL(shell.get_nside(), 4);
  BOOST_CHECK_EQUAL(shell.nbytes(), sizeof(double) * 2 * 192 * 3);
  // mapped pages start zeroed
  BOOST_CHECK_EQUAL(shell.get_value(1, 191, 2), 0.0);

  shell.set_value(1, 10, 2, 7.5);
  BOOST_CHECK_EQUAL(shell.get_value(1, 10, 2), 7.5);
  BOOST_CHECK_EQUAL(shell.get_pixel(1, 10)[2], 7.5);
  BOOST_CHECK_EQUAL(shell.get_data()[(1 * 192 + 10) * 3 + 2], 7.5);
  BOOST_CHECK_EQUAL(shell.get_value(0, 10, 2), 0.0);

  BOOST_CHECK_THROW(SkyShell(0, 3), std::invalid_argument);
  BOOST_CHECK_THROW(SkyShell(192, 0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(gaussian_random_sky) {
  SkyShell a(12 * 8 * 8, 4);
  SkyShell b(12 * 8 * 8, 4);
  a.make_gaussian_random_sky(2.0, 42);
  b.make_gaussian_random_sky(2.0, 42);

  double sum = 0.0;
  double sum2 = 0.0;
  const long n = a.get_npixels() * a.get_nfreqs();
  for (long i = 0; i < n; ++i) {
    BOOST_REQUIRE_EQUAL(a.get_data()[i], b.get_data()[i]);
    sum += a.get_data()[i];
    sum2 += a.get_data()[i] * a.get_data()[i];
  }
  BOOST_CHECK_SMALL(sum / n, 0.15);
  BOOST_CHECK_CLOSE(std::sqrt(sum2 / n), 2.0, 5.0);

  BOOST_CHECK_THROW(a.make_gaussian_random_sky(0.0, 1), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(point_source_sky) {
  SkyShell shell(12 * 16 * 16, 2);
  shell.make_point_source_sky(0.3, -0.5, 10.0);

  int nonzero = 0;
  for (long p = 0; p < shell.get_npixels(); ++p) {
    if (shell.get_value(0, p, 0) != 0.0) {
      ++nonzero;
      BOOST_CHECK_EQUAL(shell.get_value(0, p, 0), 10.0);
      BOOST_CHECK_EQUAL(shell.get_value(0, p, 1), 10.0);
    }
  }
  BOOST_CHECK_EQUAL(nonzero, 1);
}

BOOST_AUTO_TEST_CASE(load_from_txt) {
  const std::string path = "tSkyShell_sky.txt";
  {
    std::ofstream out(path);
    for (int p = 0; p < 12; ++p) {
      out << p << " " << 0.5 * p << std::endl;
    }
  }
  SkyShell shell(12, 2, 2);
  shell.load_sky_data_from_txt(path, 1);
  BOOST_CHECK_EQUAL(shell.get_value(1, 11, 0), 11.0);
  BOOST_CHECK_EQUAL(shell.get_value(1, 11, 1), 5.5);
  BOOST_CHECK_EQUAL(shell.get_value(0, 11, 0), 0.0);

  BOOST_CHECK_THROW(shell.load_sky_data_from_txt(path, 2), std::invalid_argument);

  // three channels requested, two in the file
  SkyShell wide(12, 3);
  BOOST_CHECK_THROW(wide.load_sky_data_from_txt(path), std::length_error);
  // more pixels requested than lines in the file
  SkyShell large(48, 2);
  BOOST_CHECK_THROW(large.load_sky_data_from_txt(path), std::length_error);
  std::remove(path.c_str());

  BOOST_CHECK_THROW(shell.load_sky_data_from_txt("does_not_exist.txt"),
                    std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
