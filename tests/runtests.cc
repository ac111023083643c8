#define BOOST_TEST_MODULE eorsky
#include <boost/test/unit_test.hpp>
