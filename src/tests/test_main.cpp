#define BOOST_TEST_MODULE TransitRelayTests
#include <boost/test/unit_test.hpp>
