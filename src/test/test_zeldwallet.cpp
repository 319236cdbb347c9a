/**
 * Main test entry point for the zeldwallet test suite
 *
 * Initializes the Boost Unit Test Framework for all test files linked into
 * test_zeldwallet.
 */

#define BOOST_TEST_MODULE zeldwallet Test Suite
#include <boost/test/included/unit_test.hpp>

#include "../logging.hpp"

/**
 * Global test suite setup
 */
struct ZeldwalletTestSetup {
    ZeldwalletTestSetup() {
        // Keep the output readable; failures are reported by Boost.Test
        zeldwallet::Logger::instance().set_level(zeldwallet::LogLevel::LVL_ERROR);
    }
};

BOOST_GLOBAL_FIXTURE(ZeldwalletTestSetup);
