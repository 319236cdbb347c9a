/**
 * Password Policy Tests
 */

#include <boost/test/unit_test.hpp>

#include "../password_policy.hpp"
#include "test_util.hpp"
#include <algorithm>

using namespace zeldwallet;
using namespace zeldwallet::test;

namespace {

bool has_warning(const PasswordCheck& check, const std::string& prefix) {
    return std::any_of(check.warnings.begin(), check.warnings.end(),
                       [&](const std::string& w) { return w.rfind(prefix, 0) == 0; });
}

} // namespace

BOOST_AUTO_TEST_SUITE(password_policy_tests)

BOOST_AUTO_TEST_CASE(strong_passwords_pass) {
    auto check = PasswordPolicy::check(STRONG_PASSWORD);
    BOOST_CHECK(check.is_valid);
    BOOST_CHECK_EQUAL(check.strength_score, 100);
    BOOST_CHECK(check.error_message.empty());
    BOOST_CHECK(check.warnings.empty());

    BOOST_CHECK(PasswordPolicy::check(OTHER_STRONG_PASSWORD).is_valid);
}

BOOST_AUTO_TEST_CASE(too_short) {
    auto check = PasswordPolicy::check("Ab1!Ab1!Ab1");
    BOOST_CHECK(!check.is_valid);
    BOOST_CHECK(check.error_message.find("at least 12") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(needs_three_character_classes) {
    BOOST_CHECK(!PasswordPolicy::check("alllowercaseletters").is_valid);
    BOOST_CHECK(!PasswordPolicy::check("lowercaseand12345").is_valid);
    BOOST_CHECK(PasswordPolicy::check("Lowercase-and-UPPER").is_valid);
}

BOOST_AUTO_TEST_CASE(common_passwords_rejected) {
    for (const char* password : {"Password123!", "Bitcoin2024!", "P@ssw0rd!!X9"}) {
        auto check = PasswordPolicy::check(password);
        BOOST_CHECK_MESSAGE(!check.is_valid, password);
        BOOST_CHECK(check.error_message.find("common") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(warnings_for_patterns_and_length) {
    auto check = PasswordPolicy::check("Kite-Moon-789q");
    BOOST_REQUIRE(check.is_valid);
    BOOST_CHECK(has_warning(check, "Contains sequential"));
    BOOST_CHECK(has_warning(check, "Consider using 16"));
    BOOST_CHECK_LT(check.strength_score, 100);

    auto repeated = PasswordPolicy::check("Kite-Mooon-Lamp-42");
    BOOST_REQUIRE(repeated.is_valid);
    BOOST_CHECK(has_warning(repeated, "Contains repeating"));
}

BOOST_AUTO_TEST_CASE(strength_descriptions) {
    BOOST_CHECK_EQUAL(PasswordPolicy::strength_description(10), "Weak");
    BOOST_CHECK_EQUAL(PasswordPolicy::strength_description(50), "Moderate");
    BOOST_CHECK_EQUAL(PasswordPolicy::strength_description(70), "Strong");
    BOOST_CHECK_EQUAL(PasswordPolicy::strength_description(100), "Very Strong");
}

BOOST_AUTO_TEST_SUITE_END()
