#pragma once

#include <string>
#include <vector>

namespace zeldwallet {

struct PasswordCheck {
    bool is_valid = false;
    int strength_score = 0;  // 0-100
    std::string error_message;
    std::vector<std::string> warnings;
};

// Strength rules applied to new wallet and backup passwords. Existing
// passwords are never re-checked, so an old weak password still unlocks.
//
// - At least MIN_LENGTH characters
// - At least three of: uppercase, lowercase, digit, special character
// - Not a common password, and not built around one
// - Strength score of at least MIN_ACCEPTABLE_SCORE
class PasswordPolicy {
public:
    static constexpr size_t MIN_LENGTH = 12;
    static constexpr size_t RECOMMENDED_LENGTH = 16;
    static constexpr int MIN_ACCEPTABLE_SCORE = 50;

    static PasswordCheck check(const std::string& password);

    // "Weak", "Moderate", "Strong" or "Very Strong"
    static std::string strength_description(int score);

private:
    static bool is_common(const std::string& password);
    static bool has_repeating_chars(const std::string& password);
    static bool has_sequential_chars(const std::string& password);
    static int diversity_score(const std::string& password);
    static int length_score(const std::string& password);
    static int complexity_score(const std::string& password);
    static int entropy_score(const std::string& password);

    PasswordPolicy() = delete;
};

} // namespace zeldwallet
