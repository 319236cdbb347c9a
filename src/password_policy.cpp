#include "password_policy.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace zeldwallet {

namespace {

const std::array<const char*, 48> COMMON_PASSWORDS = {
    "password", "123456", "123456789", "12345678", "12345", "1234567",
    "password1", "123123", "1234567890", "000000", "abc123", "qwerty",
    "iloveyou", "welcome", "monkey", "dragon", "master", "sunshine",
    "princess", "football", "baseball", "shadow", "trustno1", "letmein",
    "qwerty123", "admin", "welcome123", "passw0rd", "password123",
    "zxcvbnm", "p@ssw0rd", "superman", "starwars", "whatever", "computer",
    "internet", "changeme", "qwertyuiop", "freedom", "qazwsx", "bitcoin",
    "satoshi", "wallet", "mnemonic", "letmein123", "admin123", "default",
    "abcdef"
};

const std::array<const char*, 5> KEYBOARD_PATTERNS = {
    "qwerty", "asdfgh", "zxcvbn", "12345", "qazwsx"
};

std::string to_lower(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool has_upper(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isupper(c); });
}

bool has_lower(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::islower(c); });
}

bool has_digit(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool has_special(const std::string& s) {
    return std::any_of(s.begin(), s.end(),
                       [](unsigned char c) { return !std::isalnum(c) && !std::isspace(c); });
}

} // namespace

bool PasswordPolicy::is_common(const std::string& password) {
    std::string lower = to_lower(password);
    for (const char* common : COMMON_PASSWORDS) {
        std::string entry(common);
        if (lower == entry) {
            return true;
        }
        // "Password123!!" style variations
        if (entry.size() >= 6 && lower.find(entry) != std::string::npos &&
            lower.size() < entry.size() + 6) {
            return true;
        }
    }
    return false;
}

bool PasswordPolicy::has_repeating_chars(const std::string& password) {
    for (size_t i = 2; i < password.size(); ++i) {
        if (password[i] == password[i - 1] && password[i] == password[i - 2]) {
            return true;
        }
    }
    return false;
}

bool PasswordPolicy::has_sequential_chars(const std::string& password) {
    for (size_t i = 2; i < password.size(); ++i) {
        int c1 = static_cast<unsigned char>(password[i - 2]);
        int c2 = static_cast<unsigned char>(password[i - 1]);
        int c3 = static_cast<unsigned char>(password[i]);
        if ((c2 == c1 + 1 && c3 == c2 + 1) || (c2 == c1 - 1 && c3 == c2 - 1)) {
            return true;
        }
    }
    return false;
}

// 0-25
int PasswordPolicy::diversity_score(const std::string& password) {
    int score = 0;
    if (has_upper(password)) score += 6;
    if (has_lower(password)) score += 6;
    if (has_digit(password)) score += 6;
    if (has_special(password)) score += 7;
    return std::min(score, 25);
}

// 0-25: MIN_LENGTH earns 10, RECOMMENDED_LENGTH and above earns 25
int PasswordPolicy::length_score(const std::string& password) {
    size_t len = password.size();
    if (len < MIN_LENGTH) {
        return 0;
    }
    if (len >= RECOMMENDED_LENGTH) {
        return 25;
    }
    return 10 + static_cast<int>(((len - MIN_LENGTH) * 15) / (RECOMMENDED_LENGTH - MIN_LENGTH));
}

// 0-30, penalized for patterns
int PasswordPolicy::complexity_score(const std::string& password) {
    int score = 30;
    if (has_repeating_chars(password)) {
        score -= 10;
    }
    if (has_sequential_chars(password)) {
        score -= 10;
    }
    std::string lower = to_lower(password);
    for (const char* pattern : KEYBOARD_PATTERNS) {
        if (lower.find(pattern) != std::string::npos) {
            score -= 5;
            break;
        }
    }
    return std::max(0, score);
}

// 0-20, from length * log2(charset size); 80 bits earns the full score
int PasswordPolicy::entropy_score(const std::string& password) {
    size_t charset = 0;
    if (has_lower(password)) charset += 26;
    if (has_upper(password)) charset += 26;
    if (has_digit(password)) charset += 10;
    if (has_special(password)) charset += 32;
    if (charset == 0) {
        return 0;
    }
    double entropy = static_cast<double>(password.size()) * std::log2(static_cast<double>(charset));
    return std::min(static_cast<int>((entropy / 80.0) * 20.0), 20);
}

PasswordCheck PasswordPolicy::check(const std::string& password) {
    PasswordCheck result;

    if (password.size() < MIN_LENGTH) {
        result.error_message = "Password must be at least " + std::to_string(MIN_LENGTH) +
                               " characters long";
        return result;
    }

    int classes = static_cast<int>(has_upper(password)) + static_cast<int>(has_lower(password)) +
                  static_cast<int>(has_digit(password)) + static_cast<int>(has_special(password));
    if (classes < 3) {
        result.error_message = "Password must mix at least three of: uppercase letters, "
                               "lowercase letters, digits, special characters";
        return result;
    }

    if (is_common(password)) {
        result.error_message = "Password is too common and easily guessable";
        return result;
    }

    result.strength_score = diversity_score(password) + length_score(password) +
                            complexity_score(password) + entropy_score(password);
    if (result.strength_score < MIN_ACCEPTABLE_SCORE) {
        result.error_message = "Password is too weak (strength score: " +
                               std::to_string(result.strength_score) + "/100)";
        return result;
    }

    result.is_valid = true;
    if (has_repeating_chars(password)) {
        result.warnings.push_back("Contains repeating characters");
    }
    if (has_sequential_chars(password)) {
        result.warnings.push_back("Contains sequential characters");
    }
    if (password.size() < RECOMMENDED_LENGTH) {
        result.warnings.push_back("Consider using " + std::to_string(RECOMMENDED_LENGTH) +
                                  "+ characters");
    }
    return result;
}

std::string PasswordPolicy::strength_description(int score) {
    if (score < 40) {
        return "Weak";
    } else if (score < 60) {
        return "Moderate";
    } else if (score < 80) {
        return "Strong";
    }
    return "Very Strong";
}

} // namespace zeldwallet
