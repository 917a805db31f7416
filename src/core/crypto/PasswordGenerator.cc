// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "PasswordGenerator.h"
#include "CipherEngine.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace Lockr {

namespace {

/// Punctuation counted as a symbol when rating a password
constexpr std::string_view RATED_SYMBOLS = "!@#$%^&*()_+-=[]{};':\"\\|,.<>/?";

constexpr std::array<std::string_view, 5> SEQUENCES = {
    "abcdefghijklmnopqrstuvwxyz", "0123456789", "qwertyuiop", "asdfghjkl", "zxcvbnm"};

std::string without(std::string_view source, std::string_view excluded) {
    std::string kept;
    kept.reserve(source.size());
    for (char c : source) {
        if (excluded.find(c) == std::string_view::npos) {
            kept.push_back(c);
        }
    }
    return kept;
}

bool has_sequence(std::string_view password) {
    std::string lowered(password);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (std::string_view sequence : SEQUENCES) {
        for (size_t i = 0; i + 3 <= sequence.size(); ++i) {
            std::string forward(sequence.substr(i, 3));
            std::string backward(forward.rbegin(), forward.rend());
            if (lowered.find(forward) != std::string::npos ||
                lowered.find(backward) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

bool has_triple(std::string_view password) {
    for (size_t i = 2; i < password.size(); ++i) {
        if (password[i] == password[i - 1] && password[i] == password[i - 2]) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string_view to_string(StrengthLevel level) noexcept {
    switch (level) {
    case StrengthLevel::VeryWeak: return "Very Weak";
    case StrengthLevel::Weak:     return "Weak";
    case StrengthLevel::Fair:     return "Fair";
    case StrengthLevel::Good:     return "Good";
    case StrengthLevel::Strong:   return "Strong";
    }
    return "Unknown";
}

size_t PasswordGenerator::random_index(size_t bound) {
    // Largest multiple of bound below 2^32; values at or above it are redrawn
    constexpr uint64_t RANGE = uint64_t{1} << 32;
    const uint64_t limit = RANGE - (RANGE % bound);

    while (true) {
        const auto bytes = CipherEngine::generate_random_bytes(4);
        const uint64_t value = (uint64_t{bytes[0]} << 24) | (uint64_t{bytes[1]} << 16) |
                               (uint64_t{bytes[2]} << 8) | uint64_t{bytes[3]};
        if (value < limit) {
            return static_cast<size_t>(value % bound);
        }
    }
}

VaultResult<std::string> PasswordGenerator::generate(const PasswordOptions& options) {
    if (options.length < MIN_LENGTH || options.length > MAX_LENGTH) {
        return std::unexpected(VaultError::ValidationError);
    }

    std::string excluded;
    if (options.exclude_similar) {
        excluded += SIMILAR;
    }
    if (options.exclude_ambiguous) {
        excluded += AMBIGUOUS;
    }

    std::vector<std::string> classes;
    const auto add_class = [&](bool enabled, std::string_view characters) {
        if (!enabled) {
            return;
        }
        std::string usable = without(characters, excluded);
        if (!usable.empty()) {
            classes.push_back(std::move(usable));
        }
    };
    add_class(options.include_uppercase, UPPERCASE);
    add_class(options.include_lowercase, LOWERCASE);
    add_class(options.include_numbers, NUMBERS);
    add_class(options.include_symbols, SYMBOLS);

    std::string alphabet;
    for (const auto& characters : classes) {
        alphabet += characters;
    }
    if (alphabet.empty()) {
        return std::unexpected(VaultError::ValidationError);
    }

    std::string password;
    password.reserve(options.length);
    for (const auto& characters : classes) {
        password.push_back(characters[random_index(characters.size())]);
    }
    while (password.size() < options.length) {
        password.push_back(alphabet[random_index(alphabet.size())]);
    }

    // Fisher-Yates, so the guaranteed characters do not sit at the front
    for (size_t i = password.size() - 1; i > 0; --i) {
        std::swap(password[i], password[random_index(i + 1)]);
    }
    return password;
}

VaultResult<std::vector<std::string>> PasswordGenerator::generate_multiple(
    size_t count, const PasswordOptions& options) {
    if (count == 0 || count > MAX_BATCH) {
        return std::unexpected(VaultError::ValidationError);
    }

    std::vector<std::string> passwords;
    passwords.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto password = generate(options);
        if (!password) {
            return std::unexpected(password.error());
        }
        passwords.push_back(std::move(*password));
    }
    return passwords;
}

PasswordStrength PasswordGenerator::evaluate(std::string_view password) {
    const auto contains_any = [password](auto predicate) {
        return std::any_of(password.begin(), password.end(), predicate);
    };
    const bool upper = contains_any([](unsigned char c) { return std::isupper(c) != 0; });
    const bool lower = contains_any([](unsigned char c) { return std::islower(c) != 0; });
    const bool digit = contains_any([](unsigned char c) { return std::isdigit(c) != 0; });
    const bool symbol = contains_any([](char c) { return RATED_SYMBOLS.find(c) != std::string_view::npos; });

    const std::array<bool, 8> points = {
        password.size() >= 12, password.size() >= 16,
        upper, lower, digit, symbol,
        !has_triple(password), !has_sequence(password)};

    PasswordStrength strength;
    strength.score = static_cast<int>(std::count(points.begin(), points.end(), true));

    if (strength.score >= 8) {
        strength.level = StrengthLevel::Strong;
    } else if (strength.score >= 6) {
        strength.level = StrengthLevel::Good;
    } else if (strength.score >= 4) {
        strength.level = StrengthLevel::Fair;
    } else if (strength.score >= 2) {
        strength.level = StrengthLevel::Weak;
    }

    const int pool = (upper ? 26 : 0) + (lower ? 26 : 0) + (digit ? 10 : 0) + (symbol ? 32 : 0);
    if (pool > 0) {
        strength.entropy_bits = static_cast<double>(password.size()) * std::log2(static_cast<double>(pool));
    }
    return strength;
}

}  // namespace Lockr
