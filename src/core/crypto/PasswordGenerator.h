// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef LOCKR_PASSWORD_GENERATOR_H
#define LOCKR_PASSWORD_GENERATOR_H

#include "../VaultError.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Lockr {

/**
 * @brief Character classes and length of a generated password
 */
struct PasswordOptions {
    size_t length = 12;
    bool include_uppercase = true;
    bool include_lowercase = true;
    bool include_numbers = true;
    bool include_symbols = true;
    bool exclude_similar = false;    ///< Drop il1Lo0O
    bool exclude_ambiguous = false;  ///< Drop brackets, quotes, slashes and similar punctuation
};

enum class StrengthLevel {
    VeryWeak,
    Weak,
    Fair,
    Good,
    Strong
};

[[nodiscard]] std::string_view to_string(StrengthLevel level) noexcept;

/**
 * @brief Heuristic rating of a password
 *
 * One point each for length >= 12, length >= 16, every character class
 * present, no run of three equal characters and no three-character
 * alphabet, digit or keyboard-row sequence. The level follows the score:
 * 2 Weak, 4 Fair, 6 Good, 8 Strong.
 */
struct PasswordStrength {
    int score = 0;
    StrengthLevel level = StrengthLevel::VeryWeak;
    double entropy_bits = 0.0;  ///< length * log2(size of the classes used)
};

/**
 * @brief Random passwords drawn from OpenSSL's CSPRNG
 *
 * Characters are picked with rejection sampling over RAND_bytes() output,
 * so every character of the alphabet is equally likely. A password of at
 * least as many characters as selected classes contains one character of
 * each class.
 */
class PasswordGenerator {
public:
    static constexpr size_t MIN_LENGTH = 4;
    static constexpr size_t MAX_LENGTH = 128;
    static constexpr size_t MAX_BATCH = 50;

    static constexpr std::string_view UPPERCASE = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    static constexpr std::string_view LOWERCASE = "abcdefghijklmnopqrstuvwxyz";
    static constexpr std::string_view NUMBERS = "0123456789";
    static constexpr std::string_view SYMBOLS = "!@#$%^&*()_+-=[]{}|;:,.<>?";
    static constexpr std::string_view SIMILAR = "il1Lo0O";
    static constexpr std::string_view AMBIGUOUS = "{}[]()/\\'\"`~,;.<>";

    /**
     * @brief Generate one password
     *
     * Errors:
     * - ValidationError: length outside [MIN_LENGTH, MAX_LENGTH], or the
     *   options leave no usable character
     *
     * @throws std::runtime_error if the CSPRNG fails
     */
    [[nodiscard]] static VaultResult<std::string> generate(const PasswordOptions& options = {});

    /**
     * @brief Generate count passwords with the same options
     * @param count 1 to MAX_BATCH
     */
    [[nodiscard]] static VaultResult<std::vector<std::string>> generate_multiple(
        size_t count, const PasswordOptions& options = {});

    [[nodiscard]] static PasswordStrength evaluate(std::string_view password);

    PasswordGenerator() = delete;

private:
    /// Uniform index in [0, bound) by rejection sampling
    [[nodiscard]] static size_t random_index(size_t bound);
};

}  // namespace Lockr

#endif  // LOCKR_PASSWORD_GENERATOR_H
