#pragma once

#include <string>

namespace passport {

/**
 * @brief ICAO 9303 check digit arithmetic
 *
 * Values: '0'-'9' -> 0-9, 'A'-'Z' -> 10-35, '<' -> 0.
 * Weights repeat 7, 3, 1; the check digit is the weighted sum mod 10.
 */
class CheckDigit {
public:
    /// @return numeric value of an MRZ character, -1 outside the alphabet
    static int charValue(char c);

    /// @return check digit 0-9, -1 if data holds a character outside the alphabet
    static int compute(const std::string& data);

    /**
     * @brief Value of a declared check-digit character
     * @return 0-9 for a digit, 0 for '<' (empty optional field), -1 otherwise
     */
    static int declaredValue(char check);

    static bool verify(const std::string& data, char check);
};

} // namespace passport
