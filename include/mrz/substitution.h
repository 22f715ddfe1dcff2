#pragma once

#include <string>
#include <utility>
#include <vector>

namespace passport {

/**
 * @brief Characters OCR confuses inside the MRZ font (0/O, 1/I, 5/S, 8/B ...)
 *
 * Pairs are symmetric; each character has at most one partner.
 */
class SubstitutionTable {
public:
    SubstitutionTable();
    explicit SubstitutionTable(const std::vector<std::pair<char, char>>& pairs);

    /// @return the partner of c, or '\0' when c is not ambiguous
    char partner(char c) const;

    bool isAmbiguous(char c) const { return partner(c) != '\0'; }

    /// c itself or its partner is a digit
    bool canBeDigit(char c) const;

    /// c itself or its partner is a letter
    bool canBeLetter(char c) const;

    const std::vector<std::pair<char, char>>& pairs() const { return pairs_; }

    /// "0O 1I 5S 8B"
    std::string describe() const;

private:
    std::vector<std::pair<char, char>> pairs_;
    char partner_[128] = {};
};

} // namespace passport
