#include "mrz/substitution.h"

#include <cctype>

namespace passport {

SubstitutionTable::SubstitutionTable()
    : SubstitutionTable({{'0', 'O'}, {'1', 'I'}, {'5', 'S'}, {'8', 'B'}}) {
}

SubstitutionTable::SubstitutionTable(const std::vector<std::pair<char, char>>& pairs)
    : pairs_(pairs) {
    for (const auto& p : pairs_) {
        unsigned char a = static_cast<unsigned char>(p.first);
        unsigned char b = static_cast<unsigned char>(p.second);
        if (a < 128 && b < 128) {
            partner_[a] = p.second;
            partner_[b] = p.first;
        }
    }
}

char SubstitutionTable::partner(char c) const {
    unsigned char u = static_cast<unsigned char>(c);
    return u < 128 ? partner_[u] : '\0';
}

bool SubstitutionTable::canBeDigit(char c) const {
    if (std::isdigit(static_cast<unsigned char>(c))) return true;
    char p = partner(c);
    return p != '\0' && std::isdigit(static_cast<unsigned char>(p));
}

bool SubstitutionTable::canBeLetter(char c) const {
    if (c >= 'A' && c <= 'Z') return true;
    char p = partner(c);
    return p >= 'A' && p <= 'Z';
}

std::string SubstitutionTable::describe() const {
    std::string out;
    for (const auto& p : pairs_) {
        if (!out.empty()) out += ' ';
        out += p.first;
        out += p.second;
    }
    return out;
}

} // namespace passport
