#include "mrz/mrz_parser.h"
#include "mrz/checksum.h"
#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace passport {

namespace {

// TD3 line 2 layout
constexpr int kPassportBegin = 0, kPassportLen = 9, kPassportCheck = 9;
constexpr int kNationalityBegin = 10, kNationalityLen = 3;
constexpr int kBirthBegin = 13, kBirthCheck = 19;
constexpr int kSexPos = 20;
constexpr int kExpiryBegin = 21, kExpiryCheck = 27;
constexpr int kPersonalBegin = 28, kPersonalLen = 14, kPersonalCheck = 42;
constexpr int kCompositeCheck = 43;
constexpr int kDateLen = 6;

// TD3 line 1 layout
constexpr int kDocTypeBegin = 0, kDocTypeLen = 2;
constexpr int kIssuerBegin = 2, kIssuerLen = 3;
constexpr int kNamesBegin = 5;

bool isLetter(char c) { return c >= 'A' && c <= 'Z'; }
bool isDigit(char c) { return c >= '0' && c <= '9'; }

bool lettersOrFiller(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return isLetter(c) || c == kFiller; }) &&
           std::any_of(s.begin(), s.end(), isLetter);
}

bool noDigits(const std::string& s) {
    return std::none_of(s.begin(), s.end(), isDigit);
}

std::string composeData(const std::string& line2) {
    return line2.substr(kPassportBegin, kPassportCheck + 1) +
           line2.substr(kBirthBegin, kBirthCheck - kBirthBegin + 1) +
           line2.substr(kExpiryBegin, kCompositeCheck - kExpiryBegin);
}

} // namespace

void ParserConfig::Show() const {
    LOG_INFO("ParserConfig:");
    LOG_INFO("  substitutions=[{}], maxAmbiguousPositions={}",
             substitutions.describe(), maxAmbiguousPositions);
}

MrzParser::MrzParser(const ParserConfig& config)
    : config_(config) {
}

bool MrzParser::isPlausibleDate(const std::string& yymmdd) {
    if (yymmdd.size() != static_cast<size_t>(kDateLen) ||
        !std::all_of(yymmdd.begin(), yymmdd.end(), isDigit)) {
        return false;
    }
    int month = std::stoi(yymmdd.substr(2, 2));
    int day = std::stoi(yymmdd.substr(4, 2));
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

std::string MrzParser::stripFiller(const std::string& raw) {
    std::string out = raw;
    std::replace(out.begin(), out.end(), kFiller, ' ');
    auto first = out.find_first_not_of(' ');
    if (first == std::string::npos) {
        return "";
    }
    auto last = out.find_last_not_of(' ');
    out = out.substr(first, last - first + 1);

    // Collapse inner runs of spaces left by multiple fillers
    std::string collapsed;
    for (char c : out) {
        if (c == ' ' && !collapsed.empty() && collapsed.back() == ' ') continue;
        collapsed += c;
    }
    return collapsed;
}

ParsedMrz MrzParser::parse(const MRZBlock& block) const {
    ParsedMrz out;
    const std::string& line1 = block.line1();
    const std::string& line2 = block.line2();

    // Line 1
    MRZField docType;
    docType.name = mrz_field::kDocumentType;
    docType.line = 1;
    docType.begin = kDocTypeBegin;
    docType.length = kDocTypeLen;
    docType.raw = line1.substr(kDocTypeBegin, kDocTypeLen);
    docType.value = stripFiller(docType.raw);
    docType.plausible = docType.raw[0] == 'P';
    out.fields[docType.name] = docType;

    MRZField issuer;
    issuer.name = mrz_field::kIssuingCountry;
    issuer.line = 1;
    issuer.begin = kIssuerBegin;
    issuer.length = kIssuerLen;
    issuer.raw = line1.substr(kIssuerBegin, kIssuerLen);
    issuer.value = stripFiller(issuer.raw);
    issuer.plausible = lettersOrFiller(issuer.raw);
    out.fields[issuer.name] = issuer;

    parseNames(line1, out);

    // Line 2
    static const CheckedSpan kChecked[] = {
        {mrz_field::kPassportNumber, kPassportBegin, kPassportLen, kPassportCheck, false},
        {mrz_field::kDateOfBirth, kBirthBegin, kDateLen, kBirthCheck, true},
        {mrz_field::kExpiryDate, kExpiryBegin, kDateLen, kExpiryCheck, true},
        {mrz_field::kPersonalNumber, kPersonalBegin, kPersonalLen, kPersonalCheck, false},
    };

    // Corrections feed into the composite check
    std::string corrected = line2;
    for (const auto& span : kChecked) {
        std::string resolved;
        MRZField f = parseChecked(line2, span, resolved);
        corrected.replace(span.begin, span.length, resolved.substr(0, span.length));
        corrected[span.checkPos] = resolved.back();
        out.fields[f.name] = f;
    }

    MRZField nationality;
    nationality.name = mrz_field::kNationality;
    nationality.begin = kNationalityBegin;
    nationality.length = kNationalityLen;
    nationality.raw = line2.substr(kNationalityBegin, kNationalityLen);
    nationality.value = stripFiller(nationality.raw);
    nationality.plausible = lettersOrFiller(nationality.raw);
    out.fields[nationality.name] = nationality;

    MRZField sex;
    sex.name = mrz_field::kSex;
    sex.begin = kSexPos;
    sex.length = 1;
    sex.raw = line2.substr(kSexPos, 1);
    sex.plausible = sex.raw == "M" || sex.raw == "F" || sex.raw[0] == kFiller;
    sex.value = sex.raw[0] == kFiller ? "" : sex.raw;
    out.fields[sex.name] = sex;

    out.fields[mrz_field::kComposite] = parseComposite(corrected);

    // Final confidence per field
    out.blockValid = true;
    for (auto& entry : out.fields) {
        MRZField& f = entry.second;
        if (f.hasCheckDigit && !f.checksumValid) {
            out.blockValid = false;
        }
        bool high = f.checksumValid && f.plausible && !f.ambiguous;
        f.confidence = high ? FieldConfidence::High : FieldConfidence::Low;
    }

    LOG_DEBUG_EXEC(([&] {
        for (const auto& entry : out.fields) {
            const MRZField& f = entry.second;
            LOG_DEBUG("  {:<16} raw='{}' value='{}' check={} corrected={} ambiguous={} {}",
                      f.name, f.raw, f.value, f.hasCheckDigit ? (f.checksumValid ? "ok" : "FAIL") : "-",
                      f.corrected, f.ambiguous,
                      f.confidence == FieldConfidence::High ? "high" : "low");
        }
    }));
    return out;
}

MRZField MrzParser::parseChecked(const std::string& line2, const CheckedSpan& span,
                                 std::string& resolved) const {
    MRZField f;
    f.name = span.name;
    f.begin = span.begin;
    f.length = span.length;
    f.hasCheckDigit = true;
    f.raw = line2.substr(span.begin, span.length) + line2[span.checkPos];

    const std::string data = line2.substr(span.begin, span.length);
    const char check = line2[span.checkPos];
    const std::string text = data + check;
    resolved = text;

    auto finish = [&](const std::string& value, bool valid) {
        f.checksumValid = valid;
        f.value = span.numeric ? value : stripFiller(value);
        if (span.numeric) {
            f.plausible = isPlausibleDate(value);
        }
    };

    if (CheckDigit::verify(data, check)) {
        finish(data, true);
        return f;
    }

    // Positions where a look-alike may stand in; the check digit is last
    std::vector<int> positions;
    for (int i = 0; i < static_cast<int>(text.size()); ++i) {
        char c = text[i];
        char p = config_.substitutions.partner(c);
        if (p == '\0') continue;
        bool numericPos = span.numeric || i == span.length;
        // Numeric positions only accept a letter turning into a digit
        if (numericPos && !(isLetter(c) && isDigit(p))) continue;
        positions.push_back(i);
    }

    if (positions.empty() || static_cast<int>(positions.size()) > config_.maxAmbiguousPositions) {
        if (!positions.empty()) {
            LOG_DEBUG("{}: {} ambiguous characters, not attempting substitution",
                      span.name, positions.size());
        }
        finish(data, false);
        return f;
    }

    // A digit read as a letter is never taken on the checksum alone: a misread
    // check digit is satisfied by some such flip about one time in four
    std::vector<std::string> passing;
    bool needsLetter = false;
    const unsigned combos = 1u << positions.size();
    for (unsigned mask = 1; mask < combos; ++mask) {
        std::string variant = text;
        bool toLetter = false;
        for (size_t k = 0; k < positions.size(); ++k) {
            if (mask & (1u << k)) {
                char c = variant[positions[k]];
                toLetter = toLetter || isDigit(c);
                variant[positions[k]] = config_.substitutions.partner(c);
            }
        }
        if (CheckDigit::verify(variant.substr(0, span.length), variant.back())) {
            passing.push_back(variant);
            needsLetter = needsLetter || toLetter;
        }
    }

    if (passing.size() == 1 && !needsLetter) {
        LOG_DEBUG("{}: self-corrected '{}' -> '{}'", span.name, text, passing.front());
        f.corrected = true;
        resolved = passing.front();
        finish(resolved.substr(0, span.length), true);
        return f;
    }

    if (!passing.empty()) {
        LOG_DEBUG("{}: {} substitution candidate(s) pass the checksum{}, keeping '{}'",
                  span.name, passing.size(), needsLetter ? " by reading a digit as a letter" : "",
                  text);
        f.ambiguous = true;
    }
    finish(data, false);
    return f;
}

MRZField MrzParser::parseComposite(const std::string& line2) const {
    MRZField f;
    f.name = mrz_field::kComposite;
    f.begin = 0;
    f.length = kTd3LineLength;
    f.hasCheckDigit = true;
    f.raw = line2.substr(kCompositeCheck, 1);
    f.value = f.raw;

    const std::string data = composeData(line2);
    char check = line2[kCompositeCheck];
    f.checksumValid = CheckDigit::verify(data, check);
    if (!f.checksumValid) {
        char p = config_.substitutions.partner(check);
        if (isLetter(check) && isDigit(p) && CheckDigit::verify(data, p)) {
            f.checksumValid = true;
            f.corrected = true;
            f.value = std::string(1, p);
        }
    }
    return f;
}

void MrzParser::parseNames(const std::string& line1, ParsedMrz& out) const {
    const std::string section = line1.substr(kNamesBegin);
    std::string trimmed = section;
    while (!trimmed.empty() && trimmed.back() == kFiller) {
        trimmed.pop_back();
    }

    MRZField surname;
    surname.name = mrz_field::kSurname;
    surname.line = 1;
    surname.begin = kNamesBegin;

    MRZField given;
    given.name = mrz_field::kGivenNames;
    given.line = 1;

    auto boundary = trimmed.find("<<");
    std::string surnameRaw = trimmed;
    std::string givenRaw;
    if (boundary != std::string::npos) {
        surnameRaw = trimmed.substr(0, boundary);
        givenRaw = trimmed.substr(boundary + 2);
    } else {
        // A lone single '<' means the boundary was probably misread
        out.namesSeparated = trimmed.find(kFiller) == std::string::npos;
    }

    surname.length = static_cast<int>(surnameRaw.size());
    surname.raw = surnameRaw;
    surname.value = stripFiller(surnameRaw);
    surname.plausible = noDigits(surname.value);

    given.begin = boundary == std::string::npos ? kTd3LineLength
                                                : kNamesBegin + static_cast<int>(boundary) + 2;
    given.length = static_cast<int>(givenRaw.size());
    given.raw = givenRaw;

    // Single-letter tokens are almost always misread filler
    std::vector<std::string> tokens;
    std::stringstream ss(givenRaw);
    std::string token;
    while (std::getline(ss, token, kFiller)) {
        if (token.size() >= 2) {
            tokens.push_back(token);
        }
    }
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i) given.value += ' ';
        given.value += tokens[i];
    }
    given.plausible = noDigits(given.value) && out.namesSeparated;

    out.fields[surname.name] = surname;
    out.fields[given.name] = given;
}

} // namespace passport
