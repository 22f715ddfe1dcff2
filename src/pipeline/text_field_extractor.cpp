#include "pipeline/text_field_extractor.h"
#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <sstream>

namespace passport {

namespace {

const std::vector<std::string> kSurnameLabels = {
    R"(\bSURNAME\b)", R"(\bFAMILY\s*NAME\b)", R"(\bLAST\s*NAME\b)", R"(\bNOM\b)"};
const std::vector<std::string> kGivenLabels = {
    R"(\bGIVEN\s*NAMES?\b)", R"(\bFIRST\s*NAME\b)", R"(\bFORENAMES?\b)", R"(\bPRENOMS?\b)"};
const std::vector<std::string> kPassportLabels = {
    R"(\bPASSPORT\s*(NO|NUMBER|N)\b\.?)", R"(\bDOCUMENT\s*(NO|NUMBER)\b\.?)"};
const std::vector<std::string> kBirthLabels = {
    R"(\bDATE\s*OF\s*BIRTH\b)", R"(\bBIRTH\s*DATE\b)", R"(\bDATE\s*DE\s*NAISSANCE\b)"};
const std::vector<std::string> kSexLabels = {R"(\bSEX\b)", R"(\bGENDER\b)", R"(\bSEXE\b)"};
const std::vector<std::string> kNationalityLabels = {R"(\bNATIONALITY\b)", R"(\bNATIONALITE\b)"};

// Longest names first so "UNITED STATES" wins over a shorter match
const std::vector<std::pair<std::string, std::string>> kCountryNames = {
    {"UNITED KINGDOM", "GBR"}, {"UNITED STATES", "USA"}, {"AUSTRALIAN", "AUS"},
    {"AUSTRALIA", "AUS"}, {"HUNGARIAN", "HUN"}, {"UKRAINIAN", "UKR"}, {"ROMANIAN", "ROU"},
    {"AMERICAN", "USA"}, {"CANADIAN", "CAN"}, {"THAILAND", "THA"}, {"GERMANY", "DEU"},
    {"HUNGARY", "HUN"}, {"ISRAELI", "ISR"}, {"ITALIAN", "ITA"}, {"MOLDOVAN", "MDA"},
    {"ROMANIA", "ROU"}, {"RUSSIAN", "RUS"}, {"SPANISH", "ESP"}, {"UKRAINE", "UKR"},
    {"BRITISH", "GBR"}, {"MOLDOVA", "MDA"}, {"CANADA", "CAN"}, {"FRANCE", "FRA"},
    {"FRENCH", "FRA"}, {"GERMAN", "DEU"}, {"ISRAEL", "ISR"}, {"MAGYAR", "HUN"},
    {"POLAND", "POL"}, {"POLISH", "POL"}, {"ROMANA", "ROU"}, {"RUSSIA", "RUS"},
    {"ITALY", "ITA"}, {"SPAIN", "ESP"}, {"THAI", "THA"},
};

const std::map<std::string, std::string> kMonths = {
    {"JAN", "01"}, {"FEB", "02"}, {"MAR", "03"}, {"APR", "04"}, {"MAY", "05"}, {"JUN", "06"},
    {"JUL", "07"}, {"AUG", "08"}, {"SEP", "09"}, {"OCT", "10"}, {"NOV", "11"}, {"DEC", "12"}};

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t:/-,.");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t:/-,.");
    return s.substr(first, last - first + 1);
}

bool matchesAny(const std::string& line, const std::vector<std::string>& patterns,
                std::smatch* match = nullptr) {
    for (const auto& p : patterns) {
        std::smatch m;
        if (std::regex_search(line, m, std::regex(p))) {
            if (match) *match = m;
            return true;
        }
    }
    return false;
}

// Letters and spaces only, collapsed
std::string lettersOnly(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
            out += c;
        } else if ((c == ' ' || c == '-') && !out.empty() && out.back() != ' ') {
            out += ' ';
        }
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

} // namespace

bool TextFields::empty() const {
    return lastName.empty() && givenNames.empty() && passportNumber.empty() &&
           dateOfBirth.empty() && gender.empty() && nationality.empty();
}

std::string TextFieldExtractor::countryCode(const std::string& text) {
    std::string u = upper(text);
    for (const auto& entry : kCountryNames) {
        if (u.find(entry.first) != std::string::npos) {
            return entry.second;
        }
    }
    return "";
}

std::string TextFieldExtractor::valueAfterLabel(const std::vector<std::string>& lines,
                                                const std::vector<std::string>& labels) const {
    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch m;
        if (!matchesAny(lines[i], labels, &m)) continue;

        std::string sameLine = trim(m.suffix().str());
        // Bilingual labels ("SURNAME / NOM") leave the second label behind
        if (sameLine.size() > 1 && !matchesAny(sameLine, labels)) {
            return sameLine;
        }
        for (size_t j = i + 1; j < std::min(lines.size(), i + 4); ++j) {
            std::string next = trim(lines[j]);
            if (next.size() < 2) continue;
            if (matchesAny(next, labels)) break;
            return next;
        }
    }
    return "";
}

std::string TextFieldExtractor::findDate(const std::vector<std::string>& lines) const {
    static const std::regex kNumeric(R"((\d{2})[/\-\.](\d{2})[/\-\.](\d{4}))");
    static const std::regex kWithMonth(R"((\d{1,2})\s*([A-Z]{3})[A-Z]*[/\s]*(?:[A-Z]{3,}\s*)?(\d{2,4}))");

    for (size_t i = 0; i < lines.size(); ++i) {
        if (!matchesAny(lines[i], kBirthLabels)) continue;

        std::string window;
        for (size_t j = i; j < std::min(lines.size(), i + 3); ++j) {
            window += lines[j] + " ";
        }
        std::smatch m;
        if (std::regex_search(window, m, kNumeric)) {
            return m[1].str() + "/" + m[2].str() + "/" + m[3].str();
        }
        if (std::regex_search(window, m, kWithMonth)) {
            auto month = kMonths.find(m[2].str());
            if (month == kMonths.end()) continue;
            std::string day = m[1].str();
            if (day.size() == 1) day = "0" + day;
            std::string year = m[3].str();
            if (year.size() == 2) {
                year = (std::stoi(year) <= 30 ? "20" : "19") + year;
            } else if (year.size() != 4) {
                continue;
            }
            return day + "/" + month->second + "/" + year;
        }
    }
    return "";
}

std::string TextFieldExtractor::findGender(const std::vector<std::string>& lines) const {
    static const std::regex kLetter(R"((?:^|[\s/])([MF])(?:$|[\s/]))");
    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch label;
        if (!matchesAny(lines[i], kSexLabels, &label)) continue;

        std::vector<std::string> candidates = {label.suffix().str()};
        for (size_t j = i + 1; j < std::min(lines.size(), i + 4); ++j) {
            candidates.push_back(lines[j]);
        }
        for (const auto& text : candidates) {
            std::string t = trim(text);
            if (t == "MALE") return "M";
            if (t == "FEMALE") return "F";
            std::smatch m;
            if (std::regex_search(t, m, kLetter)) {
                return m[1].str();
            }
        }
    }
    return "";
}

TextFields TextFieldExtractor::extract(const std::vector<OcrLine>& ocrLines) const {
    std::vector<std::string> lines;
    for (const auto& l : ocrLines) {
        std::string t = upper(trim(l.text));
        // MRZ lines carry no labels and only confuse the search
        if (!t.empty() && t.find("<<") == std::string::npos) {
            lines.push_back(t);
        }
    }

    TextFields out;

    out.lastName = lettersOnly(valueAfterLabel(lines, kSurnameLabels));

    out.givenNames = lettersOnly(valueAfterLabel(lines, kGivenLabels));

    static const std::regex kNumber(R"(\b([A-Z0-9]{6,9})\b)");
    std::string number = valueAfterLabel(lines, kPassportLabels);
    std::smatch m;
    if (std::regex_search(number, m, kNumber) &&
        std::any_of(m[1].first, m[1].second, [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        out.passportNumber = m[1].str();
    }

    out.dateOfBirth = findDate(lines);
    out.gender = findGender(lines);

    std::string nationality = valueAfterLabel(lines, kNationalityLabels);
    out.nationality = countryCode(nationality);
    if (out.nationality.empty()) {
        static const std::regex kCode(R"(^([A-Z]{3})\b)");
        if (std::regex_search(nationality, m, kCode)) {
            out.nationality = m[1].str();
        }
    }

    LOG_DEBUG("Text fields: last='{}' given='{}' number='{}' dob='{}' sex='{}' nat='{}'",
              out.lastName, out.givenNames, out.passportNumber, out.dateOfBirth,
              out.gender, out.nationality);
    return out;
}

int TextFieldExtractor::mergeInto(PassportRecord& record, const TextFields& text) {
    int filled = 0;
    auto fill = [&](const char* name, const std::string& value) {
        if (value.empty() || !record.value(name).empty()) {
            return;
        }
        record.setValue(name, value);
        // Printed-zone values have no checksum behind them
        record.flagLow(name);
        ++filled;
    };

    std::istringstream given(text.givenNames);
    std::string first, word, middle;
    given >> first;
    while (given >> word) {
        if (!middle.empty()) middle += ' ';
        middle += word;
    }

    fill(field::kLastName, text.lastName);
    fill(field::kFirstName, first);
    fill(field::kMiddleName, middle);
    fill(field::kPassportNumber, text.passportNumber);
    fill(field::kDateOfBirth, text.dateOfBirth);
    fill(field::kGender, text.gender);
    fill(field::kNationality, text.nationality);
    record.updateConfidence();
    return filled;
}

} // namespace passport
