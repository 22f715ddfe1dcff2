#include "mrz/mrz_locator.h"
#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace passport {

namespace {

float charsetRatio(const std::string& text) {
    if (text.empty()) {
        return 0.0f;
    }
    auto valid = std::count_if(text.begin(), text.end(), MRZBlock::isMrzChar);
    return static_cast<float>(valid) / text.size();
}

// Length of the UTF-8 sequence starting with lead byte c
int utf8Length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

bool isFillerLookalike(const std::string& glyph) {
    return glyph == "\xC2\xAB"           // «
        || glyph == "\xE2\x80\xB9"       // ‹
        || glyph == "\xEF\xBC\x9C"       // fullwidth <
        || glyph == "\xE2\x9D\xAE";      // ❮
}

} // namespace

void LocatorConfig::Show() const {
    LOG_INFO("LocatorConfig:");
    LOG_INFO("  width={} +/-{}, minCharsetRatio={:.2f}, minFitScore={:.2f}, minLayoutScore={:.2f}",
             expectedWidth, widthTolerance, minCharsetRatio, minFitScore, minLayoutScore);
    LOG_INFO("  repairSplitLines={}", repairSplitLines);
}

MrzLocator::MrzLocator(const LocatorConfig& config, const SubstitutionTable& substitutions)
    : config_(config), substitutions_(substitutions) {
}

std::string MrzLocator::normalizeText(const std::string& text, const std::vector<float>& charConf,
                                      std::vector<float>& outConf) {
    std::string out;
    outConf.clear();
    size_t glyph = 0;
    for (size_t i = 0; i < text.size(); ++glyph) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        int len = std::min<int>(utf8Length(c), static_cast<int>(text.size() - i));
        float conf = glyph < charConf.size() ? charConf[glyph] : -1.0f;

        if (len == 1) {
            if (!std::isspace(c)) {
                out += static_cast<char>(std::toupper(c));
                outConf.push_back(conf);
            }
        } else {
            out += isFillerLookalike(text.substr(i, len)) ? kFiller : '?';
            outConf.push_back(conf);
        }
        i += len;
    }

    // Only keep confidences when every character had one
    if (std::any_of(outConf.begin(), outConf.end(), [](float v) { return v < 0.0f; })) {
        outConf.clear();
    }
    return out;
}

std::vector<MrzLocator::CleanLine> MrzLocator::cleanLines(const std::vector<OcrLine>& lines) const {
    std::vector<CleanLine> cleaned;
    cleaned.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        CleanLine line;
        line.text = normalizeText(lines[i].text, lines[i].charConfidences, line.conf);
        line.sourceIndex = static_cast<int>(i);
        if (line.text.empty()) {
            continue;
        }
        cleaned.push_back(std::move(line));
    }
    if (config_.repairSplitLines) {
        repairSplitLine1(cleaned);
    }
    for (auto& line : cleaned) {
        line.charsetRatio = charsetRatio(line.text);
    }
    return cleaned;
}

void MrzLocator::repairSplitLine1(std::vector<CleanLine>& lines) const {
    const int minWidth = config_.expectedWidth - config_.widthTolerance;
    const int maxWidth = config_.expectedWidth + config_.widthTolerance;

    for (size_t i = 0; i < lines.size(); ++i) {
        CleanLine& head = lines[i];
        if (head.text.compare(0, 2, "P<") != 0 || static_cast<int>(head.text.size()) >= minWidth) {
            continue;
        }
        // Absorb following fragments while they look like MRZ text and fit the width
        size_t next = i + 1;
        while (next < lines.size() && static_cast<int>(head.text.size()) < minWidth) {
            const CleanLine& tail = lines[next];
            int combined = static_cast<int>(head.text.size() + tail.text.size());
            if (combined > maxWidth || charsetRatio(tail.text) < config_.minCharsetRatio ||
                tail.text.compare(0, 2, "P<") == 0) {
                break;
            }
            bool keepConf = !head.conf.empty() && !tail.conf.empty();
            head.text += tail.text;
            if (keepConf) {
                head.conf.insert(head.conf.end(), tail.conf.begin(), tail.conf.end());
            } else {
                head.conf.clear();
            }
            ++next;
        }
        if (next > i + 1) {
            LOG_DEBUG("Rejoined {} fragments into MRZ line 1: {}", next - i, head.text);
            lines.erase(lines.begin() + i + 1, lines.begin() + next);
        }
    }
}

std::string MrzLocator::fitToWidth(const std::string& text, std::vector<float>& conf) const {
    std::string fitted = text;
    for (char& c : fitted) {
        if (!MRZBlock::isMrzChar(c)) {
            c = kFiller;
        }
    }
    const size_t width = static_cast<size_t>(config_.expectedWidth);
    if (fitted.size() > width) {
        fitted.resize(width);
        if (!conf.empty()) conf.resize(width);
    } else if (fitted.size() < width) {
        // Padded positions were never seen by OCR
        if (!conf.empty()) conf.resize(width, 0.0f);
        fitted.resize(width, kFiller);
    }
    return fitted;
}

float MrzLocator::layoutScore(const std::string& line1, const std::string& line2) const {
    auto digit = [this](char c) { return substitutions_.canBeDigit(c); };
    auto digitOrFiller = [this](char c) { return c == kFiller || substitutions_.canBeDigit(c); };
    auto alpha = [this](char c) { return c == kFiller || substitutions_.canBeLetter(c); };
    auto alnum = [](char c) { return MRZBlock::isMrzChar(c); };
    auto sex = [](char c) { return c == 'M' || c == 'F' || c == kFiller; };

    int matched = 0;
    // Line 1: 'P', type modifier, issuing state, names
    if (line1[0] == 'P') ++matched;
    for (int i = 1; i < kTd3LineLength; ++i) {
        if (alpha(line1[i])) ++matched;
    }

    for (int i = 0; i < kTd3LineLength; ++i) {
        char c = line2[i];
        bool ok;
        if (i <= 8) ok = alnum(c);
        else if (i == 9) ok = digit(c);
        else if (i <= 12) ok = alpha(c);
        else if (i <= 19) ok = digit(c);
        else if (i == 20) ok = sex(c);
        else if (i <= 27) ok = digit(c);
        else if (i <= 41) ok = alnum(c);
        else if (i == 42) ok = digitOrFiller(c);
        else ok = digit(c);
        if (ok) ++matched;
    }
    return static_cast<float>(matched) / (2 * kTd3LineLength);
}

LocatorResult MrzLocator::locate(const std::vector<OcrLine>& lines) const {
    LocatorResult best;
    std::vector<CleanLine> cleaned = cleanLines(lines);
    if (cleaned.size() < 2) {
        return best;
    }

    struct Scored {
        size_t index;
        float fit;
        float ratio;
        int deviation;
    };
    std::vector<Scored> accepted;

    for (size_t i = 0; i + 1 < cleaned.size(); ++i) {
        const CleanLine& a = cleaned[i];
        const CleanLine& b = cleaned[i + 1];
        int devA = std::abs(static_cast<int>(a.text.size()) - config_.expectedWidth);
        int devB = std::abs(static_cast<int>(b.text.size()) - config_.expectedWidth);
        if (devA > config_.widthTolerance || devB > config_.widthTolerance) {
            continue;
        }
        if (a.charsetRatio < config_.minCharsetRatio || b.charsetRatio < config_.minCharsetRatio) {
            continue;
        }

        // TD3 line 1 always opens with the document code 'P'
        if (a.text[0] != 'P') {
            continue;
        }

        std::vector<float> confA = a.conf, confB = b.conf;
        float ratio = (a.charsetRatio + b.charsetRatio) / 2.0f;
        float layout = layoutScore(fitToWidth(a.text, confA), fitToWidth(b.text, confB));
        float fit = 0.5f * ratio + 0.5f * layout;

        LOG_DEBUG("MRZ candidate lines {}+{}: ratio={:.3f} layout={:.3f} fit={:.3f}",
                  a.sourceIndex, b.sourceIndex, ratio, layout, fit);
        if (layout < config_.minLayoutScore || fit < config_.minFitScore) {
            continue;
        }
        accepted.push_back({i, fit, ratio, devA + devB});
    }

    if (accepted.empty()) {
        LOG_DEBUG("No MRZ found among {} lines", lines.size());
        return best;
    }

    constexpr float kEps = 1e-6f;
    auto winner = std::min_element(accepted.begin(), accepted.end(),
        [kEps](const Scored& x, const Scored& y) {
            if (std::fabs(x.ratio - y.ratio) > kEps) return x.ratio > y.ratio;
            if (x.deviation != y.deviation) return x.deviation < y.deviation;
            return x.index > y.index;   // lower on the page wins
        });

    const CleanLine& a = cleaned[winner->index];
    const CleanLine& b = cleaned[winner->index + 1];
    std::vector<float> confA = a.conf, confB = b.conf;
    std::string line1 = fitToWidth(a.text, confA);
    std::string line2 = fitToWidth(b.text, confB);

    best.block = MRZBlock::create(line1, line2, std::move(confA), std::move(confB));
    if (!best.block) {
        LOG_WARN("MRZ candidate rejected after normalisation: {} / {}", line1, line2);
        return best;
    }
    best.confidence = winner->fit;
    best.firstLineIndex = a.sourceIndex;
    best.charsetRatio = winner->ratio;
    best.widthDeviation = winner->deviation;

    LOG_DEBUG("MRZ located at line {} (fit {:.3f})", best.firstLineIndex, best.confidence);
    return best;
}

} // namespace passport
