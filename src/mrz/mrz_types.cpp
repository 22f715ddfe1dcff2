#include "mrz/mrz_types.h"

#include <numeric>

namespace passport {

bool MRZBlock::isMrzChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == kFiller;
}

std::optional<MRZBlock> MRZBlock::create(const std::string& line1, const std::string& line2,
                                         std::vector<float> charConfidences1,
                                         std::vector<float> charConfidences2) {
    if (line1.size() != static_cast<size_t>(kTd3LineLength) ||
        line2.size() != static_cast<size_t>(kTd3LineLength)) {
        return std::nullopt;
    }
    for (char c : line1 + line2) {
        if (!isMrzChar(c)) {
            return std::nullopt;
        }
    }

    MRZBlock block;
    block.line1_ = line1;
    block.line2_ = line2;
    if (charConfidences1.size() == line1.size()) block.conf1_ = std::move(charConfidences1);
    if (charConfidences2.size() == line2.size()) block.conf2_ = std::move(charConfidences2);
    return block;
}

std::optional<float> MRZBlock::meanConfidence(int line, int begin, int length) const {
    const std::vector<float>& conf = (line == 1) ? conf1_ : conf2_;
    if (conf.empty() || length <= 0 || begin < 0 || begin + length > kTd3LineLength) {
        return std::nullopt;
    }
    float sum = std::accumulate(conf.begin() + begin, conf.begin() + begin + length, 0.0f);
    return sum / length;
}

const MRZField* ParsedMrz::find(const std::string& name) const {
    auto it = fields.find(name);
    return it == fields.end() ? nullptr : &it->second;
}

} // namespace passport
