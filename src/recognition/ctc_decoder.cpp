#include "recognition/ctc_decoder.h"
#include "common/logger.hpp"

#include <fstream>
#include <numeric>

namespace passport {

namespace {
constexpr int kBlankIndex = 0;
}

bool CTCDecoder::loadDictionary(const std::string& dictPath, bool useSpaceChar) {
    std::ifstream file(dictPath, std::ios::binary);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open dictionary file: {}", dictPath);
        return false;
    }

    std::vector<std::string> entries;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            entries.push_back(line);
        }
    }
    if (entries.empty()) {
        LOG_ERROR("Dictionary {} is empty", dictPath);
        return false;
    }

    setDictionary(entries, useSpaceChar);
    LOG_INFO("Loaded dictionary with {} entries (including blank)", dict_.size());
    return true;
}

void CTCDecoder::setDictionary(const std::vector<std::string>& entries, bool useSpaceChar) {
    dict_.clear();
    dict_.push_back("blank");
    dict_.insert(dict_.end(), entries.begin(), entries.end());
    if (useSpaceChar) {
        dict_.push_back(" ");
    }
}

CtcResult CTCDecoder::decode(const float* data, int timeSteps, int numClasses) const {
    CtcResult result;
    if (!data || timeSteps <= 0) {
        return result;
    }
    if (numClasses != static_cast<int>(dict_.size())) {
        LOG_ERROR("Dictionary size mismatch: model={}, dict={}", numClasses, dict_.size());
        return result;
    }

    int previous = -1;
    for (int t = 0; t < timeSteps; ++t) {
        const float* step = data + static_cast<size_t>(t) * numClasses;
        int best = 0;
        for (int c = 1; c < numClasses; ++c) {
            if (step[c] > step[best]) best = c;
        }
        // Repeats collapse unless separated by a blank
        if (best != kBlankIndex && best != previous) {
            result.text += dict_[best];
            result.charConfidences.push_back(step[best]);
        }
        previous = best;
    }

    if (!result.charConfidences.empty()) {
        result.confidence = std::accumulate(result.charConfidences.begin(),
                                            result.charConfidences.end(), 0.0f) /
                            result.charConfidences.size();
    }
    return result;
}

} // namespace passport
