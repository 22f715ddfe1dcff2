#pragma once

#include <string>
#include <vector>

namespace passport {

/**
 * @brief Greedy CTC decoding result
 */
struct CtcResult {
    std::string text;
    float confidence = 0.0f;             // mean of charConfidences
    std::vector<float> charConfidences;  // one per emitted dictionary entry
};

/**
 * @brief Greedy CTC decoder: argmax per step, merge repeats, drop blanks
 *
 * Index 0 is the blank; dictionary entries follow in file order, with an
 * optional trailing space entry.
 */
class CTCDecoder {
public:
    CTCDecoder() = default;

    /**
     * @brief Load a UTF-8 dictionary file, one entry per line
     * @return false when the file cannot be read or is empty
     */
    bool loadDictionary(const std::string& dictPath, bool useSpaceChar = true);

    /**
     * @brief Use an in-memory dictionary (index 0 blank is added)
     */
    void setDictionary(const std::vector<std::string>& entries, bool useSpaceChar = false);

    /**
     * @brief Decode one sequence
     * @param data row-major [timeSteps, numClasses] probabilities
     * @return empty result if numClasses does not match the dictionary
     */
    CtcResult decode(const float* data, int timeSteps, int numClasses) const;

    size_t dictSize() const { return dict_.size(); }

private:
    std::vector<std::string> dict_;
};

} // namespace passport
