#include "mrz/checksum.h"

namespace passport {

namespace {
constexpr int kWeights[3] = {7, 3, 1};
}

int CheckDigit::charValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    if (c == '<') return 0;
    return -1;
}

int CheckDigit::compute(const std::string& data) {
    int sum = 0;
    for (size_t i = 0; i < data.size(); ++i) {
        int v = charValue(data[i]);
        if (v < 0) {
            return -1;
        }
        sum += v * kWeights[i % 3];
    }
    return sum % 10;
}

int CheckDigit::declaredValue(char check) {
    if (check >= '0' && check <= '9') return check - '0';
    if (check == '<') return 0;
    return -1;
}

bool CheckDigit::verify(const std::string& data, char check) {
    int expected = compute(data);
    int declared = declaredValue(check);
    return expected >= 0 && declared >= 0 && expected == declared;
}

} // namespace passport
