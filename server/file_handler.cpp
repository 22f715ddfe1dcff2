#include "file_handler.h"
#include "common/logger.hpp"

#include "base64.h"

#include <cctype>
#include <stdexcept>

namespace passport_server {

std::string FileHandler::StripDataUrlPrefix(const std::string& data) {
    if (data.compare(0, 5, "data:") != 0) {
        return data;
    }
    size_t comma = data.find(',');
    if (comma == std::string::npos) {
        return data;
    }
    return data.substr(comma + 1);
}

bool FileHandler::DecodeBase64Data(const std::string& data, std::vector<uint8_t>& bytes) {
    bytes.clear();
    std::string payload = StripDataUrlPrefix(data);

    std::string compact;
    compact.reserve(payload.size());
    for (char c : payload) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '/' && c != '=' &&
            c != '-' && c != '_') {
            LOG_WARN("Base64 payload contains invalid character 0x{:02x}", static_cast<unsigned char>(c));
            return false;
        }
        compact.push_back(c);
    }
    if (compact.empty()) {
        return false;
    }

    std::string decoded;
    try {
        decoded = base64_decode(compact);
    } catch (const std::runtime_error& e) {
        LOG_WARN("Base64 decode failed: {}", e.what());
        return false;
    }
    if (decoded.empty()) {
        return false;
    }
    bytes.assign(decoded.begin(), decoded.end());
    return true;
}

std::string FileHandler::EncodeBase64(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return "";
    }
    return base64_encode(bytes.data(), bytes.size());
}

} // namespace passport_server
