#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace passport_server {

/**
 * @brief Base64 payload helpers for uploaded files
 */
class FileHandler {
public:
    /**
     * @brief Decode a Base64 payload, with or without a data URL prefix
     * @param data "iVBOR..." or "data:image/png;base64,iVBOR..."; line breaks are ignored
     * @param bytes receives the decoded bytes
     * @return false for an empty or malformed payload
     */
    static bool DecodeBase64Data(const std::string& data, std::vector<uint8_t>& bytes);

    static std::string EncodeBase64(const std::vector<uint8_t>& bytes);

    /**
     * @brief Remove a "data:<mime>;base64," prefix if present
     */
    static std::string StripDataUrlPrefix(const std::string& data);
};

} // namespace passport_server
