#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace passport {

/**
 * @brief In-memory view of an OOXML package (.xlsx is a zip of XML parts)
 *
 * Entries keep their archive order so a rewritten package differs from the
 * original only in the parts that were replaced.
 */
class XlsxPackage {
public:
    /**
     * @brief Read every file entry of a zip archive
     * @throws TemplateUnreadableError when the bytes are not a readable zip
     */
    static XlsxPackage fromBytes(const std::vector<uint8_t>& bytes);

    /**
     * @brief Minimal single-sheet workbook with the export styles and column widths
     * @param sheetName worksheet tab name
     * @param columnWidths widths of columns A.. in character units
     */
    static XlsxPackage blank(const std::string& sheetName,
                             const std::vector<double>& columnWidths);

    bool has(const std::string& name) const;

    /**
     * @brief Entry content
     * @throws std::out_of_range if the entry does not exist
     */
    const std::string& entry(const std::string& name) const;

    /// Replace an entry, or append it when new
    void setEntry(const std::string& name, const std::string& content);

    std::vector<std::string> names() const;

    /**
     * @brief Serialise to a zip archive
     * @throws std::runtime_error on libzip failure
     */
    std::vector<uint8_t> toBytes() const;

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace passport
