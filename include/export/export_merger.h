#pragma once

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace passport {

enum class GenderStyle {
    Letter,   // M / F
    Thai      // ชาย / หญิง
};

/**
 * @brief Export settings
 */
struct ExportOptions {
    GenderStyle genderStyle = GenderStyle::Letter;
    std::string sheetName = "Passport Data";   // fresh workbooks only

    void Show() const;
};

struct ExportResult {
    std::vector<uint8_t> workbook;   // .xlsx bytes
    std::string filename;
    int updatedRows = 0;
    int appendedRows = 0;
};

/**
 * @brief Writes passport records into a new or existing workbook
 *
 * A template keeps every part, row and style it already has. A row whose
 * passport number equals an incoming record's is updated in place; every
 * other record is appended after the last row in input order. Without a
 * template a fresh workbook with the standard header is produced through
 * the same path.
 */
class ExportMerger {
public:
    /// Fresh workbook header, in column order
    static const std::vector<std::string>& headers();

    /// Fresh workbook column widths (character units), same order as headers()
    static const std::vector<double>& columnWidths();

    explicit ExportMerger(const ExportOptions& options = ExportOptions());

    /**
     * @param records records to write, in output order
     * @param templateBytes existing .xlsx, empty for a fresh workbook
     * @param templateName original template file name, used for the output name
     * @param now timestamp for the output name
     * @throws TemplateUnreadableError when the template cannot be used; nothing is written
     */
    ExportResult merge(const std::vector<PassportRecord>& records,
                       const std::vector<uint8_t>& templateBytes = {},
                       const std::string& templateName = "",
                       std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /**
     * @brief passport_data_YYYY-MM-DD_HHMMSS.xlsx, or <template stem>_YYYY-MM-DD_HHMMSS.xlsx
     */
    static std::string outputFilename(const std::string& templateName,
                                      std::chrono::system_clock::time_point now);

    /// Value written to the sheet for a record field
    std::string cellValue(const PassportRecord& record, const std::string& fieldName) const;

private:
    ExportOptions options_;
};

} // namespace passport
