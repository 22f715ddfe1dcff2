#pragma once

#include "export/xlsx_package.h"

#include <pugixml.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace passport {

/**
 * @brief Read-side helpers for SpreadsheetML (first worksheet only)
 */
class WorkbookReader {
public:
    /// Dense grid: rows[r][c] is the text of cell (r+1, column c)
    using Rows = std::vector<std::vector<std::string>>;

    /**
     * @brief Text of the first worksheet
     * @throws TemplateUnreadableError on a broken package or worksheet
     */
    static Rows readFirstSheet(const XlsxPackage& package);
    static Rows readFirstSheet(const std::vector<uint8_t>& bytes);

    /**
     * @brief Package path of the first worksheet, via workbook.xml and its relationships
     * @throws TemplateUnreadableError if no worksheet can be found
     */
    static std::string firstSheetPath(const XlsxPackage& package);

    /**
     * @brief Shared string table (rich text runs concatenated); empty when absent
     * @throws TemplateUnreadableError if the part exists but is not XML
     */
    static std::vector<std::string> sharedStrings(const XlsxPackage& package);

    /// Displayed text of a <c> element
    static std::string cellText(const pugi::xml_node& cell, const std::vector<std::string>& shared);

    /// SpreadsheetML grid limits (XFD1048576)
    static constexpr int kMaxRows = 1048576;
    static constexpr int kMaxColumns = 16384;

    /**
     * @brief Split "AB12" into row 12 and zero-based column 27
     * @return false for a malformed or out-of-grid reference; row and col are then untouched
     */
    static bool parseCellRef(const std::string& ref, int& row, int& col);

    /**
     * @brief One-based index of a <row>; fallback when it has no r attribute
     * @throws TemplateUnreadableError if r is not a row inside the grid
     */
    static int rowNumber(const pugi::xml_node& row, int fallback);

    /**
     * @brief Zero-based column of a <c>; fallback when it has no r attribute
     * @throws TemplateUnreadableError if r is not a cell reference
     */
    static int cellColumn(const pugi::xml_node& cell, int fallback);

    /// Zero-based column index to letters (0 -> "A", 27 -> "AB")
    static std::string columnName(int col);
};

} // namespace passport
