#include "export/export_merger.h"
#include "common/errors.h"
#include "common/logger.hpp"
#include "export/workbook_reader.h"
#include "export/xlsx_package.h"

#include <pugixml.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <map>
#include <sstream>

namespace passport {

namespace {

constexpr unsigned kParseOptions =
    pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata_single;

constexpr int kHeaderSearchRows = 10;

// Style indices of the fresh workbook's styles.xml
const char* kHeaderStyle = "1";
const char* kDataStyle = "2";

struct HeaderKeyword {
    const char* keyword;
    const char* fieldName;
};

// First match wins, so more specific keywords come first
const HeaderKeyword kHeaderKeywords[] = {
    {"passport", field::kPassportNumber},
    {"first name", field::kFirstName},
    {"given", field::kFirstName},
    {"middle", field::kMiddleName},
    {"last name", field::kLastName},
    {"surname", field::kLastName},
    {"family name", field::kLastName},
    {"gender", field::kGender},
    {"sex", field::kGender},
    {"nationality", field::kNationality},
    {"birth", field::kDateOfBirth},
};

std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string toUpper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

const char* matchHeader(const std::string& text) {
    std::string lower = toLower(text);
    for (const auto& k : kHeaderKeywords) {
        if (lower.find(k.keyword) != std::string::npos) {
            return k.fieldName;
        }
    }
    return nullptr;
}

int cellColumn(const pugi::xml_node& cell, int fallback) {
    return WorkbookReader::cellColumn(cell, fallback);
}

int rowNumber(const pugi::xml_node& row, int fallback) {
    return WorkbookReader::rowNumber(row, fallback);
}

void setAttribute(pugi::xml_node node, const char* name, const std::string& value) {
    pugi::xml_attribute attr = node.attribute(name);
    if (!attr) attr = node.append_attribute(name);
    attr.set_value(value.c_str());
}

/**
 * @brief Edits the <sheetData> of one worksheet
 */
class SheetEditor {
public:
    SheetEditor(pugi::xml_document& doc, const std::vector<std::string>& shared)
        : doc_(doc), shared_(shared) {
        sheetData_ = doc_.document_element().child("sheetData");
        if (!sheetData_) {
            throw TemplateUnreadableError("worksheet has no sheetData");
        }
        // Every row and cell reference is checked before anything is edited
        int nextRow = 1;
        for (pugi::xml_node row : sheetData_.children("row")) {
            nextRow = rowNumber(row, nextRow) + 1;
            int next = 0;
            for (pugi::xml_node cell : row.children("c")) {
                next = cellColumn(cell, next) + 1;
            }
        }
    }

    bool empty() const { return !sheetData_.child("row"); }

    int lastRow() const {
        int last = 0;
        int next = 1;
        for (pugi::xml_node row : sheetData_.children("row")) {
            int index = rowNumber(row, next);
            next = index + 1;
            last = std::max(last, index);
        }
        return last;
    }

    pugi::xml_node findRow(int r) const {
        int next = 1;
        for (pugi::xml_node row : sheetData_.children("row")) {
            int index = rowNumber(row, next);
            next = index + 1;
            if (index == r) return row;
        }
        return pugi::xml_node();
    }

    /// column -> text of one row
    std::map<int, std::string> rowText(int r) const {
        std::map<int, std::string> out;
        pugi::xml_node row = findRow(r);
        int next = 0;
        for (pugi::xml_node cell : row.children("c")) {
            int c = cellColumn(cell, next);
            next = c + 1;
            out[c] = WorkbookReader::cellText(cell, shared_);
        }
        return out;
    }

    std::string cellStyle(int r, int c) const {
        pugi::xml_node row = findRow(r);
        int next = 0;
        for (pugi::xml_node cell : row.children("c")) {
            int col = cellColumn(cell, next);
            next = col + 1;
            if (col == c) return cell.attribute("s").as_string();
        }
        return "";
    }

    void setText(int r, int c, const std::string& text, const std::string& style) {
        pugi::xml_node cell = ensureCell(ensureRow(r), r, c);
        if (!style.empty()) {
            setAttribute(cell, "s", style);
        }
        cell.remove_child("v");
        cell.remove_child("f");
        cell.remove_child("is");
        setAttribute(cell, "t", "inlineStr");
        pugi::xml_node t = cell.append_child("is").append_child("t");
        if (!text.empty() && (std::isspace(static_cast<unsigned char>(text.front())) ||
                              std::isspace(static_cast<unsigned char>(text.back())))) {
            t.append_attribute("xml:space") = "preserve";
        }
        t.text().set(text.c_str());
    }

    void setRowHeight(int r, double height) {
        pugi::xml_node row = ensureRow(r);
        setAttribute(row, "ht", std::to_string(height));
        setAttribute(row, "customHeight", "1");
    }

    void updateDimension() {
        pugi::xml_node dimension = doc_.document_element().child("dimension");
        if (!dimension) return;
        int maxRow = 0;
        int maxCol = 0;
        int nextRow = 1;
        for (pugi::xml_node row : sheetData_.children("row")) {
            int r = rowNumber(row, nextRow);
            nextRow = r + 1;
            int next = 0;
            for (pugi::xml_node cell : row.children("c")) {
                int c = cellColumn(cell, next);
                next = c + 1;
                maxRow = std::max(maxRow, r);
                maxCol = std::max(maxCol, c);
            }
        }
        std::string ref = maxRow == 0 ? "A1"
            : "A1:" + WorkbookReader::columnName(maxCol) + std::to_string(maxRow);
        setAttribute(dimension, "ref", ref);
    }

private:
    pugi::xml_node ensureRow(int r) {
        pugi::xml_node existing = findRow(r);
        if (existing) return existing;

        pugi::xml_node before;
        int next = 1;
        for (pugi::xml_node row : sheetData_.children("row")) {
            int index = rowNumber(row, next);
            next = index + 1;
            if (index > r) {
                before = row;
                break;
            }
        }
        pugi::xml_node row = before ? sheetData_.insert_child_before("row", before)
                                    : sheetData_.append_child("row");
        row.append_attribute("r") = r;
        return row;
    }

    pugi::xml_node ensureCell(pugi::xml_node row, int r, int c) {
        // spans is an optional hint; drop it rather than keep a stale one
        row.remove_attribute("spans");
        int next = 0;
        for (pugi::xml_node cell : row.children("c")) {
            int col = cellColumn(cell, next);
            next = col + 1;
            if (col == c) {
                if (!cell.attribute("r")) {
                    cell.append_attribute("r") = (WorkbookReader::columnName(c) + std::to_string(r)).c_str();
                }
                return cell;
            }
            if (col > c) {
                pugi::xml_node created = row.insert_child_before("c", cell);
                created.append_attribute("r") = (WorkbookReader::columnName(c) + std::to_string(r)).c_str();
                return created;
            }
        }
        pugi::xml_node created = row.append_child("c");
        created.append_attribute("r") = (WorkbookReader::columnName(c) + std::to_string(r)).c_str();
        return created;
    }

    pugi::xml_document& doc_;
    const std::vector<std::string>& shared_;
    pugi::xml_node sheetData_;
};

} // namespace

void ExportOptions::Show() const {
    LOG_INFO("ExportOptions: genderStyle={} sheetName={}",
             genderStyle == GenderStyle::Thai ? "thai" : "letter", sheetName);
}

const std::vector<std::string>& ExportMerger::headers() {
    static const std::vector<std::string> kHeaders = {
        "First Name", "Middle Name", "Last Name", "Gender", "Passport No.",
        "Nationality", "Birth Date (DD/MM/YYYY)", "Check-out Date", "Phone No."
    };
    return kHeaders;
}

const std::vector<double>& ExportMerger::columnWidths() {
    static const std::vector<double> kWidths = {18, 15, 20, 12, 20, 15, 25, 25, 18};
    return kWidths;
}

ExportMerger::ExportMerger(const ExportOptions& options)
    : options_(options) {
}

std::string ExportMerger::cellValue(const PassportRecord& record, const std::string& fieldName) const {
    const std::string& value = record.value(fieldName);
    if (fieldName == field::kFirstName || fieldName == field::kMiddleName ||
        fieldName == field::kLastName) {
        return toUpper(value);
    }
    if (fieldName == field::kGender && options_.genderStyle == GenderStyle::Thai) {
        if (value == "M") return "ชาย";
        if (value == "F") return "หญิง";
        return "";
    }
    return value;
}

std::string ExportMerger::outputFilename(const std::string& templateName,
                                         std::chrono::system_clock::time_point now) {
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H%M%S", &local);

    std::string stem = templateName;
    size_t slash = stem.find_last_of("/\\");
    if (slash != std::string::npos) stem = stem.substr(slash + 1);
    size_t dot = stem.find_last_of('.');
    if (dot != std::string::npos) stem = stem.substr(0, dot);
    if (stem.empty()) stem = "passport_data";

    return stem + "_" + stamp + ".xlsx";
}

ExportResult ExportMerger::merge(const std::vector<PassportRecord>& records,
                                 const std::vector<uint8_t>& templateBytes,
                                 const std::string& templateName,
                                 std::chrono::system_clock::time_point now) const {
    const bool fresh = templateBytes.empty();
    XlsxPackage package = fresh ? XlsxPackage::blank(options_.sheetName, columnWidths())
                                : XlsxPackage::fromBytes(templateBytes);

    const std::string sheetPath = WorkbookReader::firstSheetPath(package);
    const std::vector<std::string> shared = WorkbookReader::sharedStrings(package);

    pugi::xml_document doc;
    const std::string& sheetXml = package.entry(sheetPath);
    pugi::xml_parse_result parsed = doc.load_buffer(sheetXml.data(), sheetXml.size(), kParseOptions);
    if (!parsed) {
        throw TemplateUnreadableError(sheetPath + ": " + parsed.description());
    }
    SheetEditor sheet(doc, shared);

    // Header row
    int headerRow = 0;
    if (sheet.empty()) {
        headerRow = 1;
        const auto& titles = headers();
        for (size_t c = 0; c < titles.size(); ++c) {
            sheet.setText(headerRow, static_cast<int>(c), titles[c], fresh ? kHeaderStyle : "");
        }
        if (fresh) {
            sheet.setRowHeight(headerRow, 30.0);
        }
    } else {
        for (int r = 1; r <= kHeaderSearchRows && headerRow == 0; ++r) {
            for (const auto& cell : sheet.rowText(r)) {
                const char* name = matchHeader(cell.second);
                if (name && std::string(name) == field::kPassportNumber) {
                    headerRow = r;
                    break;
                }
            }
        }
        if (headerRow == 0) {
            throw TemplateUnreadableError("no passport number column in the first "
                                          + std::to_string(kHeaderSearchRows) + " rows");
        }
    }

    std::map<std::string, int> columns;   // record field -> column
    for (const auto& cell : sheet.rowText(headerRow)) {
        const char* name = matchHeader(cell.second);
        if (name && columns.find(name) == columns.end()) {
            columns[name] = cell.first;
        }
    }
    const int passportCol = columns.at(field::kPassportNumber);
    LOG_DEBUG("Export header at row {}, {} mapped columns", headerRow, columns.size());

    // Existing rows by passport number (first occurrence)
    std::map<std::string, int> rowByPassport;
    int lastRow = sheet.lastRow();
    for (int r = headerRow + 1; r <= lastRow; ++r) {
        auto text = sheet.rowText(r);
        auto it = text.find(passportCol);
        if (it != text.end() && !it->second.empty() && rowByPassport.find(it->second) == rowByPassport.end()) {
            rowByPassport[it->second] = r;
        }
    }

    ExportResult result;
    for (const auto& record : records) {
        int targetRow = 0;
        bool update = false;
        if (!record.passportNumber.empty()) {
            auto it = rowByPassport.find(record.passportNumber);
            if (it != rowByPassport.end()) {
                targetRow = it->second;
                update = true;
            }
        }

        if (update) {
            for (const auto& col : columns) {
                sheet.setText(targetRow, col.second, cellValue(record, col.first), "");
            }
            ++result.updatedRows;
        } else {
            const int styleRow = lastRow > headerRow ? lastRow : 0;
            targetRow = lastRow + 1;
            for (const auto& col : columns) {
                std::string style = styleRow ? sheet.cellStyle(styleRow, col.second)
                                             : (fresh ? kDataStyle : "");
                sheet.setText(targetRow, col.second, cellValue(record, col.first), style);
            }
            if (fresh) {
                // Template-only columns stay blank but keep the grid
                for (int c = 0; c < static_cast<int>(headers().size()); ++c) {
                    bool mapped = false;
                    for (const auto& col : columns) mapped = mapped || col.second == c;
                    if (!mapped) sheet.setText(targetRow, c, "", kDataStyle);
                }
            }
            lastRow = targetRow;
            if (!record.passportNumber.empty()) {
                rowByPassport[record.passportNumber] = targetRow;
            }
            ++result.appendedRows;
        }
    }
    sheet.updateDimension();

    std::ostringstream out;
    doc.save(out, "", pugi::format_raw, pugi::encoding_utf8);
    package.setEntry(sheetPath, out.str());

    result.workbook = package.toBytes();
    result.filename = outputFilename(fresh ? "" : templateName, now);

    LOG_INFO("Export {}: {} appended, {} updated -> {} ({} bytes)",
             fresh ? "fresh workbook" : "template " + templateName,
             result.appendedRows, result.updatedRows, result.filename, result.workbook.size());
    return result;
}

} // namespace passport
