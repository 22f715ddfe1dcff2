#include "export/workbook_reader.h"
#include "common/errors.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace passport {

namespace {

constexpr unsigned kParseOptions =
    pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata_single;

void loadPart(pugi::xml_document& doc, const XlsxPackage& package, const std::string& name) {
    const std::string& content = package.entry(name);
    pugi::xml_parse_result result = doc.load_buffer(content.data(), content.size(), kParseOptions);
    if (!result) {
        throw TemplateUnreadableError(name + ": " + result.description());
    }
}

std::string runText(const pugi::xml_node& node) {
    pugi::xml_node t = node.child("t");
    if (t) {
        return t.child_value();
    }
    std::string text;
    for (pugi::xml_node run : node.children("r")) {
        text += run.child("t").child_value();
    }
    return text;
}

} // namespace

std::string WorkbookReader::firstSheetPath(const XlsxPackage& package) {
    if (package.has("xl/workbook.xml") && package.has("xl/_rels/workbook.xml.rels")) {
        pugi::xml_document rels;
        loadPart(rels, package, "xl/_rels/workbook.xml.rels");
        std::map<std::string, std::string> targets;
        for (pugi::xml_node rel : rels.document_element().children("Relationship")) {
            targets[rel.attribute("Id").as_string()] = rel.attribute("Target").as_string();
        }

        pugi::xml_document workbook;
        loadPart(workbook, package, "xl/workbook.xml");
        pugi::xml_node sheet = workbook.document_element().child("sheets").child("sheet");
        if (sheet) {
            auto it = targets.find(sheet.attribute("r:id").as_string());
            if (it != targets.end() && !it->second.empty()) {
                std::string target = it->second;
                std::string path = target[0] == '/' ? target.substr(1) : "xl/" + target;
                if (package.has(path)) {
                    return path;
                }
            }
        }
    }
    if (package.has("xl/worksheets/sheet1.xml")) {
        return "xl/worksheets/sheet1.xml";
    }
    throw TemplateUnreadableError("no worksheet in package");
}

std::vector<std::string> WorkbookReader::sharedStrings(const XlsxPackage& package) {
    std::vector<std::string> strings;
    if (!package.has("xl/sharedStrings.xml")) {
        return strings;
    }
    pugi::xml_document doc;
    loadPart(doc, package, "xl/sharedStrings.xml");
    for (pugi::xml_node si : doc.document_element().children("si")) {
        strings.push_back(runText(si));
    }
    return strings;
}

std::string WorkbookReader::cellText(const pugi::xml_node& cell, const std::vector<std::string>& shared) {
    std::string type = cell.attribute("t").as_string();
    if (type == "inlineStr") {
        return runText(cell.child("is"));
    }
    pugi::xml_node v = cell.child("v");
    if (!v) {
        return "";
    }
    if (type == "s") {
        int index = v.text().as_int(-1);
        if (index >= 0 && index < static_cast<int>(shared.size())) {
            return shared[index];
        }
        return "";
    }
    return v.child_value();
}

bool WorkbookReader::parseCellRef(const std::string& ref, int& row, int& col) {
    size_t i = 0;
    int c = 0;
    while (i < ref.size() && std::isalpha(static_cast<unsigned char>(ref[i]))) {
        if (i == 3) {
            return false;
        }
        c = c * 26 + (std::toupper(static_cast<unsigned char>(ref[i])) - 'A' + 1);
        ++i;
    }
    if (i == 0 || i == ref.size() || ref.size() - i > 7 || c > kMaxColumns) {
        return false;
    }
    int r = 0;
    for (; i < ref.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(ref[i]))) {
            return false;
        }
        r = r * 10 + (ref[i] - '0');
    }
    if (r < 1 || r > kMaxRows) {
        return false;
    }
    row = r;
    col = c - 1;
    return true;
}

int WorkbookReader::rowNumber(const pugi::xml_node& row, int fallback) {
    pugi::xml_attribute attr = row.attribute("r");
    if (!attr) {
        return fallback;
    }
    const std::string text = attr.value();
    if (text.empty() || text.size() > 7 ||
        !std::all_of(text.begin(), text.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); })) {
        throw TemplateUnreadableError("bad row index '" + text + "'");
    }
    int r = std::stoi(text);
    if (r < 1 || r > kMaxRows) {
        throw TemplateUnreadableError("row index out of range: " + text);
    }
    return r;
}

int WorkbookReader::cellColumn(const pugi::xml_node& cell, int fallback) {
    pugi::xml_attribute attr = cell.attribute("r");
    if (!attr) {
        return fallback;
    }
    int r = 0;
    int c = 0;
    if (!parseCellRef(attr.value(), r, c)) {
        throw TemplateUnreadableError(std::string("bad cell reference '") + attr.value() + "'");
    }
    return c;
}

std::string WorkbookReader::columnName(int col) {
    std::string name;
    for (int n = col + 1; n > 0; n = (n - 1) / 26) {
        name.insert(name.begin(), static_cast<char>('A' + (n - 1) % 26));
    }
    return name;
}

WorkbookReader::Rows WorkbookReader::readFirstSheet(const XlsxPackage& package) {
    std::vector<std::string> shared = sharedStrings(package);

    pugi::xml_document sheet;
    loadPart(sheet, package, firstSheetPath(package));

    Rows rows;
    int nextRow = 1;
    for (pugi::xml_node rowNode : sheet.document_element().child("sheetData").children("row")) {
        int rowIndex = rowNumber(rowNode, nextRow);
        nextRow = rowIndex + 1;
        if (rows.size() < static_cast<size_t>(rowIndex)) {
            rows.resize(rowIndex);
        }
        auto& cells = rows[rowIndex - 1];

        int nextCol = 0;
        for (pugi::xml_node cell : rowNode.children("c")) {
            int c = cellColumn(cell, nextCol);
            nextCol = c + 1;
            if (cells.size() <= static_cast<size_t>(c)) {
                cells.resize(c + 1);
            }
            cells[c] = cellText(cell, shared);
        }
    }
    return rows;
}

WorkbookReader::Rows WorkbookReader::readFirstSheet(const std::vector<uint8_t>& bytes) {
    return readFirstSheet(XlsxPackage::fromBytes(bytes));
}

} // namespace passport
