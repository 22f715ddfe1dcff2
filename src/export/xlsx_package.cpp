#include "export/xlsx_package.h"
#include "common/errors.h"
#include "common/logger.hpp"

#include <zip.h>

#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace passport {

namespace {

struct ZipErrorGuard {
    zip_error_t error;
    ZipErrorGuard() { zip_error_init(&error); }
    ~ZipErrorGuard() { zip_error_fini(&error); }
    std::string message() { return zip_error_strerror(&error); }
};

const char* kContentTypes =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
    R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)"
    R"(<Default Extension="xml" ContentType="application/xml"/>)"
    R"(<Override PartName="/xl/workbook.xml" ContentType="application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml"/>)"
    R"(<Override PartName="/xl/worksheets/sheet1.xml" ContentType="application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml"/>)"
    R"(<Override PartName="/xl/styles.xml" ContentType="application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml"/>)"
    R"(</Types>)";

const char* kRootRels =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="xl/workbook.xml"/>)"
    R"(</Relationships>)";

const char* kWorkbookRels =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="worksheets/sheet1.xml"/>)"
    R"(<Relationship Id="rId2" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles" Target="styles.xml"/>)"
    R"(</Relationships>)";

// cellXfs: 0 default, 1 header (bold white on blue, wrapped, bordered), 2 data (bordered)
const char* kStyles =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<styleSheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">)"
    R"(<fonts count="2">)"
    R"(<font><sz val="11"/><name val="Calibri"/></font>)"
    R"(<font><b/><sz val="11"/><color rgb="FFFFFFFF"/><name val="Calibri"/></font>)"
    R"(</fonts>)"
    R"(<fills count="3">)"
    R"(<fill><patternFill patternType="none"/></fill>)"
    R"(<fill><patternFill patternType="gray125"/></fill>)"
    R"(<fill><patternFill patternType="solid"><fgColor rgb="FF4472C4"/><bgColor rgb="FF4472C4"/></patternFill></fill>)"
    R"(</fills>)"
    R"(<borders count="2">)"
    R"(<border><left/><right/><top/><bottom/><diagonal/></border>)"
    R"(<border><left style="thin"/><right style="thin"/><top style="thin"/><bottom style="thin"/><diagonal/></border>)"
    R"(</borders>)"
    R"(<cellStyleXfs count="1"><xf numFmtId="0" fontId="0" fillId="0" borderId="0"/></cellStyleXfs>)"
    R"(<cellXfs count="3">)"
    R"(<xf numFmtId="0" fontId="0" fillId="0" borderId="0" xfId="0"/>)"
    R"(<xf numFmtId="0" fontId="1" fillId="2" borderId="1" xfId="0" applyFont="1" applyFill="1" applyBorder="1" applyAlignment="1">)"
    R"(<alignment horizontal="center" vertical="center" wrapText="1"/></xf>)"
    R"(<xf numFmtId="0" fontId="0" fillId="0" borderId="1" xfId="0" applyBorder="1" applyAlignment="1">)"
    R"(<alignment horizontal="left" vertical="center"/></xf>)"
    R"(</cellXfs>)"
    R"(<cellStyles count="1"><cellStyle name="Normal" xfId="0" builtinId="0"/></cellStyles>)"
    R"(</styleSheet>)";

std::string escapeAttribute(const std::string& text) {
    std::string out;
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

} // namespace

XlsxPackage XlsxPackage::fromBytes(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw TemplateUnreadableError("empty file");
    }

    ZipErrorGuard err;
    zip_source_t* source = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &err.error);
    if (!source) {
        throw TemplateUnreadableError(err.message());
    }
    zip_t* archive = zip_open_from_source(source, ZIP_RDONLY, &err.error);
    if (!archive) {
        zip_source_free(source);
        throw TemplateUnreadableError("not a zip archive (" + err.message() + ")");
    }

    XlsxPackage package;
    zip_int64_t total = zip_get_num_entries(archive, 0);
    for (zip_int64_t i = 0; i < total; ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(archive, i, 0, &st) != 0 || !st.name) {
            continue;
        }
        std::string name = st.name;
        if (!name.empty() && name.back() == '/') {
            continue;   // directory entry
        }

        std::string content(static_cast<size_t>(st.size), '\0');
        zip_file_t* file = zip_fopen_index(archive, i, 0);
        if (!file) {
            std::string what = zip_strerror(archive);
            zip_discard(archive);
            throw TemplateUnreadableError("cannot open entry " + name + ": " + what);
        }
        zip_int64_t n = st.size > 0 ? zip_fread(file, &content[0], st.size) : 0;
        zip_fclose(file);
        if (n < 0 || static_cast<zip_uint64_t>(n) != st.size) {
            zip_discard(archive);
            throw TemplateUnreadableError("truncated entry " + name);
        }
        package.entries_.emplace_back(std::move(name), std::move(content));
    }
    // Read-only archive: discard also frees the source
    zip_discard(archive);

    LOG_DEBUG("Read xlsx package: {} entries, {} bytes", package.entries_.size(), bytes.size());
    return package;
}

XlsxPackage XlsxPackage::blank(const std::string& sheetName, const std::vector<double>& columnWidths) {
    std::ostringstream workbook;
    workbook << R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
             << R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" )"
             << R"(xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">)"
             << R"(<sheets><sheet name=")" << escapeAttribute(sheetName) << R"(" sheetId="1" r:id="rId1"/></sheets>)"
             << R"(</workbook>)";

    std::ostringstream sheet;
    sheet << R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
          << R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">)"
          << R"(<dimension ref="A1"/>)";
    if (!columnWidths.empty()) {
        sheet << "<cols>";
        for (size_t i = 0; i < columnWidths.size(); ++i) {
            sheet << R"(<col min=")" << i + 1 << R"(" max=")" << i + 1
                  << R"(" width=")" << columnWidths[i] << R"(" customWidth="1"/>)";
        }
        sheet << "</cols>";
    }
    sheet << R"(<sheetData/></worksheet>)";

    XlsxPackage package;
    package.setEntry("[Content_Types].xml", kContentTypes);
    package.setEntry("_rels/.rels", kRootRels);
    package.setEntry("xl/workbook.xml", workbook.str());
    package.setEntry("xl/_rels/workbook.xml.rels", kWorkbookRels);
    package.setEntry("xl/styles.xml", kStyles);
    package.setEntry("xl/worksheets/sheet1.xml", sheet.str());
    return package;
}

bool XlsxPackage::has(const std::string& name) const {
    for (const auto& e : entries_) {
        if (e.first == name) return true;
    }
    return false;
}

const std::string& XlsxPackage::entry(const std::string& name) const {
    for (const auto& e : entries_) {
        if (e.first == name) return e.second;
    }
    throw std::out_of_range("no package entry " + name);
}

void XlsxPackage::setEntry(const std::string& name, const std::string& content) {
    for (auto& e : entries_) {
        if (e.first == name) {
            e.second = content;
            return;
        }
    }
    entries_.emplace_back(name, content);
}

std::vector<std::string> XlsxPackage::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.first);
    return out;
}

std::vector<uint8_t> XlsxPackage::toBytes() const {
    ZipErrorGuard err;
    zip_source_t* sink = zip_source_buffer_create(nullptr, 0, 0, &err.error);
    if (!sink) {
        throw std::runtime_error("zip buffer: " + err.message());
    }
    zip_t* archive = zip_open_from_source(sink, ZIP_TRUNCATE, &err.error);
    if (!archive) {
        zip_source_free(sink);
        throw std::runtime_error("zip open: " + err.message());
    }
    // Keep the sink alive past zip_close so the written bytes can be read back
    zip_source_keep(sink);

    for (const auto& e : entries_) {
        zip_source_t* data = zip_source_buffer(archive, e.second.data(), e.second.size(), 0);
        if (!data) {
            std::string what = zip_strerror(archive);
            zip_discard(archive);
            zip_source_free(sink);
            throw std::runtime_error("zip entry " + e.first + ": " + what);
        }
        if (zip_file_add(archive, e.first.c_str(), data, ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE) < 0) {
            std::string what = zip_strerror(archive);
            zip_source_free(data);
            zip_discard(archive);
            zip_source_free(sink);
            throw std::runtime_error("zip add " + e.first + ": " + what);
        }
    }
    if (zip_close(archive) != 0) {
        std::string what = zip_strerror(archive);
        zip_discard(archive);
        zip_source_free(sink);
        throw std::runtime_error("zip close: " + what);
    }

    std::vector<uint8_t> out;
    if (zip_source_open(sink) < 0) {
        zip_source_free(sink);
        throw std::runtime_error("zip reopen failed");
    }
    zip_source_seek(sink, 0, SEEK_END);
    zip_int64_t size = zip_source_tell(sink);
    zip_source_seek(sink, 0, SEEK_SET);
    if (size > 0) {
        out.resize(static_cast<size_t>(size));
        zip_int64_t n = zip_source_read(sink, out.data(), static_cast<zip_uint64_t>(size));
        if (n != size) {
            zip_source_close(sink);
            zip_source_free(sink);
            throw std::runtime_error("zip read back truncated");
        }
    }
    zip_source_close(sink);
    zip_source_free(sink);
    return out;
}

} // namespace passport
