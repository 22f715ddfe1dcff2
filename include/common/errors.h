#pragma once

#include <stdexcept>
#include <string>

namespace passport {

/**
 * @brief Failure categories reported by the pipeline and the export merger
 *
 * Only TemplateUnreadable aborts an operation; every other kind is attached
 * to the page or record it concerns and the batch continues.
 */
enum class ErrorKind {
    SegmentationEmpty,       // no passport-shaped region, whole page used
    MrzNotFound,             // record returned as manual-entry placeholder
    ChecksumMismatch,        // field flagged low confidence, value kept
    UnsupportedImageFormat,  // page skipped
    TemplateUnreadable,      // export aborted
    OcrFailure,              // OCR backend threw, placeholder record
    DocumentTimeout          // per-document deadline passed, placeholder record
};

/**
 * @brief Stable wire name, e.g. "MRZNotFound"
 */
const char* ToString(ErrorKind kind);

/**
 * @brief Non-fatal condition attached to a page result
 */
struct PipelineIssue {
    ErrorKind kind = ErrorKind::MrzNotFound;
    int pageIndex = -1;
    int regionIndex = -1;    // -1 when the issue concerns the whole page
    std::string message;
};

class TemplateUnreadableError : public std::runtime_error {
public:
    explicit TemplateUnreadableError(const std::string& what)
        : std::runtime_error("template unreadable: " + what) {}
};

class OcrError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace passport
