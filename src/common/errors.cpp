#include "common/errors.h"

namespace passport {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SegmentationEmpty:      return "SegmentationEmpty";
        case ErrorKind::MrzNotFound:            return "MRZNotFound";
        case ErrorKind::ChecksumMismatch:       return "ChecksumMismatch";
        case ErrorKind::UnsupportedImageFormat: return "UnsupportedImageFormat";
        case ErrorKind::TemplateUnreadable:     return "TemplateUnreadable";
        case ErrorKind::OcrFailure:             return "OcrFailure";
        case ErrorKind::DocumentTimeout:        return "DocumentTimeout";
    }
    return "Unknown";
}

} // namespace passport
