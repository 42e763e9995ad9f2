#include "vecsync/core/error.h"

namespace vecsync {
namespace core {

const char* error_code_name(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "Unknown";
        case Error::Code::INVALID_ARGUMENT: return "InvalidArgument";
        case Error::Code::NOT_FOUND: return "NotFound";
        case Error::Code::DIMENSION_MISMATCH: return "DimensionMismatch";
        case Error::Code::UNSUPPORTED_TYPE: return "UnsupportedType";
        case Error::Code::EXTRACTION_FAILED: return "ExtractionFailed";
        case Error::Code::PERSISTENCE_FAILED: return "PersistenceFailed";
        case Error::Code::INDEX_CORRUPTION: return "IndexCorruption";
        case Error::Code::INTERNAL: return "Internal";
    }
    return "Unknown";
}

} // namespace core
} // namespace vecsync
