#ifndef VECSYNC_CORE_ERROR_H_
#define VECSYNC_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace vecsync {
namespace core {

/**
 * @brief Base class for all vecsync errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        DIMENSION_MISMATCH = 3,
        UNSUPPORTED_TYPE = 4,
        EXTRACTION_FAILED = 5,
        PERSISTENCE_FAILED = 6,
        INDEX_CORRUPTION = 7,
        INTERNAL = 8
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

// Human readable name of an error code, used in logs and scan reports.
const char* error_code_name(Error::Code code);

} // namespace core
} // namespace vecsync

#endif // VECSYNC_CORE_ERROR_H_
