#pragma once
#include <stdexcept>
#include <string>

namespace raptor {

    enum class ErrorCode {
        InvalidArgument,
        InvalidFormat,
        UnsupportedVersion,
        Truncated,
        CorruptRecord,
        DimensionMismatch,
        NotFound,
        ProviderError,
        InvariantViolation
    };

    const char* to_string(ErrorCode code);

    /**
     * @brief Domain failure raised by the store. OS-level I/O failures are
     * reported separately as std::system_error.
     */
    class Error : public std::runtime_error {
    public:
        Error(ErrorCode code, const std::string& message)
            : std::runtime_error(message), m_code(code) {}

        ErrorCode code() const noexcept { return m_code; }

    private:
        ErrorCode m_code;
    };

}
