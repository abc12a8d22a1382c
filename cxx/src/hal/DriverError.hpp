/**
 * @file DriverError.hpp
 * @brief Error values shared by the driver, its platform boundary and callers.
 */

#ifndef HAL_DRIVER_ERROR_HPP
#define HAL_DRIVER_ERROR_HPP

#include <cstdint>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>

namespace hal {

/**
 * @brief A failed platform or driver operation.
 *
 * code carries the HRESULT of the failing call (Win32 errors are mapped
 * through HRESULT_FROM_WIN32), so the same value can be compared against
 * the platform's documented codes.
 */
struct DriverError {
    int32_t code = 0;
    std::string message;

    bool operator==(const DriverError&) const = default;
};

/**
 * @brief Result of an operation that produces no value: empty on success.
 */
using Status = std::optional<DriverError>;

namespace error_code {
    constexpr int32_t kInvalidArgument   = static_cast<int32_t>(0x80070057u); // E_INVALIDARG
    constexpr int32_t kUnexpected        = static_cast<int32_t>(0x8000FFFFu); // E_UNEXPECTED
    constexpr int32_t kUnsupportedFormat = static_cast<int32_t>(0x88890008u); // AUDCLNT_E_UNSUPPORTED_FORMAT
    constexpr int32_t kNotInitialized    = static_cast<int32_t>(0x88890001u); // AUDCLNT_E_NOT_INITIALIZED
}

/**
 * @brief Render a code the way the platform documents it, e.g. 0x88890008.
 */
inline std::string format_error_code(int32_t code) {
    char text[16];
    std::snprintf(text, sizeof(text), "0x%08X", static_cast<uint32_t>(code));
    return text;
}

inline DriverError make_error(int32_t code, const std::string& what) {
    return DriverError{code, what + " (" + format_error_code(code) + ")"};
}

/**
 * @brief Thrown when a driver cannot be constructed.
 */
class DriverException : public std::runtime_error {
public:
    explicit DriverException(DriverError error)
        : std::runtime_error(error.message)
        , error_(std::move(error))
    {}

    const DriverError& error() const noexcept { return error_; }

private:
    DriverError error_;
};

} // namespace hal

#endif // HAL_DRIVER_ERROR_HPP
