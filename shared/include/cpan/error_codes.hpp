/**
 * cpan - Error kinds shared by the client pipeline and the drive service.
 */
#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cpan
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        AuthExpired = 1,
        NotFound = 2,
        PermissionDenied = 3,
        Transient = 4,
        Cancelled = 5,
        PlanInvalid = 6,
        AlreadyExists = 7,
        InvalidArgument = 8,
        IoError = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Only transient conditions are worth another attempt; everything else is terminal.
    constexpr bool is_retryable(ErrorCode code) noexcept
    {
        return code == ErrorCode::Transient;
    }

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Maps an arbitrary exception escaping a transfer step onto an Error.
    Error classify_exception(const std::exception &ex);

} // namespace cpan
