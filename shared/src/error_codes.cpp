#include "cpan/error_codes.hpp"

#include <array>
#include <filesystem>
#include <system_error>

namespace cpan
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::AuthExpired, "auth_expired"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::PermissionDenied, "permission_denied"},
            {ErrorCode::Transient, "transient"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::PlanInvalid, "plan_invalid"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::InternalError, "internal_error"},
        }};

        ErrorCode code_from_errc(const std::error_code &ec)
        {
            if (ec == std::errc::no_such_file_or_directory)
            {
                return ErrorCode::NotFound;
            }
            if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
            {
                return ErrorCode::PermissionDenied;
            }
            if (ec == std::errc::timed_out || ec == std::errc::resource_unavailable_try_again)
            {
                return ErrorCode::Transient;
            }
            return ErrorCode::IoError;
        }
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    Error::Error(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    Error classify_exception(const std::exception &ex)
    {
        if (const auto *error = dynamic_cast<const Error *>(&ex))
        {
            return *error;
        }
        if (const auto *fs_error = dynamic_cast<const std::filesystem::filesystem_error *>(&ex))
        {
            return Error(code_from_errc(fs_error->code()), fs_error->what());
        }
        if (const auto *system_error = dynamic_cast<const std::system_error *>(&ex))
        {
            return Error(code_from_errc(system_error->code()), system_error->what());
        }
        return Error(ErrorCode::InternalError, ex.what());
    }

} // namespace cpan
