#include "fileq/error_codes.hpp"

#include <array>

namespace fileq
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
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::PermissionDenied, "permission_denied"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::VerificationFailed, "verification_failed"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::ConfigurationError, "configuration_error"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};
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

    ErrorCode error_code_from_errc(const std::error_code &ec) noexcept
    {
        if (!ec)
        {
            return ErrorCode::Ok;
        }
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
        {
            return ErrorCode::NotFound;
        }
        if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
            ec == std::errc::read_only_file_system)
        {
            return ErrorCode::PermissionDenied;
        }
        if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty)
        {
            return ErrorCode::AlreadyExists;
        }
        if (ec == std::errc::operation_not_supported || ec == std::errc::function_not_supported)
        {
            return ErrorCode::Unsupported;
        }
        return ErrorCode::IoError;
    }

} // namespace fileq
