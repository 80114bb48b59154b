/**
 * fileq - Error codes shared by the queue engine and its callers.
 */
#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace fileq
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        NotFound = 2,
        PermissionDenied = 3,
        AlreadyExists = 4,
        IoError = 5,
        VerificationFailed = 6,
        Cancelled = 7,
        ConfigurationError = 8,
        Unsupported = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    ErrorCode error_code_from_errc(const std::error_code &ec) noexcept;

} // namespace fileq
