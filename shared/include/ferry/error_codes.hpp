/**
 * Ferry - Shared error codes used across client, server and engine layers.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ferry
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        InvalidArgument = 3,
        PermissionDenied = 4,
        NotFound = 5,
        OutOfRange = 6,
        Incomplete = 7,
        CorruptData = 8,
        IoError = 9,
        Busy = 10,
        Unsupported = 11,
        InternalError = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Structured failure raised by the transfer engine.
    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace ferry
