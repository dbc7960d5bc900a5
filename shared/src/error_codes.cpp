#include "ferry/error_codes.hpp"

#include <array>

namespace ferry
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::PermissionDenied, "permission_denied"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::OutOfRange, "out_of_range"},
            {ErrorCode::Incomplete, "incomplete"},
            {ErrorCode::CorruptData, "corrupt_data"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::Busy, "busy"},
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

    TransferError::TransferError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

} // namespace ferry
