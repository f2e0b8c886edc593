#include "ksau/error_codes.hpp"

#include <array>

namespace ksau
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 10> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::AuthError, "auth_error"},
            {ErrorCode::SessionError, "session_error"},
            {ErrorCode::ChunkUploadError, "chunk_upload_error"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::HashMismatch, "hash_mismatch"},
            {ErrorCode::Aborted, "aborted"},
            {ErrorCode::NetworkError, "network_error"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
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

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace ksau
