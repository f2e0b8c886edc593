/**
 * ksau - Error kinds shared by the upload engine and the command front end.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ksau
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        AuthError = 1,
        SessionError = 2,
        ChunkUploadError = 3,
        IoError = 4,
        HashMismatch = 5,
        Aborted = 6,
        NetworkError = 7,
        InvalidArgument = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code_(code) {}

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace ksau
