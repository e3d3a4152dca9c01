/**
 * MirrorSync - Error categories shared by the wire protocol and the server.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace mirrorsync
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        UnknownMessage = 1,
        InvalidPayload = 2,
        NotFound = 3,
        PermissionDenied = 4,
        Timeout = 5,
        InternalError = 6
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace mirrorsync
