/**
 * chunkup - Public error codes reported for failed or cancelled uploads.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkup
{

    enum class UploadErrorCode : std::int8_t
    {
        Unknown = -1,
        Cancelled = 0,
        File = 1,
        Http = 2,
        Connection = 3
    };

    std::string_view to_string(UploadErrorCode code) noexcept;

    constexpr std::int8_t to_int(UploadErrorCode code) noexcept
    {
        return static_cast<std::int8_t>(code);
    }

    UploadErrorCode error_code_from_int(std::int8_t value) noexcept;

} // namespace chunkup
