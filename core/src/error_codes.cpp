#include "chunkup/error_codes.hpp"

#include <array>

namespace chunkup
{

    namespace
    {
        struct ErrorCodeDescription
        {
            UploadErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 5> kDescriptions{{
            {UploadErrorCode::Unknown, "unknown"},
            {UploadErrorCode::Cancelled, "cancelled"},
            {UploadErrorCode::File, "file"},
            {UploadErrorCode::Http, "http"},
            {UploadErrorCode::Connection, "connection"},
        }};
    } // namespace

    std::string_view to_string(UploadErrorCode code) noexcept
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

    UploadErrorCode error_code_from_int(std::int8_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::int8_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return UploadErrorCode::Unknown;
    }

} // namespace chunkup
