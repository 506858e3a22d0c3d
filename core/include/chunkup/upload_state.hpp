/**
 * chunkup - Worker states. Each alternative carries only the data valid in it.
 */
#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "chunkup/error_codes.hpp"
#include "chunkup/upload_info.hpp"

namespace chunkup
{

    struct UploadFailure
    {
        UploadErrorCode code{UploadErrorCode::Unknown};
        std::string message;
        std::optional<long> status_code;
        UploadProgress last_progress;
        std::exception_ptr cause;
    };

    namespace state
    {
        struct NotStarted
        {
        };

        struct Uploading
        {
            UploadProgress progress;
        };

        struct Paused
        {
            UploadProgress progress;
        };

        struct Succeeded
        {
            UploadProgress progress;
        };

        struct Failed
        {
            UploadFailure failure;
        };

        struct Cancelled
        {
        };
    } // namespace state

    using UploadState = std::variant<state::NotStarted, state::Uploading, state::Paused, state::Succeeded,
                                     state::Failed, state::Cancelled>;

    bool is_terminal(const UploadState &state) noexcept;

    std::string_view state_name(const UploadState &state) noexcept;

    // Progress carried by the state, if any.
    std::optional<UploadProgress> progress_of(const UploadState &state);

    // Maps an exception thrown out of the upload loop to the public taxonomy.
    UploadFailure classify_failure(std::exception_ptr error, const UploadProgress &last_progress);

} // namespace chunkup
