#include "chunkup/upload_state.hpp"

#include <array>

#include "chunkup/errors.hpp"

namespace chunkup
{

    namespace
    {
        constexpr std::array<std::string_view, std::variant_size_v<UploadState>> kStateNames{
            "not_started", "uploading", "paused", "succeeded", "failed", "cancelled"};
    } // namespace

    bool is_terminal(const UploadState &state) noexcept
    {
        return std::holds_alternative<state::Succeeded>(state) || std::holds_alternative<state::Failed>(state) ||
               std::holds_alternative<state::Cancelled>(state);
    }

    std::string_view state_name(const UploadState &state) noexcept
    {
        return kStateNames[state.index()];
    }

    std::optional<UploadProgress> progress_of(const UploadState &state)
    {
        if (const auto *uploading = std::get_if<state::Uploading>(&state))
        {
            return uploading->progress;
        }
        if (const auto *paused = std::get_if<state::Paused>(&state))
        {
            return paused->progress;
        }
        if (const auto *succeeded = std::get_if<state::Succeeded>(&state))
        {
            return succeeded->progress;
        }
        if (const auto *failed = std::get_if<state::Failed>(&state))
        {
            return failed->failure.last_progress;
        }
        return std::nullopt;
    }

    UploadFailure classify_failure(std::exception_ptr error, const UploadProgress &last_progress)
    {
        UploadFailure failure{.last_progress = last_progress, .cause = error};
        try
        {
            std::rethrow_exception(error);
        }
        catch (const CancellationError &)
        {
            failure.code = UploadErrorCode::Cancelled;
            failure.message = "Cancelled by user";
        }
        catch (const ChunkTransportError &ex)
        {
            if (ex.http_error())
            {
                failure.code = UploadErrorCode::Http;
                failure.status_code = ex.http_error()->status_code;
                failure.message = "Http Failed: " + ex.http_error()->describe();
            }
            else
            {
                failure.code = UploadErrorCode::Connection;
                failure.message = std::string("Connection error: ") + ex.what();
            }
        }
        catch (const ConnectionError &ex)
        {
            failure.code = UploadErrorCode::Connection;
            failure.message = std::string("Connection error: ") + ex.what();
        }
        catch (const FileAccessError &ex)
        {
            failure.code = UploadErrorCode::File;
            failure.message = std::string("Couldn't read file for upload: ") + ex.what();
        }
        catch (const InvalidStateError &ex)
        {
            failure.code = UploadErrorCode::Unknown;
            failure.message = std::string("Internal error: ") + ex.what();
        }
        catch (const std::exception &ex)
        {
            failure.code = UploadErrorCode::Unknown;
            failure.message = ex.what();
        }
        catch (...)
        {
            failure.code = UploadErrorCode::Unknown;
            failure.message = "unknown";
        }
        return failure;
    }

} // namespace chunkup
