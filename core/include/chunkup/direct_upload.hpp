/**
 * chunkup - Caller-facing handle for one upload.
 *
 * Translates worker states into Status updates and exactly one Result per
 * finished upload. Cancelling never produces a Result. Several DirectUpload
 * objects may attach to the same managed worker.
 */
#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "chunkup/error_codes.hpp"
#include "chunkup/input_inspector.hpp"
#include "chunkup/upload_info.hpp"
#include "chunkup/upload_manager.hpp"
#include "chunkup/upload_options.hpp"
#include "chunkup/upload_worker.hpp"

namespace chunkup
{

    class DirectUpload
    {
    public:
        struct Status
        {
            std::uint64_t completed_bytes{};
            std::uint64_t total_bytes{};
            Clock::time_point start_time{};
            Clock::time_point updated_time{};
            bool is_paused{false};
        };

        struct Success
        {
            Status final_state;
        };

        struct UploadError
        {
            Status last_status;
            UploadErrorCode code{UploadErrorCode::Unknown};
            std::string message;
            std::optional<long> status_code;
            std::exception_ptr cause;
        };

        using Result = std::variant<Success, UploadError>;

        enum class InputStatus
        {
            Ready,
            Started,
            Preparing,
            AwaitingUploadConfirmation,
            UploadInProgress,
            UploadPaused,
            Finished
        };

        using ProgressHandler = std::function<void(const Status &)>;
        using ResultHandler = std::function<void(const Result &)>;
        using InputStatusHandler = std::function<void(InputStatus)>;
        // Return false to cancel an upload whose input was not confirmed standard.
        using NonStandardInputHandler = std::function<bool()>;

        DirectUpload(std::string upload_url, std::filesystem::path input_file, UploadOptions options,
                     UploadManager &manager, std::shared_ptr<InputInspector> inspector = nullptr);

        // Attaches to a worker that is already managed, e.g. one resumed from the ledger.
        DirectUpload(std::shared_ptr<UploadWorker> worker, UploadManager &manager);

        ~DirectUpload();

        DirectUpload(const DirectUpload &) = delete;
        DirectUpload &operator=(const DirectUpload &) = delete;

        // Attaches to an active upload of the same file and URL if there is one,
        // resuming it when paused. `force_restart` discards it and starts over.
        void start(bool force_restart = false);

        void pause();

        // Stops the upload and forgets it. Progress and result handlers are cleared.
        void cancel();

        void set_progress_handler(ProgressHandler handler);
        void set_result_handler(ResultHandler handler);
        void set_input_status_handler(InputStatusHandler handler);
        void set_non_standard_input_handler(NonStandardInputHandler handler);

        Status status() const;
        InputStatus input_status() const;
        bool in_progress() const;
        bool complete() const;

        const std::string &upload_url() const noexcept { return info_.upload_url; }
        const std::filesystem::path &input_file() const noexcept { return info_.input_file; }
        const UploadInfo &info() const noexcept { return info_; }

    private:
        bool inspect_input();
        void begin_transport();
        void attach(const std::shared_ptr<UploadWorker> &worker);
        void detach();
        void on_state(const UploadState &state);
        void set_input_status(InputStatus status);

        UploadInfo info_;
        UploadManager &manager_;
        std::shared_ptr<InputInspector> inspector_;
        std::string token_;

        mutable std::mutex mutex_;
        std::shared_ptr<UploadWorker> worker_;
        Status last_status_;
        InputStatus input_status_{InputStatus::Ready};
        bool result_delivered_{false};
        ProgressHandler progress_handler_;
        ResultHandler result_handler_;
        InputStatusHandler input_status_handler_;
        NonStandardInputHandler non_standard_input_handler_;
    };

    std::string_view to_string(DirectUpload::InputStatus status) noexcept;

} // namespace chunkup
