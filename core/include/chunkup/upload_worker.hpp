/**
 * chunkup - Drives one ChunkedFile through the ChunkTransport on a background
 * executor and publishes its state to token-keyed observers.
 *
 *   NotStarted --start()--> Uploading --pause()--> Paused --start()--> Uploading
 *   Uploading --end of file--> Succeeded
 *   Uploading --terminal chunk error--> Failed
 *   NotStarted | Uploading | Paused --cancel()--> Cancelled
 *
 * Pause takes effect at the next chunk boundary. Cancel aborts the request in
 * flight. Observers receive at most one progress update per kProgressInterval;
 * state changes are always delivered, and nothing is delivered after Cancelled.
 */
#pragma once

#include <asio/any_io_executor.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "chunkup/cancellation.hpp"
#include "chunkup/chunk_transport.hpp"
#include "chunkup/chunked_file.hpp"
#include "chunkup/event_reporter.hpp"
#include "chunkup/http_client.hpp"
#include "chunkup/upload_info.hpp"
#include "chunkup/upload_state.hpp"

namespace chunkup
{

    class UploadWorker : public std::enable_shared_from_this<UploadWorker>
    {
    public:
        using StateObserver = std::function<void(const UploadWorker &, const UploadState &)>;

        static constexpr std::chrono::milliseconds kProgressInterval{100};

        // Throws std::invalid_argument when `info.options` fail validation.
        UploadWorker(UploadInfo info, asio::any_io_executor executor, std::shared_ptr<HttpClient> client,
                     std::shared_ptr<EventReporter> reporter = nullptr, std::uint64_t starting_byte = 0);
        ~UploadWorker();

        UploadWorker(const UploadWorker &) = delete;
        UploadWorker &operator=(const UploadWorker &) = delete;

        // Starts, or resumes a paused upload. Ignored in any other state.
        void start();

        void pause();

        void cancel();

        UploadState state() const;
        const UploadInfo &info() const noexcept { return info_; }
        const UploadIdentity &identity() const noexcept { return identity_; }

        // Resume watermark: end of the last chunk the server accepted.
        std::uint64_t committed_bytes() const;

        bool holds_file_handle() const noexcept { return file_open_.load(); }

        // Waits until the background loop is not running.
        bool wait_for_idle(std::chrono::milliseconds timeout) const;

        void add_observer(const std::string &token, StateObserver observer);

        // Once this returns the observer is not running and will not be called again.
        void remove_observer(const std::string &token);

    private:
        enum class LoopOutcome
        {
            Finished,
            Paused
        };

        void run_loop();
        LoopOutcome upload_chunks();
        void open_file();
        void on_bytes_sent(std::uint64_t chunk_start, std::uint64_t bytes_sent);
        void commit(std::uint64_t end_byte);
        void finish_succeeded();
        void finish_failed(std::exception_ptr error);
        void mark_idle();

        // Requires observers_mutex_.
        void publish(const UploadState &state, bool force);

        UploadInfo info_;
        UploadIdentity identity_;
        asio::any_io_executor executor_;
        ChunkTransport transport_;
        std::shared_ptr<EventReporter> reporter_;
        ChunkedFile file_;
        CancellationToken cancellation_;
        std::atomic<bool> file_open_{false};

        mutable std::mutex mutex_;
        mutable std::condition_variable idle_cv_;
        UploadState state_{state::NotStarted{}};
        UploadProgress progress_;
        std::uint64_t committed_{0};
        bool running_{false};
        bool pause_requested_{false};

        // Held across every state change and its delivery so observers see
        // states in order. Recursive so observers may call back into the worker.
        std::recursive_mutex observers_mutex_;
        std::map<std::string, StateObserver> observers_;
        bool notifications_closed_{false};
        std::chrono::steady_clock::time_point last_notification_{};
    };

} // namespace chunkup
