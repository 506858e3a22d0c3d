/**
 * chunkup - Registry of the uploads running in this process.
 *
 * At most one non-terminal worker exists per UploadIdentity. Succeeded and
 * cancelled workers leave the registry on their own; failed ones stay until
 * acknowledged. Every registration, removal and state-kind change is
 * broadcast to the uploads-updated handlers with the full list, after the
 * registry lock is released.
 *
 * When a ledger is attached, active uploads are mirrored to it so they can be
 * listed and restarted by a later process.
 */
#pragma once

#include <asio/any_io_executor.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "chunkup/event_reporter.hpp"
#include "chunkup/http_client.hpp"
#include "chunkup/upload_info.hpp"
#include "chunkup/upload_ledger.hpp"
#include "chunkup/upload_worker.hpp"

namespace chunkup
{

    class UploadManager
    {
    public:
        using UploadsUpdatedHandler = std::function<void(const std::vector<std::shared_ptr<UploadWorker>> &)>;

        UploadManager(asio::any_io_executor executor, std::shared_ptr<HttpClient> client,
                      std::unique_ptr<UploadLedger> ledger = nullptr, std::shared_ptr<EventReporter> reporter = nullptr);
        ~UploadManager();

        UploadManager(const UploadManager &) = delete;
        UploadManager &operator=(const UploadManager &) = delete;

        // Builds an unregistered worker sharing this manager's executor and clients.
        std::shared_ptr<UploadWorker> create_worker(UploadInfo info, std::uint64_t starting_byte = 0) const;

        // Registers and starts `worker`, unless a non-terminal worker with the
        // same identity is already managed. Returns the worker that is managed.
        std::shared_ptr<UploadWorker> start(std::shared_ptr<UploadWorker> worker);

        std::shared_ptr<UploadWorker> find(const UploadIdentity &identity) const;
        std::shared_ptr<UploadWorker> find_by_file(const std::filesystem::path &file) const;

        // Forgets the upload. A still active worker is cancelled.
        void acknowledge(const UploadIdentity &identity);

        std::vector<std::shared_ptr<UploadWorker>> all_managed() const;

        // Handlers are called without any manager lock held, on the thread whose
        // change triggered the broadcast. A worker-triggered broadcast runs inside
        // that worker's notification, so a handler must not wait on another worker
        // that may be notifying at the same time.
        std::string add_uploads_updated_handler(UploadsUpdatedHandler handler);
        void remove_uploads_updated_handler(const std::string &token);

        std::vector<UploadLedger::Entry> resumable_uploads() const;

        // Registers a NotStarted worker rebuilt from the ledger; the caller starts it.
        // Returns nullptr when no ledger entry exists for `file`.
        std::shared_ptr<UploadWorker> resume_upload(const std::filesystem::path &file);
        std::vector<std::shared_ptr<UploadWorker>> resume_all_uploads();

        // Drops ledger entries for `file` without touching managed workers.
        std::size_t discard_resumable(const std::filesystem::path &file);
        void discard_all_resumable();

        // Rewrites the ledger entry of every active worker.
        void persist_all();

        const asio::any_io_executor &executor() const noexcept { return executor_; }
        const std::shared_ptr<EventReporter> &reporter() const noexcept { return reporter_; }

    private:
        struct Managed
        {
            std::shared_ptr<UploadWorker> worker;
            std::size_t last_state_kind{};
        };

        std::shared_ptr<UploadWorker> register_worker(std::shared_ptr<UploadWorker> worker, bool start);
        void on_worker_state(const UploadWorker &worker, const UploadState &state);
        void broadcast();

        // Require mutex_.
        std::vector<Managed>::iterator find_locked(const UploadIdentity &identity);
        void persist_locked(const UploadWorker &worker, const UploadState &state);
        void remove_from_ledger_locked(const UploadIdentity &identity);

        asio::any_io_executor executor_;
        std::shared_ptr<HttpClient> client_;
        std::shared_ptr<EventReporter> reporter_;
        std::string observer_token_;

        mutable std::mutex mutex_;
        std::unique_ptr<UploadLedger> ledger_;
        std::vector<Managed> registry_;
        std::vector<std::weak_ptr<UploadWorker>> observed_;

        std::mutex handlers_mutex_;
        std::map<std::string, UploadsUpdatedHandler> handlers_;
    };

} // namespace chunkup
