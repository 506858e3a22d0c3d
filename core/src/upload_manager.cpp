#include "chunkup/upload_manager.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "chunkup/crypto.hpp"

namespace chunkup
{

    UploadManager::UploadManager(asio::any_io_executor executor, std::shared_ptr<HttpClient> client,
                                 std::unique_ptr<UploadLedger> ledger, std::shared_ptr<EventReporter> reporter)
        : executor_(std::move(executor)),
          client_(std::move(client)),
          reporter_(std::move(reporter)),
          observer_token_("upload-manager-" + crypto::random_hex(8)),
          ledger_(std::move(ledger))
    {
        if (!client_)
        {
            throw std::invalid_argument("UploadManager requires an HttpClient");
        }
    }

    UploadManager::~UploadManager()
    {
        std::vector<std::weak_ptr<UploadWorker>> observed;
        {
            std::lock_guard lock(mutex_);
            observed.swap(observed_);
        }
        for (const auto &weak : observed)
        {
            if (auto worker = weak.lock())
            {
                worker->remove_observer(observer_token_);
            }
        }
    }

    std::shared_ptr<UploadWorker> UploadManager::create_worker(UploadInfo info, std::uint64_t starting_byte) const
    {
        return std::make_shared<UploadWorker>(std::move(info), executor_, client_, reporter_, starting_byte);
    }

    std::shared_ptr<UploadWorker> UploadManager::start(std::shared_ptr<UploadWorker> worker)
    {
        return register_worker(std::move(worker), true);
    }

    std::shared_ptr<UploadWorker> UploadManager::register_worker(std::shared_ptr<UploadWorker> worker, bool start)
    {
        if (!worker)
        {
            throw std::invalid_argument("Cannot manage a null upload worker");
        }

        std::shared_ptr<UploadWorker> replaced;
        {
            std::lock_guard lock(mutex_);
            const auto it = find_locked(worker->identity());
            if (it != registry_.end())
            {
                if (it->worker == worker)
                {
                    return worker;
                }
                if (!is_terminal(it->worker->state()))
                {
                    spdlog::info("Upload of {} is already managed", worker->identity().input_file.string());
                    return it->worker;
                }
                replaced = it->worker;
                registry_.erase(it);
            }
            registry_.push_back(Managed{worker, worker->state().index()});
            observed_.erase(std::remove_if(observed_.begin(), observed_.end(), [](const auto &weak)
                                           { return weak.expired(); }),
                            observed_.end());
            observed_.push_back(worker);
            persist_locked(*worker, worker->state());
        }

        if (replaced)
        {
            replaced->remove_observer(observer_token_);
        }
        worker->add_observer(observer_token_, [this](const UploadWorker &source, const UploadState &state)
                             { on_worker_state(source, state); });
        broadcast();
        if (start)
        {
            worker->start();
        }
        return worker;
    }

    std::shared_ptr<UploadWorker> UploadManager::find(const UploadIdentity &identity) const
    {
        std::lock_guard lock(mutex_);
        const auto it = std::find_if(registry_.begin(), registry_.end(), [&](const Managed &managed)
                                     { return managed.worker->identity() == identity; });
        return it == registry_.end() ? nullptr : it->worker;
    }

    std::shared_ptr<UploadWorker> UploadManager::find_by_file(const std::filesystem::path &file) const
    {
        const auto normalized = normalize_path(file);
        std::lock_guard lock(mutex_);
        const auto it = std::find_if(registry_.begin(), registry_.end(), [&](const Managed &managed)
                                     { return managed.worker->identity().input_file == normalized; });
        return it == registry_.end() ? nullptr : it->worker;
    }

    void UploadManager::acknowledge(const UploadIdentity &identity)
    {
        std::shared_ptr<UploadWorker> removed;
        {
            std::lock_guard lock(mutex_);
            const auto it = find_locked(identity);
            if (it != registry_.end())
            {
                removed = it->worker;
                registry_.erase(it);
            }
            remove_from_ledger_locked(identity);
        }
        if (!removed)
        {
            return;
        }
        removed->remove_observer(observer_token_);
        if (!is_terminal(removed->state()))
        {
            removed->cancel();
        }
        broadcast();
    }

    std::vector<std::shared_ptr<UploadWorker>> UploadManager::all_managed() const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::shared_ptr<UploadWorker>> workers;
        workers.reserve(registry_.size());
        for (const auto &managed : registry_)
        {
            workers.push_back(managed.worker);
        }
        return workers;
    }

    std::string UploadManager::add_uploads_updated_handler(UploadsUpdatedHandler handler)
    {
        auto token = crypto::random_hex(8);
        std::lock_guard lock(handlers_mutex_);
        handlers_[token] = std::move(handler);
        return token;
    }

    void UploadManager::remove_uploads_updated_handler(const std::string &token)
    {
        std::lock_guard lock(handlers_mutex_);
        handlers_.erase(token);
    }

    std::vector<UploadLedger::Entry> UploadManager::resumable_uploads() const
    {
        std::lock_guard lock(mutex_);
        if (!ledger_)
        {
            return {};
        }
        try
        {
            return ledger_->read_all();
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Unable to read upload ledger: {}", ex.what());
            return {};
        }
    }

    std::shared_ptr<UploadWorker> UploadManager::resume_upload(const std::filesystem::path &file)
    {
        const auto normalized = normalize_path(file);
        for (const auto &entry : resumable_uploads())
        {
            if (normalize_path(entry.upload_info.input_file) != normalized)
            {
                continue;
            }
            if (auto active = find(entry.upload_info.identity()); active && !is_terminal(active->state()))
            {
                return active;
            }
            try
            {
                // The server offset is not queried, so a cold resume starts over.
                return register_worker(create_worker(entry.upload_info), false);
            }
            catch (const std::invalid_argument &ex)
            {
                spdlog::warn("Skipping ledger entry for {}: {}", entry.upload_info.input_file.string(), ex.what());
                return nullptr;
            }
        }
        return nullptr;
    }

    std::vector<std::shared_ptr<UploadWorker>> UploadManager::resume_all_uploads()
    {
        std::vector<std::shared_ptr<UploadWorker>> workers;
        for (const auto &entry : resumable_uploads())
        {
            try
            {
                auto worker = create_worker(entry.upload_info);
                workers.push_back(register_worker(std::move(worker), false));
            }
            catch (const std::invalid_argument &ex)
            {
                spdlog::warn("Skipping ledger entry for {}: {}", entry.upload_info.input_file.string(), ex.what());
            }
        }
        return workers;
    }

    std::size_t UploadManager::discard_resumable(const std::filesystem::path &file)
    {
        const auto normalized = normalize_path(file);
        std::lock_guard lock(mutex_);
        if (!ledger_)
        {
            return 0;
        }
        std::size_t removed = 0;
        try
        {
            for (const auto &entry : ledger_->read_all())
            {
                if (normalize_path(entry.upload_info.input_file) == normalized)
                {
                    ledger_->remove(entry.id);
                    ++removed;
                }
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Unable to update upload ledger: {}", ex.what());
        }
        return removed;
    }

    void UploadManager::discard_all_resumable()
    {
        std::lock_guard lock(mutex_);
        if (!ledger_)
        {
            return;
        }
        try
        {
            ledger_->clear();
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Unable to clear upload ledger: {}", ex.what());
        }
    }

    void UploadManager::persist_all()
    {
        std::lock_guard lock(mutex_);
        for (const auto &managed : registry_)
        {
            persist_locked(*managed.worker, managed.worker->state());
        }
    }

    void UploadManager::on_worker_state(const UploadWorker &worker, const UploadState &state)
    {
        std::shared_ptr<UploadWorker> released;
        bool changed = false;
        {
            std::lock_guard lock(mutex_);
            const auto it = std::find_if(registry_.begin(), registry_.end(), [&](const Managed &managed)
                                         { return managed.worker.get() == &worker; });
            if (it == registry_.end())
            {
                return;
            }
            changed = it->last_state_kind != state.index();
            it->last_state_kind = state.index();

            if (std::holds_alternative<state::Succeeded>(state) || std::holds_alternative<state::Cancelled>(state))
            {
                remove_from_ledger_locked(worker.identity());
                released = it->worker;
                registry_.erase(it);
                changed = true;
            }
            else if (std::holds_alternative<state::Paused>(state) || changed)
            {
                persist_locked(worker, state);
            }
        }

        if (released)
        {
            // Called from inside the worker's own notification; removal is re-entrant.
            released->remove_observer(observer_token_);
        }
        if (changed)
        {
            broadcast();
        }
    }

    void UploadManager::broadcast()
    {
        const auto workers = all_managed();
        std::vector<std::string> tokens;
        {
            std::lock_guard lock(handlers_mutex_);
            tokens.reserve(handlers_.size());
            for (const auto &[token, handler] : handlers_)
            {
                tokens.push_back(token);
            }
        }
        // Handlers run unlocked; they may call back into the manager or its workers.
        for (const auto &token : tokens)
        {
            UploadsUpdatedHandler handler;
            {
                std::lock_guard lock(handlers_mutex_);
                const auto it = handlers_.find(token);
                if (it == handlers_.end())
                {
                    continue;
                }
                handler = it->second;
            }
            handler(workers);
        }
    }

    std::vector<UploadManager::Managed>::iterator UploadManager::find_locked(const UploadIdentity &identity)
    {
        return std::find_if(registry_.begin(), registry_.end(), [&](const Managed &managed)
                            { return managed.worker->identity() == identity; });
    }

    void UploadManager::persist_locked(const UploadWorker &worker, const UploadState &state)
    {
        if (!ledger_)
        {
            return;
        }
        if (is_terminal(state))
        {
            remove_from_ledger_locked(worker.identity());
            return;
        }
        UploadLedger::Entry entry;
        entry.id = worker.identity().key();
        entry.saved_at = Clock::now();
        entry.state_code = std::holds_alternative<state::Paused>(state) ? UploadLedger::StateCode::WasPaused
                                                                        : UploadLedger::StateCode::WasInProgress;
        entry.last_successful_byte = worker.committed_bytes();
        entry.upload_info = worker.info();
        entry.upload_info.input_file = worker.identity().input_file;
        try
        {
            ledger_->write(std::move(entry));
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Unable to persist upload of {}: {}", worker.identity().input_file.string(), ex.what());
        }
    }

    void UploadManager::remove_from_ledger_locked(const UploadIdentity &identity)
    {
        if (!ledger_)
        {
            return;
        }
        try
        {
            ledger_->remove(identity.key());
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Unable to update upload ledger: {}", ex.what());
        }
    }

} // namespace chunkup
