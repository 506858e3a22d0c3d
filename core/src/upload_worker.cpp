#include "chunkup/upload_worker.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <vector>

#include <spdlog/spdlog.h>

#include "chunkup/errors.hpp"

namespace chunkup
{

    namespace
    {

        UploadInfo validated(UploadInfo info)
        {
            validate(info.options);
            return info;
        }

    } // namespace

    UploadWorker::UploadWorker(UploadInfo info, asio::any_io_executor executor, std::shared_ptr<HttpClient> client,
                               std::shared_ptr<EventReporter> reporter, std::uint64_t starting_byte)
        : info_(validated(std::move(info))),
          identity_(info_.identity()),
          executor_(std::move(executor)),
          transport_(std::move(client), info_.options.transport.retries_per_chunk),
          reporter_(std::move(reporter)),
          file_(info_.options.transport.chunk_size_in_bytes),
          committed_(starting_byte)
    {
        progress_.completed_bytes = starting_byte;
    }

    UploadWorker::~UploadWorker()
    {
        file_.close();
    }

    void UploadWorker::start()
    {
        std::lock_guard observers_lock(observers_mutex_);
        UploadState snapshot;
        bool launch = false;
        {
            std::lock_guard lock(mutex_);
            if (!std::holds_alternative<state::NotStarted>(state_) && !std::holds_alternative<state::Paused>(state_))
            {
                spdlog::info("start() ignored for {} in state {}", info_.input_file.string(), state_name(state_));
                return;
            }
            const auto now = Clock::now();
            if (progress_.start_time == Clock::time_point{})
            {
                progress_.start_time = now;
            }
            progress_.updated_time = now;
            pause_requested_ = false;
            state_ = state::Uploading{progress_};
            snapshot = state_;
            if (!running_)
            {
                running_ = true;
                launch = true;
            }
        }
        spdlog::info("Uploading {} from byte {}", info_.input_file.string(), committed_bytes());
        publish(snapshot, true);
        if (launch)
        {
            asio::post(executor_, [self = shared_from_this()]()
                       { self->run_loop(); });
        }
    }

    void UploadWorker::pause()
    {
        std::lock_guard observers_lock(observers_mutex_);
        UploadState snapshot;
        {
            std::lock_guard lock(mutex_);
            if (!std::holds_alternative<state::Uploading>(state_))
            {
                return;
            }
            pause_requested_ = true;
            progress_.updated_time = Clock::now();
            state_ = state::Paused{progress_};
            snapshot = state_;
        }
        spdlog::info("Pausing {} at byte {}", info_.input_file.string(), committed_bytes());
        publish(snapshot, true);
    }

    void UploadWorker::cancel()
    {
        std::lock_guard observers_lock(observers_mutex_);
        {
            std::lock_guard lock(mutex_);
            if (is_terminal(state_))
            {
                return;
            }
            cancellation_.cancel();
            state_ = state::Cancelled{};
        }
        spdlog::info("Cancelled upload of {}", info_.input_file.string());
        publish(state::Cancelled{}, true);
    }

    UploadState UploadWorker::state() const
    {
        std::lock_guard lock(mutex_);
        return state_;
    }

    std::uint64_t UploadWorker::committed_bytes() const
    {
        std::lock_guard lock(mutex_);
        return committed_;
    }

    bool UploadWorker::wait_for_idle(std::chrono::milliseconds timeout) const
    {
        std::unique_lock lock(mutex_);
        return idle_cv_.wait_for(lock, timeout, [this]()
                                 { return !running_; });
    }

    void UploadWorker::add_observer(const std::string &token, StateObserver observer)
    {
        std::lock_guard observers_lock(observers_mutex_);
        observers_[token] = std::move(observer);
    }

    void UploadWorker::remove_observer(const std::string &token)
    {
        std::lock_guard observers_lock(observers_mutex_);
        observers_.erase(token);
    }

    void UploadWorker::run_loop()
    {
        try
        {
            if (upload_chunks() == LoopOutcome::Paused)
            {
                return;
            }
            file_.close();
            file_open_.store(false);
            finish_succeeded();
        }
        catch (...)
        {
            file_.close();
            file_open_.store(false);
            finish_failed(std::current_exception());
        }
    }

    UploadWorker::LoopOutcome UploadWorker::upload_chunks()
    {
        for (;;)
        {
            cancellation_.throw_if_cancelled();

            bool pause_now = false;
            {
                std::lock_guard lock(mutex_);
                pause_now = pause_requested_;
            }
            if (pause_now)
            {
                file_.close();
                file_open_.store(false);
                std::lock_guard lock(mutex_);
                if (pause_requested_)
                {
                    running_ = false;
                    idle_cv_.notify_all();
                    spdlog::debug("Upload loop for {} stopped at byte {}", info_.input_file.string(), committed_);
                    return LoopOutcome::Paused;
                }
                // Resumed while the file was being closed; reopen below.
            }

            if (!file_.is_open())
            {
                open_file();
            }

            const auto chunk = file_.read_next_chunk();
            if (chunk.is_end_of_file())
            {
                if (info_.options.transport.end_of_file_signal == EndOfFileSignal::SendEmptyChunk)
                {
                    transport_.signal_completion(chunk.total_file_size, info_.upload_url, cancellation_);
                }
                return LoopOutcome::Finished;
            }

            transport_.upload(chunk, info_.upload_url, cancellation_, [this, start = chunk.start_byte](std::uint64_t sent)
                              { on_bytes_sent(start, sent); });
            commit(chunk.end_byte);
        }
    }

    void UploadWorker::open_file()
    {
        file_.open(info_.input_file);
        file_open_.store(true);

        std::lock_guard observers_lock(observers_mutex_);
        UploadState snapshot;
        {
            std::lock_guard lock(mutex_);
            file_.seek(committed_);
            progress_.total_bytes = file_.file_size();
            progress_.completed_bytes = std::min(std::max(progress_.completed_bytes, committed_), progress_.total_bytes);
            if (!std::holds_alternative<state::Uploading>(state_))
            {
                return;
            }
            progress_.updated_time = Clock::now();
            state_ = state::Uploading{progress_};
            snapshot = state_;
        }
        publish(snapshot, true);
    }

    void UploadWorker::on_bytes_sent(std::uint64_t chunk_start, std::uint64_t bytes_sent)
    {
        std::lock_guard observers_lock(observers_mutex_);
        UploadState snapshot;
        {
            std::lock_guard lock(mutex_);
            const auto reported = std::min(chunk_start + bytes_sent, progress_.total_bytes);
            // A retry restarts the body from zero; never report going backwards.
            if (reported <= progress_.completed_bytes)
            {
                return;
            }
            progress_.completed_bytes = reported;
            progress_.updated_time = Clock::now();
            if (!std::holds_alternative<state::Uploading>(state_))
            {
                return;
            }
            state_ = state::Uploading{progress_};
            snapshot = state_;
        }
        publish(snapshot, false);
    }

    void UploadWorker::commit(std::uint64_t end_byte)
    {
        std::lock_guard observers_lock(observers_mutex_);
        UploadState snapshot;
        bool force = false;
        {
            std::lock_guard lock(mutex_);
            committed_ = end_byte;
            progress_.completed_bytes = std::max(progress_.completed_bytes, end_byte);
            progress_.updated_time = Clock::now();
            if (std::holds_alternative<state::Uploading>(state_))
            {
                state_ = state::Uploading{progress_};
            }
            else if (std::holds_alternative<state::Paused>(state_))
            {
                // The watermark moved while paused; observers persist it.
                state_ = state::Paused{progress_};
                force = true;
            }
            else
            {
                return;
            }
            snapshot = state_;
        }
        publish(snapshot, force);
    }

    void UploadWorker::finish_succeeded()
    {
        UploadProgress final_progress;
        {
            std::lock_guard observers_lock(observers_mutex_);
            UploadState snapshot;
            {
                std::lock_guard lock(mutex_);
                if (is_terminal(state_))
                {
                    mark_idle();
                    return;
                }
                progress_.completed_bytes = committed_;
                progress_.updated_time = Clock::now();
                final_progress = progress_;
                state_ = state::Succeeded{progress_};
                snapshot = state_;
                mark_idle();
            }
            spdlog::info("Finished uploading {} ({} bytes)", info_.input_file.string(), final_progress.total_bytes);
            publish(snapshot, true);
        }
        if (reporter_)
        {
            reporter_->report_upload_succeeded(info_, final_progress);
        }
    }

    void UploadWorker::finish_failed(std::exception_ptr error)
    {
        UploadFailure failure;
        {
            std::lock_guard observers_lock(observers_mutex_);
            UploadState snapshot;
            {
                std::lock_guard lock(mutex_);
                if (is_terminal(state_) || cancellation_.is_cancelled())
                {
                    mark_idle();
                    return;
                }
                failure = classify_failure(error, progress_);
                if (failure.code == UploadErrorCode::Cancelled)
                {
                    // Aborted without cancel(); keep the upload resumable.
                    state_ = state::Paused{progress_};
                    pause_requested_ = false;
                }
                else
                {
                    state_ = state::Failed{failure};
                }
                snapshot = state_;
                mark_idle();
            }
            if (std::holds_alternative<state::Paused>(snapshot))
            {
                publish(snapshot, true);
                return;
            }
            spdlog::error("Upload of {} failed: {}", info_.input_file.string(), failure.message);
            publish(snapshot, true);
        }
        if (reporter_)
        {
            reporter_->report_upload_failed(info_, failure);
        }
    }

    void UploadWorker::mark_idle()
    {
        running_ = false;
        idle_cv_.notify_all();
    }

    void UploadWorker::publish(const UploadState &state, bool force)
    {
        if (notifications_closed_)
        {
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        if (!force && now - last_notification_ < kProgressInterval)
        {
            return;
        }
        last_notification_ = now;
        if (std::holds_alternative<state::Cancelled>(state))
        {
            notifications_closed_ = true;
        }

        std::vector<std::string> tokens;
        tokens.reserve(observers_.size());
        for (const auto &[token, observer] : observers_)
        {
            tokens.push_back(token);
        }
        for (const auto &token : tokens)
        {
            const auto it = observers_.find(token);
            if (it == observers_.end())
            {
                continue;
            }
            const auto observer = it->second;
            observer(*this, state);
        }
    }

} // namespace chunkup
