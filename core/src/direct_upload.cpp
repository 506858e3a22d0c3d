#include "chunkup/direct_upload.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "chunkup/crypto.hpp"

namespace chunkup
{

    namespace
    {

        DirectUpload::Status to_status(const UploadProgress &progress, bool paused)
        {
            return {progress.completed_bytes, progress.total_bytes, progress.start_time, progress.updated_time, paused};
        }

    } // namespace

    std::string_view to_string(DirectUpload::InputStatus status) noexcept
    {
        switch (status)
        {
        case DirectUpload::InputStatus::Ready:
            return "ready";
        case DirectUpload::InputStatus::Started:
            return "started";
        case DirectUpload::InputStatus::Preparing:
            return "preparing";
        case DirectUpload::InputStatus::AwaitingUploadConfirmation:
            return "awaiting_upload_confirmation";
        case DirectUpload::InputStatus::UploadInProgress:
            return "upload_in_progress";
        case DirectUpload::InputStatus::UploadPaused:
            return "upload_paused";
        case DirectUpload::InputStatus::Finished:
            return "finished";
        }
        return "ready";
    }

    DirectUpload::DirectUpload(std::string upload_url, std::filesystem::path input_file, UploadOptions options,
                               UploadManager &manager, std::shared_ptr<InputInspector> inspector)
        : info_{std::move(upload_url), normalize_path(input_file), std::move(options)},
          manager_(manager),
          inspector_(inspector ? std::move(inspector) : std::make_shared<PassthroughInputInspector>()),
          token_("direct-upload-" + crypto::random_hex(8))
    {
        validate(info_.options);
    }

    DirectUpload::DirectUpload(std::shared_ptr<UploadWorker> worker, UploadManager &manager)
        : info_(worker ? worker->info() : throw std::invalid_argument("DirectUpload requires a worker")),
          manager_(manager),
          inspector_(std::make_shared<PassthroughInputInspector>()),
          token_("direct-upload-" + crypto::random_hex(8))
    {
        info_.input_file = worker->identity().input_file;
        attach(worker);
    }

    DirectUpload::~DirectUpload()
    {
        detach();
    }

    void DirectUpload::start(bool force_restart)
    {
        auto existing = manager_.find(info_.identity());
        if (existing && !is_terminal(existing->state()))
        {
            if (!force_restart)
            {
                spdlog::warn("start() called but upload of {} is already in progress", info_.input_file.string());
                attach(existing);
                existing->start();
                return;
            }
            spdlog::info("Restarting upload of {}", info_.input_file.string());
            detach();
            manager_.acknowledge(existing->identity());
        }
        else
        {
            detach();
        }

        {
            std::lock_guard lock(mutex_);
            last_status_ = Status{};
            result_delivered_ = false;
        }
        set_input_status(InputStatus::Started);

        if (!inspect_input())
        {
            return;
        }
        begin_transport();
    }

    void DirectUpload::pause()
    {
        std::shared_ptr<UploadWorker> worker;
        {
            std::lock_guard lock(mutex_);
            worker = worker_;
        }
        if (worker)
        {
            worker->pause();
        }
    }

    void DirectUpload::cancel()
    {
        std::shared_ptr<UploadWorker> worker;
        {
            std::lock_guard lock(mutex_);
            progress_handler_ = nullptr;
            result_handler_ = nullptr;
            worker = worker_;
        }
        if (worker)
        {
            worker->cancel();
        }
        manager_.acknowledge(info_.identity());
        detach();
        set_input_status(InputStatus::Ready);
    }

    void DirectUpload::set_progress_handler(ProgressHandler handler)
    {
        std::lock_guard lock(mutex_);
        progress_handler_ = std::move(handler);
    }

    void DirectUpload::set_result_handler(ResultHandler handler)
    {
        std::lock_guard lock(mutex_);
        result_handler_ = std::move(handler);
    }

    void DirectUpload::set_input_status_handler(InputStatusHandler handler)
    {
        std::lock_guard lock(mutex_);
        input_status_handler_ = std::move(handler);
    }

    void DirectUpload::set_non_standard_input_handler(NonStandardInputHandler handler)
    {
        std::lock_guard lock(mutex_);
        non_standard_input_handler_ = std::move(handler);
    }

    DirectUpload::Status DirectUpload::status() const
    {
        std::lock_guard lock(mutex_);
        return last_status_;
    }

    DirectUpload::InputStatus DirectUpload::input_status() const
    {
        std::lock_guard lock(mutex_);
        return input_status_;
    }

    bool DirectUpload::in_progress() const
    {
        std::lock_guard lock(mutex_);
        return input_status_ == InputStatus::UploadInProgress;
    }

    bool DirectUpload::complete() const
    {
        std::lock_guard lock(mutex_);
        return input_status_ == InputStatus::Finished;
    }

    bool DirectUpload::inspect_input()
    {
        if (!info_.options.input_standardization.requested)
        {
            return true;
        }
        set_input_status(InputStatus::Preparing);

        InspectionResult result;
        try
        {
            result = inspector_->inspect(info_.input_file);
        }
        catch (const std::exception &ex)
        {
            result = {InspectionResult::Kind::Failure, {}, ex.what()};
        }
        if (result.kind == InspectionResult::Kind::Standard)
        {
            return true;
        }

        spdlog::info("Input {} needs confirmation ({}): {}", info_.input_file.string(), to_string(result.kind),
                     result.message);
        set_input_status(InputStatus::AwaitingUploadConfirmation);

        NonStandardInputHandler handler;
        {
            std::lock_guard lock(mutex_);
            handler = non_standard_input_handler_;
        }
        const bool proceed = handler ? handler() : true;

        if (const auto &reporter = manager_.reporter())
        {
            const auto description = result.kind == InspectionResult::Kind::Failure
                                         ? (result.message.empty() ? std::string("Input inspection failure") : result.message)
                                         : std::string("Input standardization unavailable");
            reporter->report_input_standardization_failed(info_, description, result.reasons, !proceed);
        }

        if (!proceed)
        {
            spdlog::info("Upload of {} declined after input inspection", info_.input_file.string());
            set_input_status(InputStatus::Ready);
            return false;
        }
        return true;
    }

    void DirectUpload::begin_transport()
    {
        auto worker = manager_.create_worker(info_);
        attach(worker);
        auto managed = manager_.start(worker);
        if (managed != worker)
        {
            // Another caller started the same upload meanwhile.
            attach(managed);
            managed->start();
        }
    }

    void DirectUpload::attach(const std::shared_ptr<UploadWorker> &worker)
    {
        std::shared_ptr<UploadWorker> previous;
        {
            std::lock_guard lock(mutex_);
            if (worker_ == worker)
            {
                return;
            }
            previous = std::exchange(worker_, worker);
            if (const auto progress = progress_of(worker->state()))
            {
                last_status_ = to_status(*progress, std::holds_alternative<state::Paused>(worker->state()));
            }
        }
        if (previous)
        {
            previous->remove_observer(token_);
        }
        worker->add_observer(token_, [this](const UploadWorker &, const UploadState &state)
                             { on_state(state); });
    }

    void DirectUpload::detach()
    {
        std::shared_ptr<UploadWorker> previous;
        {
            std::lock_guard lock(mutex_);
            previous = std::move(worker_);
            worker_ = nullptr;
        }
        if (previous)
        {
            previous->remove_observer(token_);
        }
    }

    void DirectUpload::on_state(const UploadState &state)
    {
        if (const auto *uploading = std::get_if<state::Uploading>(&state))
        {
            ProgressHandler handler;
            Status status = to_status(uploading->progress, false);
            {
                std::lock_guard lock(mutex_);
                last_status_ = status;
                handler = progress_handler_;
            }
            set_input_status(InputStatus::UploadInProgress);
            if (handler)
            {
                handler(status);
            }
        }
        else if (const auto *paused = std::get_if<state::Paused>(&state))
        {
            ProgressHandler handler;
            Status status = to_status(paused->progress, true);
            {
                std::lock_guard lock(mutex_);
                last_status_ = status;
                handler = progress_handler_;
            }
            set_input_status(InputStatus::UploadPaused);
            if (handler)
            {
                handler(status);
            }
        }
        else if (const auto *succeeded = std::get_if<state::Succeeded>(&state))
        {
            ResultHandler handler;
            Status status = to_status(succeeded->progress, false);
            {
                std::lock_guard lock(mutex_);
                last_status_ = status;
                if (!result_delivered_)
                {
                    result_delivered_ = true;
                    handler = result_handler_;
                }
            }
            set_input_status(InputStatus::Finished);
            if (handler)
            {
                handler(Result{Success{status}});
            }
        }
        else if (const auto *failed = std::get_if<state::Failed>(&state))
        {
            ResultHandler handler;
            UploadError error;
            {
                std::lock_guard lock(mutex_);
                error = UploadError{last_status_, failed->failure.code, failed->failure.message,
                                    failed->failure.status_code, failed->failure.cause};
                if (!result_delivered_)
                {
                    result_delivered_ = true;
                    handler = result_handler_;
                }
            }
            set_input_status(InputStatus::Finished);
            if (handler)
            {
                handler(Result{std::move(error)});
            }
        }
        else if (std::holds_alternative<state::Cancelled>(state))
        {
            set_input_status(InputStatus::Ready);
        }
    }

    void DirectUpload::set_input_status(InputStatus status)
    {
        InputStatusHandler handler;
        {
            std::lock_guard lock(mutex_);
            if (input_status_ == status)
            {
                return;
            }
            input_status_ = status;
            handler = input_status_handler_;
        }
        if (handler)
        {
            handler(status);
        }
    }

} // namespace chunkup
