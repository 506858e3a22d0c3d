#include "chunkup/client/session.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <variant>

#include <spdlog/spdlog.h>

#include "chunkup/curl_http_client.hpp"
#include "chunkup/error_codes.hpp"
#include "chunkup/event_reporter.hpp"
#include "chunkup/upload_ledger.hpp"

namespace chunkup::client
{

    namespace
    {

        constexpr std::size_t kWorkerThreads = 4;
        constexpr std::chrono::minutes kPauseTimeout{2};

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::string format_time(Clock::time_point time)
        {
            const auto seconds = Clock::to_time_t(time);
            std::tm local{};
            localtime_r(&seconds, &local);
            std::ostringstream out;
            out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
            return out.str();
        }

    } // namespace

    UploadSession::UploadSession(ClientConfig config)
        : config_(std::move(config)),
          pool_(kWorkerThreads),
          http_client_(std::make_shared<CurlHttpClient>()),
          signals_(io_context_, SIGINT, SIGTERM)
    {
        std::shared_ptr<EventReporter> reporter;
        if (config_.events_url && !config_.options.event_tracking.opted_out)
        {
            reporter = std::make_shared<EventReporter>(pool_.get_executor(), http_client_, *config_.events_url);
        }
        auto ledger = std::make_unique<UploadLedger>(config_.state_path.value_or(UploadLedger::default_ledger_path()));
        manager_ = std::make_unique<UploadManager>(pool_.get_executor(), http_client_, std::move(ledger),
                                                   std::move(reporter));
    }

    UploadSession::~UploadSession()
    {
        shutdown();
    }

    int UploadSession::run()
    {
        switch (config_.command)
        {
        case Command::Upload:
            return handle_upload();
        case Command::Resume:
            return handle_resume();
        case Command::List:
            return handle_list();
        case Command::Discard:
            return handle_discard();
        case Command::Help:
            break;
        }
        std::cout << usage("chunkup");
        return EXIT_SUCCESS;
    }

    int UploadSession::handle_upload()
    {
        auto upload = std::make_unique<DirectUpload>(config_.upload_url, *config_.file, config_.options, *manager_);
        upload->set_non_standard_input_handler([this]()
                                               { return ask_yes_no("The input could not be verified. Upload anyway?"); });
        auto &handle = *upload;
        track(std::move(upload));

        spdlog::info("Uploading {} to {}", handle.input_file().string(), handle.upload_url());
        handle.start();
        if (handle.input_status() == DirectUpload::InputStatus::Ready)
        {
            std::cerr << "Upload of " << handle.input_file().string() << " cancelled" << std::endl;
            return EXIT_FAILURE;
        }
        return wait_for_uploads();
    }

    int UploadSession::handle_resume()
    {
        std::vector<std::shared_ptr<UploadWorker>> workers;
        if (config_.file)
        {
            auto worker = manager_->resume_upload(*config_.file);
            if (!worker)
            {
                std::cerr << "No resumable upload for " << config_.file->string() << std::endl;
                return EXIT_FAILURE;
            }
            workers.push_back(std::move(worker));
        }
        else
        {
            workers = manager_->resume_all_uploads();
        }

        if (workers.empty())
        {
            std::cout << "Nothing to resume" << std::endl;
            return EXIT_SUCCESS;
        }

        for (const auto &worker : workers)
        {
            track(std::make_unique<DirectUpload>(worker, *manager_));
        }
        for (const auto &worker : workers)
        {
            spdlog::info("Resuming {} (restarts from the first byte)", worker->info().input_file.string());
            worker->start();
        }
        return wait_for_uploads();
    }

    int UploadSession::handle_list()
    {
        const auto entries = manager_->resumable_uploads();
        if (entries.empty())
        {
            std::cout << "No resumable uploads" << std::endl;
            return EXIT_SUCCESS;
        }
        for (const auto &entry : entries)
        {
            const auto *state = entry.state_code == UploadLedger::StateCode::WasPaused ? "paused" : "in progress";
            std::cout << entry.upload_info.input_file.string() << "\n"
                      << "  url:    " << entry.upload_info.upload_url << "\n"
                      << "  state:  " << state << " at byte " << entry.last_successful_byte << "\n"
                      << "  saved:  " << format_time(entry.saved_at) << std::endl;
        }
        return EXIT_SUCCESS;
    }

    int UploadSession::handle_discard()
    {
        if (config_.discard_all)
        {
            manager_->discard_all_resumable();
            std::cout << "Discarded every resumable upload" << std::endl;
            return EXIT_SUCCESS;
        }
        if (manager_->discard_resumable(*config_.file) == 0)
        {
            std::cerr << "No resumable upload for " << config_.file->string() << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << "Discarded " << config_.file->string() << std::endl;
        return EXIT_SUCCESS;
    }

    void UploadSession::track(std::unique_ptr<DirectUpload> upload)
    {
        auto &handle = *upload;
        handle.set_progress_handler([this](const DirectUpload::Status &status)
                                    {
            std::lock_guard lock(output_mutex_);
            std::cout << "\rUploaded " << status.completed_bytes << " / " << status.total_bytes << " bytes"
                      << (status.is_paused ? " (paused)" : "") << std::flush; });
        handle.set_result_handler([this, &handle](const DirectUpload::Result &result)
                                  { on_result(handle, result); });

        std::lock_guard lock(output_mutex_);
        ++outstanding_;
        uploads_.push_back(std::move(upload));
    }

    int UploadSession::wait_for_uploads()
    {
        {
            std::lock_guard lock(output_mutex_);
            if (outstanding_ == 0)
            {
                return any_failed_ ? EXIT_FAILURE : EXIT_SUCCESS;
            }
        }

        signals_.async_wait([this](const asio::error_code &ec, int signal_number)
                            {
            if (ec)
            {
                return;
            }
            spdlog::warn("Received signal {}, pausing uploads", signal_number);
            interrupt(); });
        io_context_.run();
        io_context_.restart();

        std::lock_guard lock(output_mutex_);
        if (interrupted_)
        {
            return kInterruptedExitCode;
        }
        return any_failed_ ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    void UploadSession::on_result(const DirectUpload &upload, const DirectUpload::Result &result)
    {
        std::lock_guard lock(output_mutex_);
        if (const auto *success = std::get_if<DirectUpload::Success>(&result))
        {
            std::cout << "\nUploaded " << upload.input_file().string() << " (" << success->final_state.total_bytes
                      << " bytes)" << std::endl;
        }
        else
        {
            const auto &error = std::get<DirectUpload::UploadError>(result);
            any_failed_ = true;
            std::cerr << "\nUpload of " << upload.input_file().string() << " failed [" << to_string(error.code)
                      << "]: " << error.message << std::endl;
        }

        if (outstanding_ > 0 && --outstanding_ == 0)
        {
            asio::post(io_context_, [this]()
                       { signals_.cancel(); });
        }
    }

    void UploadSession::interrupt()
    {
        {
            std::lock_guard lock(output_mutex_);
            interrupted_ = true;
        }
        const auto workers = manager_->all_managed();
        for (const auto &worker : workers)
        {
            worker->pause();
        }
        for (const auto &worker : workers)
        {
            if (!worker->wait_for_idle(kPauseTimeout))
            {
                spdlog::warn("Upload of {} did not stop in time", worker->info().input_file.string());
            }
        }
        manager_->persist_all();

        std::lock_guard lock(output_mutex_);
        std::cout << "\nUploads paused. Run `chunkup resume` to continue." << std::endl;
    }

    void UploadSession::shutdown()
    {
        if (manager_)
        {
            for (const auto &worker : manager_->all_managed())
            {
                worker->pause();
            }
        }
        pool_.join();
    }

    bool UploadSession::ask_yes_no(const std::string &question) const
    {
        while (true)
        {
            std::cout << question << " (y/n): " << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer))
            {
                return false;
            }
            answer = trim(to_upper(answer));
            if (answer == "Y" || answer == "YES")
            {
                return true;
            }
            if (answer == "N" || answer == "NO")
            {
                return false;
            }
            std::cout << "Please answer y or n." << std::endl;
        }
    }

} // namespace chunkup::client
