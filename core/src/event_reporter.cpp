#include "chunkup/event_reporter.hpp"

#include <asio/post.hpp>

#include <chrono>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "chunkup/crypto.hpp"
#include "chunkup/version.hpp"

namespace chunkup
{

    namespace
    {

        std::int64_t to_millis(Clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
        }

    } // namespace

    EventReporter::EventReporter(asio::any_io_executor executor, std::shared_ptr<HttpClient> client,
                                 std::string endpoint)
        : executor_(std::move(executor)),
          client_(std::move(client)),
          endpoint_(std::move(endpoint)),
          session_id_(crypto::random_hex(16))
    {
        if (!client_)
        {
            throw std::invalid_argument("EventReporter requires an HTTP client");
        }
    }

    nlohmann::json EventReporter::make_event(const std::string &type, const UploadInfo &info) const
    {
        return {
            {"type", type},
            {"session_id", session_id_},
            {"sdk_version", std::string(version())},
            {"platform", "linux"},
            {"upload_url", info.upload_url},
            {"chunk_size", info.options.transport.chunk_size_in_bytes},
            {"retries_per_chunk", info.options.transport.retries_per_chunk},
            {"input_standardization_requested", info.options.input_standardization.requested},
            {"maximum_resolution", std::string(to_string(info.options.input_standardization.maximum_resolution))},
        };
    }

    void EventReporter::report_upload_succeeded(const UploadInfo &info, const UploadProgress &progress)
    {
        if (info.options.event_tracking.opted_out)
        {
            return;
        }
        auto event = make_event("upload_succeeded", info);
        event["file_size"] = progress.total_bytes;
        event["start_time"] = to_millis(progress.start_time);
        event["end_time"] = to_millis(progress.updated_time);
        send(std::move(event));
    }

    void EventReporter::report_upload_failed(const UploadInfo &info, const UploadFailure &failure)
    {
        if (info.options.event_tracking.opted_out)
        {
            return;
        }
        auto event = make_event("upload_failed", info);
        event["file_size"] = failure.last_progress.total_bytes;
        event["start_time"] = to_millis(failure.last_progress.start_time);
        event["end_time"] = to_millis(Clock::now());
        event["error_code"] = std::string(to_string(failure.code));
        event["error_description"] = failure.message;
        send(std::move(event));
    }

    void EventReporter::report_input_standardization_failed(const UploadInfo &info,
                                                            const std::string &error_description,
                                                            const std::vector<std::string> &non_standard_reasons,
                                                            bool upload_cancelled)
    {
        if (info.options.event_tracking.opted_out)
        {
            return;
        }
        auto event = make_event("input_standardization_failed", info);
        event["error_description"] = error_description;
        event["non_standard_input_reasons"] = non_standard_reasons;
        event["upload_canceled"] = upload_cancelled;
        send(std::move(event));
    }

    void EventReporter::send(nlohmann::json event)
    {
        asio::post(executor_, [client = client_, endpoint = endpoint_, event = std::move(event)]()
                   {
            const auto body = event.dump();
            const HttpRequest request{
                .method = "POST",
                .url = endpoint,
                .headers = {{"Content-Type", "application/json"}},
                .body = std::as_bytes(std::span(body.data(), body.size())),
            };
            const CancellationToken never_cancelled;
            try
            {
                const auto response = client->perform(request, TransferProgressHandler{}, never_cancelled);
                if (response.status_code < 200 || response.status_code >= 300)
                {
                    spdlog::debug("Event {} rejected with HTTP {}", event.value("type", std::string{}),
                                  response.status_code);
                }
            }
            catch (const std::exception &ex)
            {
                spdlog::debug("Event {} not delivered: {}", event.value("type", std::string{}), ex.what());
            } });
    }

} // namespace chunkup
