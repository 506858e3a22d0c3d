/**
 * chunkup - Fire-and-forget lifecycle events. Delivery failures are logged
 * and dropped.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <nlohmann/json.hpp>

#include "chunkup/http_client.hpp"
#include "chunkup/upload_info.hpp"
#include "chunkup/upload_state.hpp"

namespace chunkup
{

    class EventReporter
    {
    public:
        EventReporter(asio::any_io_executor executor, std::shared_ptr<HttpClient> client, std::string endpoint);

        void report_upload_succeeded(const UploadInfo &info, const UploadProgress &progress);

        void report_upload_failed(const UploadInfo &info, const UploadFailure &failure);

        void report_input_standardization_failed(const UploadInfo &info, const std::string &error_description,
                                                 const std::vector<std::string> &non_standard_reasons,
                                                 bool upload_cancelled);

        const std::string &session_id() const noexcept { return session_id_; }

        // Envelope common to every event; exposed for inspection in tests.
        nlohmann::json make_event(const std::string &type, const UploadInfo &info) const;

    private:
        void send(nlohmann::json event);

        asio::any_io_executor executor_;
        std::shared_ptr<HttpClient> client_;
        std::string endpoint_;
        std::string session_id_;
    };

} // namespace chunkup
