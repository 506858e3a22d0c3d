#pragma once

#include <asio.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "chunkup/client/config.hpp"
#include "chunkup/direct_upload.hpp"
#include "chunkup/http_client.hpp"
#include "chunkup/upload_manager.hpp"

namespace chunkup::client
{

    // Runs one CLI command to completion. SIGINT and SIGTERM pause every
    // upload, persist the ledger and end the run with kInterruptedExitCode.
    class UploadSession
    {
    public:
        static constexpr int kInterruptedExitCode = 130;

        explicit UploadSession(ClientConfig config);
        ~UploadSession();

        UploadSession(const UploadSession &) = delete;
        UploadSession &operator=(const UploadSession &) = delete;

        int run();

    private:
        int handle_upload();
        int handle_resume();
        int handle_list();
        int handle_discard();

        void track(std::unique_ptr<DirectUpload> upload);
        int wait_for_uploads();
        void on_result(const DirectUpload &upload, const DirectUpload::Result &result);
        void interrupt();
        void shutdown();
        bool ask_yes_no(const std::string &question) const;

        ClientConfig config_;
        asio::thread_pool pool_;
        std::shared_ptr<HttpClient> http_client_;
        std::unique_ptr<UploadManager> manager_;

        asio::io_context io_context_;
        asio::signal_set signals_;

        std::mutex output_mutex_;
        std::size_t outstanding_{0};
        bool any_failed_{false};
        bool interrupted_{false};
        std::vector<std::unique_ptr<DirectUpload>> uploads_;
    };

} // namespace chunkup::client
