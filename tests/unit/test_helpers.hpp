#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "chunkup/errors.hpp"
#include "chunkup/http_client.hpp"

namespace chunkup::testing
{

    struct RecordedRequest
    {
        std::string method;
        std::string url;
        std::vector<std::pair<std::string, std::string>> headers;
        std::vector<std::byte> body;

        std::string header(const std::string &name) const
        {
            for (const auto &[key, value] : headers)
            {
                if (key == name)
                {
                    return value;
                }
            }
            return {};
        }
    };

    // Scriptable in-memory HttpClient. By default answers 200 to everything.
    // In gated mode each request waits for a permit from allow() or for cancellation.
    class FakeHttpClient : public HttpClient
    {
    public:
        using Responder = std::function<HttpResponse(const HttpRequest &, std::size_t call_index)>;

        explicit FakeHttpClient(Responder responder = {}) : responder_(std::move(responder)) {}

        HttpResponse perform(const HttpRequest &request, const TransferProgressHandler &progress,
                             const CancellationToken &token) override
        {
            token.throw_if_cancelled();
            std::size_t index = 0;
            {
                std::lock_guard lock(mutex_);
                index = requests_.size();
                requests_.push_back(RecordedRequest{request.method, request.url, request.headers,
                                                    std::vector<std::byte>(request.body.begin(), request.body.end())});
            }
            cv_.notify_all();

            if (progress && !request.body.empty())
            {
                progress(request.body.size() / 2);
            }

            {
                std::unique_lock lock(mutex_);
                while (gated_ && permits_ == 0)
                {
                    if (token.is_cancelled())
                    {
                        throw CancellationError();
                    }
                    cv_.wait_for(lock, std::chrono::milliseconds(5));
                }
                if (gated_)
                {
                    --permits_;
                }
            }
            token.throw_if_cancelled();

            if (progress && !request.body.empty())
            {
                progress(request.body.size());
            }
            if (responder_)
            {
                return responder_(request, index);
            }
            return HttpResponse{200, "OK", {}};
        }

        void set_gated(bool gated)
        {
            std::lock_guard lock(mutex_);
            gated_ = gated;
            cv_.notify_all();
        }

        void allow(std::size_t count = 1)
        {
            std::lock_guard lock(mutex_);
            permits_ += count;
            cv_.notify_all();
        }

        std::vector<RecordedRequest> requests() const
        {
            std::lock_guard lock(mutex_);
            return requests_;
        }

        std::size_t call_count() const
        {
            std::lock_guard lock(mutex_);
            return requests_.size();
        }

    private:
        Responder responder_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::vector<RecordedRequest> requests_;
        bool gated_{false};
        std::size_t permits_{0};
    };

    // Writes `size` patterned bytes to a fresh temp file, removed on destruction.
    class TempFile
    {
    public:
        TempFile(const std::string &name, std::uint64_t size)
            : path_(std::filesystem::temp_directory_path() / ("chunkup_test_" + name))
        {
            std::ofstream out(path_, std::ios::binary | std::ios::trunc);
            std::vector<char> block(64 * 1024);
            std::uint64_t written = 0;
            while (written < size)
            {
                const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(block.size(), size - written));
                for (std::size_t i = 0; i < count; ++i)
                {
                    block[i] = static_cast<char>((written + i) % 251);
                }
                out.write(block.data(), static_cast<std::streamsize>(count));
                written += count;
            }
        }

        ~TempFile()
        {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }

        TempFile(const TempFile &) = delete;
        TempFile &operator=(const TempFile &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    inline std::byte pattern_byte(std::uint64_t offset)
    {
        return static_cast<std::byte>(offset % 251);
    }

    inline bool wait_until(const std::function<bool()> &predicate,
                           std::chrono::milliseconds timeout = std::chrono::seconds(10))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return predicate();
    }

    inline std::filesystem::path temp_path(const std::string &name)
    {
        return std::filesystem::temp_directory_path() / ("chunkup_test_" + name);
    }

} // namespace chunkup::testing
