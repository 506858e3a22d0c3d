#include <asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkup/direct_upload.hpp"
#include "chunkup/event_reporter.hpp"
#include "chunkup/input_inspector.hpp"
#include "test_helpers.hpp"

using namespace chunkup;

namespace
{

    constexpr std::size_t kChunk = UploadOptions::kMinimumChunkSize;
    const std::string kUrl = "https://upload.example/direct";

    UploadOptions small_chunks()
    {
        UploadOptions options;
        options.transport.chunk_size_in_bytes = kChunk;
        options.transport.retries_per_chunk = 1;
        return options;
    }

    class FixedInspector : public InputInspector
    {
    public:
        explicit FixedInspector(InspectionResult result) : result_(std::move(result)) {}

        InspectionResult inspect(const std::filesystem::path &) override
        {
            ++calls;
            return result_;
        }

        std::atomic<int> calls{0};

    private:
        InspectionResult result_;
    };

    // Collects everything a DirectUpload reports.
    struct Recorder
    {
        std::mutex mutex;
        std::vector<DirectUpload::Result> results;
        std::vector<DirectUpload::Status> statuses;
        std::vector<DirectUpload::InputStatus> input_statuses;

        void attach(DirectUpload &upload)
        {
            upload.set_result_handler([this](const DirectUpload::Result &result)
                                      {
                std::lock_guard lock(mutex);
                results.push_back(result); });
            upload.set_progress_handler([this](const DirectUpload::Status &status)
                                        {
                std::lock_guard lock(mutex);
                statuses.push_back(status); });
            upload.set_input_status_handler([this](DirectUpload::InputStatus status)
                                            {
                std::lock_guard lock(mutex);
                input_statuses.push_back(status); });
        }

        std::size_t result_count()
        {
            std::lock_guard lock(mutex);
            return results.size();
        }

        bool saw(DirectUpload::InputStatus status)
        {
            std::lock_guard lock(mutex);
            return std::find(input_statuses.begin(), input_statuses.end(), status) != input_statuses.end();
        }
    };

    void test_successful_upload()
    {
        const std::uint64_t size = 2 * kChunk + 3;
        testing::TempFile file("direct_success.bin", size);
        asio::thread_pool pool(2);
        auto client = std::make_shared<testing::FakeHttpClient>();
        UploadManager manager(pool.get_executor(), client);

        DirectUpload upload(kUrl, file.path(), small_chunks(), manager);
        Recorder recorder;
        recorder.attach(upload);
        assert(upload.input_status() == DirectUpload::InputStatus::Ready);
        assert(upload.input_file() == normalize_path(file.path()));
        assert(upload.upload_url() == kUrl);

        upload.start();
        assert(testing::wait_until([&]()
                                   { return upload.complete(); }));
        assert(testing::wait_until([&]()
                                   { return recorder.result_count() == 1; }));

        std::lock_guard lock(recorder.mutex);
        const auto *success = std::get_if<DirectUpload::Success>(&recorder.results.front());
        assert(success);
        assert(success->final_state.completed_bytes == size);
        assert(success->final_state.total_bytes == size);
        assert(!success->final_state.is_paused);
        assert(!upload.in_progress());
        assert(upload.status().completed_bytes == size);

        std::uint64_t last = 0;
        for (const auto &status : recorder.statuses)
        {
            assert(status.completed_bytes >= last);
            last = status.completed_bytes;
        }
        const auto &inputs = recorder.input_statuses;
        assert(inputs.front() == DirectUpload::InputStatus::Started);
        assert(std::find(inputs.begin(), inputs.end(), DirectUpload::InputStatus::Preparing) != inputs.end());
        assert(inputs.back() == DirectUpload::InputStatus::Finished);
    }

    void test_failed_upload()
    {
        testing::TempFile file("direct_failure.bin", kChunk);
        asio::thread_pool pool(2);
        auto client = std::make_shared<testing::FakeHttpClient>([](const HttpRequest &, std::size_t)
                                                                { return HttpResponse{503, "Service Unavailable", {}}; });
        UploadManager manager(pool.get_executor(), client);

        DirectUpload upload(kUrl, file.path(), small_chunks(), manager);
        Recorder recorder;
        recorder.attach(upload);
        upload.start();
        assert(testing::wait_until([&]()
                                   { return recorder.result_count() == 1; }));

        std::lock_guard lock(recorder.mutex);
        const auto *error = std::get_if<DirectUpload::UploadError>(&recorder.results.front());
        assert(error);
        assert(error->code == UploadErrorCode::Http);
        assert(error->status_code == 503L);
        assert(!error->message.empty());
        assert(error->cause);
        assert(client->call_count() == 2);
    }

    void test_cancel_delivers_no_result()
    {
        testing::TempFile file("direct_cancel.bin", 2 * kChunk);
        asio::thread_pool pool(2);
        auto client = std::make_shared<testing::FakeHttpClient>();
        client->set_gated(true);
        UploadManager manager(pool.get_executor(), client);

        DirectUpload upload(kUrl, file.path(), small_chunks(), manager);
        Recorder recorder;
        recorder.attach(upload);
        upload.start();
        assert(testing::wait_until([&]()
                                   { return client->call_count() == 1; }));
        assert(testing::wait_until([&]()
                                   { return upload.in_progress(); }));

        upload.cancel();
        assert(manager.all_managed().empty());
        assert(upload.input_status() == DirectUpload::InputStatus::Ready);
        client->allow(10);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(recorder.result_count() == 0);
    }

    void test_pause_reports_paused_status()
    {
        testing::TempFile file("direct_pause.bin", 2 * kChunk);
        asio::thread_pool pool(2);
        auto client = std::make_shared<testing::FakeHttpClient>();
        client->set_gated(true);
        UploadManager manager(pool.get_executor(), client);

        DirectUpload upload(kUrl, file.path(), small_chunks(), manager);
        upload.start();
        assert(testing::wait_until([&]()
                                   { return client->call_count() == 1; }));
        upload.pause();
        assert(upload.status().is_paused);
        assert(upload.input_status() == DirectUpload::InputStatus::UploadPaused);

        client->set_gated(false);
        upload.start();
        assert(testing::wait_until([&]()
                                   { return upload.complete(); }));
        assert(!upload.status().is_paused);
    }

    void test_second_handle_attaches()
    {
        testing::TempFile file("direct_attach.bin", 2 * kChunk);
        asio::thread_pool pool(2);
        auto client = std::make_shared<testing::FakeHttpClient>();
        client->set_gated(true);
        UploadManager manager(pool.get_executor(), client);

        DirectUpload first(kUrl, file.path(), small_chunks(), manager);
        Recorder first_recorder;
        first_recorder.attach(first);
        first.start();
        assert(testing::wait_until([&]()
                                   { return client->call_count() == 1; }));

        DirectUpload second(kUrl, file.path(), small_chunks(), manager);
        Recorder second_recorder;
        second_recorder.attach(second);
        second.start();
        assert(manager.all_managed().size() == 1);

        client->set_gated(false);
        assert(testing::wait_until([&]()
                                   { return first_recorder.result_count() == 1 && second_recorder.result_count() == 1; }));
        assert(client->call_count() == 2);
    }

    void test_force_restart()
    {
        const std::uint64_t size = 2 * kChunk;
        testing::TempFile file("direct_restart.bin", size);
        asio::thread_pool pool(2);
        auto client = std::make_shared<testing::FakeHttpClient>();
        client->set_gated(true);
        UploadManager manager(pool.get_executor(), client);

        DirectUpload upload(kUrl, file.path(), small_chunks(), manager);
        upload.start();
        assert(testing::wait_until([&]()
                                   { return client->call_count() == 1; }));
        client->allow(1);
        assert(testing::wait_until([&]()
                                   { return client->call_count() == 2; }));
        const auto original = manager.find_by_file(file.path());

        Recorder recorder;
        recorder.attach(upload);
        upload.start(true);
        assert(std::holds_alternative<state::Cancelled>(original->state()));
        const auto fresh = manager.find_by_file(file.path());
        assert(fresh && fresh != original);

        client->set_gated(false);
        assert(testing::wait_until([&]()
                                   { return recorder.result_count() == 1; }));
        const auto requests = client->requests();
        assert(requests.back().header("Content-Range") ==
               "bytes " + std::to_string(kChunk) + "-" + std::to_string(size - 1) + "/" + std::to_string(size));
        // The restarted upload sent the first range again.
        const auto first_ranges = std::count_if(requests.begin(), requests.end(), [](const auto &request)
                                                { return request.header("Content-Range").rfind("bytes 0-", 0) == 0; });
        assert(first_ranges == 2);
    }

    void test_declined_non_standard_input()
    {
        testing::TempFile file("direct_declined.bin", kChunk);
        asio::thread_pool pool(2);
        auto client = std::make_shared<testing::FakeHttpClient>();
        auto events = std::make_shared<testing::FakeHttpClient>();
        auto reporter = std::make_shared<EventReporter>(pool.get_executor(), events, "https://events.example");
        UploadManager manager(pool.get_executor(), client, nullptr, reporter);

        auto inspector = std::make_shared<FixedInspector>(
            InspectionResult{InspectionResult::Kind::NonStandard, {"unsupported codec"}, "needs transcoding"});
        DirectUpload upload(kUrl, file.path(), small_chunks(), manager, inspector);
        Recorder recorder;
        recorder.attach(upload);
        bool asked = false;
        upload.set_non_standard_input_handler([&]()
                                              {
            asked = true;
            return false; });

        upload.start();
        assert(asked);
        assert(inspector->calls == 1);
        assert(recorder.saw(DirectUpload::InputStatus::AwaitingUploadConfirmation));
        assert(upload.input_status() == DirectUpload::InputStatus::Ready);
        assert(manager.all_managed().empty());
        assert(client->call_count() == 0);
        assert(recorder.result_count() == 0);

        assert(testing::wait_until([&]()
                                   { return events->call_count() == 1; }));
        const auto request = events->requests().front();
        const auto body = nlohmann::json::parse(std::string(reinterpret_cast<const char *>(request.body.data()),
                                                            request.body.size()));
        assert(body["type"] == "input_standardization_failed");
        assert(body["upload_canceled"] == true);
        assert(body["non_standard_input_reasons"][0] == "unsupported codec");
    }

    void test_inspection_skipped_or_accepted()
    {
        testing::TempFile file("direct_inspection.bin", kChunk);
        asio::thread_pool pool(2);
        auto client = std::make_shared<testing::FakeHttpClient>();
        UploadManager manager(pool.get_executor(), client);

        auto failing = std::make_shared<FixedInspector>(
            InspectionResult{InspectionResult::Kind::Failure, {}, "cannot inspect"});

        // Without a handler the upload proceeds.
        DirectUpload proceeds(kUrl, file.path(), small_chunks(), manager, failing);
        proceeds.start();
        assert(failing->calls == 1);
        assert(testing::wait_until([&]()
                                   { return proceeds.complete(); }));

        auto options = small_chunks();
        options.input_standardization.requested = false;
        DirectUpload skipped("https://upload.example/skipped", file.path(), options, manager, failing);
        Recorder recorder;
        recorder.attach(skipped);
        skipped.start();
        assert(failing->calls == 1);
        assert(testing::wait_until([&]()
                                   { return skipped.complete(); }));
        assert(!recorder.saw(DirectUpload::InputStatus::Preparing));
    }

    void test_wraps_resumed_worker()
    {
        testing::TempFile file("direct_wrap.bin", kChunk + 1);
        asio::thread_pool pool(2);
        auto client = std::make_shared<testing::FakeHttpClient>();
        UploadManager manager(pool.get_executor(), client);

        UploadInfo info{kUrl, file.path(), small_chunks()};
        auto worker = manager.create_worker(info);
        DirectUpload upload(worker, manager);
        Recorder recorder;
        recorder.attach(upload);
        assert(upload.input_file() == normalize_path(file.path()));

        manager.start(worker);
        assert(testing::wait_until([&]()
                                   { return recorder.result_count() == 1; }));
        std::lock_guard lock(recorder.mutex);
        assert(std::holds_alternative<DirectUpload::Success>(recorder.results.front()));
    }

    void test_rejects_invalid_options()
    {
        asio::thread_pool pool(1);
        UploadManager manager(pool.get_executor(), std::make_shared<testing::FakeHttpClient>());
        UploadOptions options;
        options.transport.chunk_size_in_bytes = 16;
        bool threw = false;
        try
        {
            DirectUpload upload(kUrl, "file.bin", options, manager);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

} // namespace

void run_direct_upload_tests()
{
    test_successful_upload();
    test_failed_upload();
    test_cancel_delivers_no_result();
    test_pause_reports_paused_status();
    test_second_handle_attaches();
    test_force_restart();
    test_declined_non_standard_input();
    test_inspection_skipped_or_accepted();
    test_wraps_resumed_worker();
    test_rejects_invalid_options();
}
