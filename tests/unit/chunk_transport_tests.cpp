#include <atomic>
#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkup/cancellation.hpp"
#include "chunkup/chunk_transport.hpp"
#include "chunkup/errors.hpp"
#include "test_helpers.hpp"

using namespace chunkup;

namespace
{

    const std::string kUrl = "https://upload.example/session/1";

    FileChunk make_chunk(std::uint64_t start, std::size_t size, std::uint64_t total)
    {
        FileChunk chunk{start, start + size, total, std::vector<std::byte>(size)};
        for (std::size_t i = 0; i < size; ++i)
        {
            chunk.data[i] = testing::pattern_byte(start + i);
        }
        return chunk;
    }

    void test_successful_chunk()
    {
        auto client = std::make_shared<testing::FakeHttpClient>();
        ChunkTransport transport(client, 3);
        const auto chunk = make_chunk(100, 50, 1000);
        CancellationToken token;

        std::vector<std::uint64_t> progress;
        const auto result = transport.upload(chunk, kUrl, token, [&](std::uint64_t sent)
                                             { progress.push_back(sent); });
        assert(result.attempts == 1);
        assert(result.status_code == 200);

        const auto requests = client->requests();
        assert(requests.size() == 1);
        assert(requests[0].method == "PUT");
        assert(requests[0].url == kUrl);
        assert(requests[0].header("Content-Type") == "application/octet-stream");
        assert(requests[0].header("Content-Range") == "bytes 100-149/1000");
        assert(requests[0].body == chunk.data);
        assert(!progress.empty());
        assert(progress.back() == 50);
    }

    void test_resume_incomplete_proceeds()
    {
        auto client = std::make_shared<testing::FakeHttpClient>([](const HttpRequest &, std::size_t)
                                                                { return HttpResponse{308, "Resume Incomplete", {}}; });
        ChunkTransport transport(client, 0);
        CancellationToken token;
        const auto result = transport.upload(make_chunk(0, 10, 20), kUrl, token, {});
        assert(result.status_code == 308);
    }

    void test_retries_then_succeeds()
    {
        auto client = std::make_shared<testing::FakeHttpClient>([](const HttpRequest &, std::size_t index)
                                                                {
            if (index == 0)
            {
                return HttpResponse{503, "Service Unavailable", {}};
            }
            if (index == 1)
            {
                throw ConnectionError("connection reset");
            }
            return HttpResponse{201, "Created", {}}; });
        ChunkTransport transport(client, 3);
        CancellationToken token;
        const auto result = transport.upload(make_chunk(0, 10, 10), kUrl, token, {});
        assert(result.attempts == 3);
        assert(client->call_count() == 3);
        // Each retry resends the same range.
        for (const auto &request : client->requests())
        {
            assert(request.header("Content-Range") == "bytes 0-9/10");
            assert(request.body.size() == 10);
        }
    }

    void test_retries_exhausted()
    {
        for (const int retries : {0, 1, 3})
        {
            auto client = std::make_shared<testing::FakeHttpClient>([](const HttpRequest &, std::size_t)
                                                                    { return HttpResponse{500, "Internal Server Error", {}}; });
            ChunkTransport transport(client, retries);
            CancellationToken token;
            bool threw = false;
            try
            {
                transport.upload(make_chunk(0, 10, 10), kUrl, token, {});
            }
            catch (const ChunkTransportError &ex)
            {
                threw = true;
                assert(ex.attempts() == retries + 1);
                assert(ex.http_error());
                assert(ex.http_error()->status_code == 500);
            }
            assert(threw);
            assert(client->call_count() == static_cast<std::size_t>(retries + 1));
        }
    }

    void test_connection_failures_exhausted()
    {
        auto client = std::make_shared<testing::FakeHttpClient>([](const HttpRequest &, std::size_t) -> HttpResponse
                                                                { throw ConnectionError("could not resolve host"); });
        ChunkTransport transport(client, 2);
        CancellationToken token;
        bool threw = false;
        try
        {
            transport.upload(make_chunk(0, 10, 10), kUrl, token, {});
        }
        catch (const ChunkTransportError &ex)
        {
            threw = true;
            assert(!ex.http_error());
            assert(std::string(ex.what()).find("could not resolve host") != std::string::npos);
        }
        assert(threw);
        assert(client->call_count() == 3);
    }

    void test_client_error_is_terminal()
    {
        auto client = std::make_shared<testing::FakeHttpClient>([](const HttpRequest &, std::size_t)
                                                                { return HttpResponse{403, "Forbidden", {}}; });
        ChunkTransport transport(client, 5);
        CancellationToken token;
        bool threw = false;
        try
        {
            transport.upload(make_chunk(0, 10, 10), kUrl, token, {});
        }
        catch (const ChunkTransportError &ex)
        {
            threw = true;
            assert(ex.attempts() == 1);
            assert(ex.http_error()->status_code == 403);
        }
        assert(threw);
        assert(client->call_count() == 1);
    }

    void test_cancelled_before_attempt()
    {
        auto client = std::make_shared<testing::FakeHttpClient>();
        ChunkTransport transport(client, 3);
        CancellationToken token;
        token.cancel();
        bool threw = false;
        try
        {
            transport.upload(make_chunk(0, 10, 10), kUrl, token, {});
        }
        catch (const CancellationError &)
        {
            threw = true;
        }
        assert(threw);
        assert(client->call_count() == 0);
    }

    void test_cancellation_is_not_retried()
    {
        CancellationToken token;
        auto client = std::make_shared<testing::FakeHttpClient>([&](const HttpRequest &, std::size_t) -> HttpResponse
                                                                {
            token.cancel();
            throw CancellationError(); });
        ChunkTransport transport(client, 3);
        bool threw = false;
        try
        {
            transport.upload(make_chunk(0, 10, 10), kUrl, token, {});
        }
        catch (const CancellationError &)
        {
            threw = true;
        }
        assert(threw);
        assert(client->call_count() == 1);
    }

    void test_signal_completion()
    {
        auto client = std::make_shared<testing::FakeHttpClient>();
        ChunkTransport transport(client, 1);
        CancellationToken token;
        transport.signal_completion(4096, kUrl, token);
        const auto requests = client->requests();
        assert(requests.size() == 1);
        assert(requests[0].header("Content-Range") == "bytes */4096");
        assert(requests[0].body.empty());
    }

    void test_constructor_validation()
    {
        bool threw = false;
        try
        {
            ChunkTransport transport(nullptr, 1);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            ChunkTransport transport(std::make_shared<testing::FakeHttpClient>(), -1);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

} // namespace

void run_chunk_transport_tests()
{
    test_successful_chunk();
    test_resume_incomplete_proceeds();
    test_retries_then_succeeds();
    test_retries_exhausted();
    test_connection_failures_exhausted();
    test_client_error_is_terminal();
    test_cancelled_before_attempt();
    test_cancellation_is_not_retried();
    test_signal_completion();
    test_constructor_validation();
}
