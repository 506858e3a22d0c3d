#pragma once

#include <atomic>

#include "chunkup/errors.hpp"

namespace chunkup
{

    // Shared between a worker and the request it has in flight. Once
    // cancelled it stays cancelled.
    class CancellationToken
    {
    public:
        void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

        bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

        void throw_if_cancelled() const
        {
            if (is_cancelled())
            {
                throw CancellationError();
            }
        }

    private:
        std::atomic<bool> cancelled_{false};
    };

} // namespace chunkup
