#pragma once

#include <asio.hpp>

#include <atomic>
#include <thread>

#include "clouddrive/client/logger.hpp"

namespace clouddrive::client
{

    // Advisory cancellation flag polled by the upload and poll loops between iterations.
    class CancellationToken
    {
    public:
        void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
        bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    private:
        std::atomic<bool> cancelled_{false};
    };

    // Turns SIGINT / SIGTERM into a cancellation request for as long as it is alive.
    class InterruptListener
    {
    public:
        InterruptListener(CancellationToken &token, Logger logger);
        ~InterruptListener();

        InterruptListener(const InterruptListener &) = delete;
        InterruptListener &operator=(const InterruptListener &) = delete;

    private:
        void wait_next();

        CancellationToken &token_;
        Logger logger_;
        asio::io_context io_context_;
        asio::signal_set signals_;
        std::thread worker_;
    };

} // namespace clouddrive::client
