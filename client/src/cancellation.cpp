#include "clouddrive/client/cancellation.hpp"

#include <csignal>

namespace clouddrive::client
{

    InterruptListener::InterruptListener(CancellationToken &token, Logger logger)
        : token_(token),
          logger_(std::move(logger)),
          signals_(io_context_, SIGINT, SIGTERM)
    {
        wait_next();
        worker_ = std::thread([this]
                              { io_context_.run(); });
    }

    InterruptListener::~InterruptListener()
    {
        io_context_.stop();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    void InterruptListener::wait_next()
    {
        signals_.async_wait([this](const std::error_code &ec, int signal_number)
                            {
            if (ec) {
                return;
            }
            logger_.log("signal", "received signal ", signal_number, ", cancelling");
            token_.cancel();
            wait_next(); });
    }

} // namespace clouddrive::client
