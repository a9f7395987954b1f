#include "Reaper.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/error.hpp>

Reaper::Reaper(SweepFn sweep, std::chrono::milliseconds interval, std::shared_ptr<ILogger> logger)
    : sweep_(std::move(sweep)), interval_(interval), logger_(std::move(logger)), timer_(ioc_) {
    if (!sweep_) {
        throw std::invalid_argument("Sweep callback cannot be empty for Reaper");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for Reaper");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Reaper interval must be positive, got " + std::to_string(interval_.count()) + "ms");
    }

    logger_->setup("Reaper started with interval " + std::to_string(interval_.count()) + "ms");
    arm();
    // Started last: a throw after this point would destroy a joinable thread
    thread_ = std::thread([this]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            logger_->error("Exception in reaper thread: " + std::string(e.what()));
        }
        logger_->debug("Reaper thread exiting.");
    });
}

Reaper::~Reaper() {
    stop();
    joinThread();
}

void Reaper::stop() {
    if (stopped_.exchange(true)) {
        return; // Already stopped
    }
    logger_->debug("Stopping reaper...");
    ioc_.stop();
    joinThread();
}

void Reaper::joinThread() {
    // A sweep callback that stops its own reaper cannot join itself;
    // the destructor joins later from the owning thread.
    if (!thread_.joinable() || thread_.get_id() == std::this_thread::get_id()) {
        return;
    }
    thread_.join();
    // The io_context is no longer run by anyone, so the timer can be touched safely
    timer_.cancel();
    logger_->debug("Reaper stopped.");
}

void Reaper::arm() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) { onTick(ec); });
}

void Reaper::onTick(const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || stopped_.load()) {
        return;
    }
    if (ec) {
        logger_->error("Reaper timer error: " + ec.message());
        arm();
        return;
    }

    try {
        std::size_t removed = sweep_();
        sweeps_.fetch_add(1);
        if (removed > 0) {
            logger_->debug("Reaper removed " + std::to_string(removed) + " expired entries");
        }
    } catch (const std::exception& e) {
        logger_->error("Reaper sweep failed: " + std::string(e.what()));
    }

    arm();
}
