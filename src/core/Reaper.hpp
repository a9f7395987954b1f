#ifndef REAPER_HPP
#define REAPER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../interfaces/ILogger.hpp"

namespace net = boost::asio;

// Runs a sweep callback on a fixed interval from its own thread until stopped.
//
// The timer lives on a private io_context driven by one thread. stop() flips
// an atomic flag and stops the io_context, so any number of stop() calls from
// any thread complete without a rendezvous. Once stopped the reaper never
// runs again.
class Reaper {
public:
    // Returns how many entries the sweep removed.
    using SweepFn = std::function<std::size_t()>;

    Reaper(SweepFn sweep, std::chrono::milliseconds interval, std::shared_ptr<ILogger> logger);
    ~Reaper();

    // Idempotent. Joins the reaper thread unless called from it.
    void stop();

    bool isRunning() const { return !stopped_.load(); }
    std::chrono::milliseconds interval() const { return interval_; }

    // Completed sweeps, including ones that removed nothing.
    std::size_t sweepCount() const { return sweeps_.load(); }

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;
    Reaper(Reaper&&) = delete;
    Reaper& operator=(Reaper&&) = delete;

private:
    void arm();
    void onTick(const boost::system::error_code& ec);
    void joinThread();

    SweepFn sweep_;
    const std::chrono::milliseconds interval_;
    std::shared_ptr<ILogger> logger_;

    net::io_context ioc_;
    net::steady_timer timer_;
    std::atomic<bool> stopped_{false};
    std::atomic<std::size_t> sweeps_{0};
    std::thread thread_;
};

#endif // REAPER_HPP
