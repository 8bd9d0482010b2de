#pragma once

#include "FleetOrchestrator.hpp"
#include "ServerProfile.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <vector>

#include <boost/asio.hpp>

class SchedulerLoop {
public:
    enum class State { Running, ShuttingDown };

    // asked for a fresh set of profiles at the start of every cycle
    using ProfileSource = std::function<std::vector<ServerProfile>()>;

    SchedulerLoop(boost::asio::any_io_executor exec, FleetOrchestrator fleet, ProfileSource profiles, std::chrono::milliseconds delay);

    // runs cycles until request_shutdown. an in-flight cycle always finishes first.
    [[nodiscard]] boost::asio::awaitable<void> run();

    // safe from any thread, including signal handlers running on the executor
    void request_shutdown();

    State state() const { return _state.load(std::memory_order_acquire); }
    std::size_t cycles() const { return _cycles; }

private:
    void report(const CycleResult& result) const;

    FleetOrchestrator _fleet;
    ProfileSource _profiles;
    std::chrono::milliseconds _delay;

    boost::asio::steady_timer _timer;
    std::atomic<State> _state{ State::Running };
    std::size_t _cycles{};
};
