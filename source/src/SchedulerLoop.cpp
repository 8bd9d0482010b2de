#include "SchedulerLoop.hpp"
#include "Log.hpp"

SchedulerLoop::SchedulerLoop(boost::asio::any_io_executor exec, FleetOrchestrator fleet, ProfileSource profiles, std::chrono::milliseconds delay):
    _fleet(std::move(fleet)),
    _profiles(std::move(profiles)),
    _delay(delay),
    _timer(exec)
    {}

boost::asio::awaitable<void> SchedulerLoop::run() {
    while (state() == State::Running) {
        auto profiles = _profiles();

        ++_cycles;
        MOVER_LOG_INFO("Starting cycle {} over {} server(s)", _cycles, profiles.size());

        auto result = co_await _fleet.run_cycle(std::move(profiles));
        report(result);

        if (state() != State::Running) break;

        _timer.expires_after(_delay);

        boost::system::error_code ec;
        co_await _timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    MOVER_LOG_INFO("Received shutdown signal. Exiting...");
}

void SchedulerLoop::request_shutdown() {
    _state.store(State::ShuttingDown, std::memory_order_release);

    // the flag is set before the cancel is posted, so a wait started after this point sees it first
    boost::asio::post(_timer.get_executor(), [this] { _timer.cancel(); });
}

void SchedulerLoop::report(const CycleResult& result) const {
    if (result.errors.empty()) {
        MOVER_LOG_INFO("Cycle {} done: {}/{} servers online, {} moved, {} skipped", _cycles, result.servers_online, result.servers_processed, result.relocated, result.skipped);
        return;
    }

    MOVER_LOG_WARN("Cycle {} done with {} error(s): {}/{} servers online, {} moved, {} skipped", _cycles, result.errors.size(), result.servers_online, result.servers_processed, result.relocated, result.skipped);

    for (const auto& [server, error]: result.errors) {
        MOVER_LOG_WARN("  {} [{}] {}", server, to_string(error.kind), error.message);
    }
}
