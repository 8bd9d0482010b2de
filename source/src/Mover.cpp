#include "Mover.hpp"
#include "FleetOrchestrator.hpp"
#include "Log.hpp"
#include "ServerReconciler.hpp"

#include <csignal>
#include <exception>

Mover::Mover(AppConfig config):
    _config(std::move(config)),
    _scheduler(
        _ioc.get_executor(),
        FleetOrchestrator(ServerReconciler(_disk_pool.get_executor(), _config.request_timeout)),
        [this] { return _config.servers; },
        _config.rate_limit_delay
    )
    {}

void Mover::run() {
    boost::asio::signal_set signals(_ioc, SIGINT, SIGTERM);

    signals.async_wait([this](const boost::system::error_code& ec, int signal) {
        if (ec) return;
        MOVER_LOG_INFO("Caught signal {}, finishing the current cycle", signal);
        _scheduler.request_shutdown();
    });

    boost::asio::co_spawn(_ioc, _scheduler.run(), [&signals](std::exception_ptr ep) {
        boost::system::error_code ec;
        signals.cancel(ec);

        if (ep) std::rethrow_exception(ep);
    });

    _ioc.run();
    _disk_pool.join();
}
