#include "FleetOrchestrator.hpp"
#include "Log.hpp"
#include "TaskGroup.hpp"

#include <exception>
#include <format>

boost::asio::awaitable<CycleResult> FleetOrchestrator::run_cycle(std::vector<ServerProfile> profiles) const {
    std::vector<std::string> urls;
    std::vector<boost::asio::awaitable<ServerReport>> tasks;
    urls.reserve(profiles.size());
    tasks.reserve(profiles.size());

    for (auto& profile: profiles) {
        urls.push_back(profile.url);
        tasks.push_back(_reconciler.reconcile(std::move(profile)));
    }

    auto reports = co_await gather(std::move(tasks), [&urls](std::size_t i, std::exception_ptr ep) {
        ServerReport report;
        report.server = urls[i];

        try {
            std::rethrow_exception(ep);
        }
        catch (const std::exception& ex) {
            report.errors.push_back({ ErrorKind::Transport, std::format("Error processing server: {}", ex.what()) });
        }
        catch (...) {
            report.errors.push_back({ ErrorKind::Transport, "Error processing server: unknown exception" });
        }

        MOVER_LOG_ERROR("{} {}", report.server, report.errors.back().message);
        return report;
    });

    CycleResult result;
    result.servers_processed = reports.size();

    for (auto& report: reports) {
        if (report.online) ++result.servers_online;
        result.relocated += report.relocated;
        result.skipped += report.skipped;

        for (auto& error: report.errors) result.errors.push_back({ report.server, std::move(error) });
    }

    co_return result;
}
