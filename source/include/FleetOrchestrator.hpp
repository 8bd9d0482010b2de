#pragma once

#include "Errors.hpp"
#include "ServerProfile.hpp"
#include "ServerReconciler.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <boost/asio.hpp>

struct ServerError {
    std::string server;
    Error error;
};

struct CycleResult {
    std::size_t servers_processed{};
    std::size_t servers_online{};
    std::size_t relocated{};
    std::size_t skipped{};
    std::vector<ServerError> errors;
};

class FleetOrchestrator {
public:
    explicit FleetOrchestrator(ServerReconciler reconciler): _reconciler(std::move(reconciler)) {}

    // all servers run concurrently, the cycle itself never fails
    [[nodiscard]] boost::asio::awaitable<CycleResult> run_cycle(std::vector<ServerProfile> profiles) const;

private:
    ServerReconciler _reconciler;
};
