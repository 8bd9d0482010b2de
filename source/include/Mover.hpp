#pragma once

#include "SchedulerLoop.hpp"
#include "ServerProfile.hpp"

#include <boost/asio.hpp>

class Mover {
public:
    explicit Mover(AppConfig config);

    // blocks until SIGINT/SIGTERM and the in-flight cycle is done
    void run();

private:
    static constexpr std::size_t DISK_THREADS = 4;

    // network and orchestration run on _ioc (single thread), file copies on the disk pool
    boost::asio::io_context _ioc;
    boost::asio::thread_pool _disk_pool{ DISK_THREADS };

    AppConfig _config;
    SchedulerLoop _scheduler;
};
