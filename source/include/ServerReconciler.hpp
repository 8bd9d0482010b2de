#pragma once

#include "Errors.hpp"
#include "FileRelocator.hpp"
#include "RemoteClient.hpp"
#include "ServerProfile.hpp"
#include "TorrentRecord.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <boost/asio.hpp>

struct TorrentOutcome {
    enum class Status { Skipped, Relocated, Failed };

    std::string name;
    Status status = Status::Skipped;

    // a relocated torrent can still carry an error when the remote delete failed
    std::vector<Error> errors;
};

struct ServerReport {
    std::string server;
    bool online = false;
    std::size_t relocated{};
    std::size_t skipped{};
    std::vector<Error> errors;
};

class ServerReconciler {
public:
    ServerReconciler(boost::asio::any_io_executor disk_exec, std::chrono::seconds request_timeout = RemoteClient::DEFAULT_TIMEOUT, SourceRemover remove_source = remove_source_tree);

    // never throws for a torrent or transport failure, they end up in the report
    [[nodiscard]] boost::asio::awaitable<ServerReport> reconcile(ServerProfile profile) const;

private:
    [[nodiscard]] boost::asio::awaitable<TorrentOutcome> process_torrent(RemoteClient client, TorrentRecord torrent) const;

    boost::asio::any_io_executor _disk_exec;
    std::chrono::seconds _request_timeout;
    SourceRemover _remove_source;
};
