#include "ServerReconciler.hpp"
#include "FileRelocator.hpp"
#include "Log.hpp"
#include "PathMapper.hpp"
#include "TaskGroup.hpp"

#include <exception>
#include <filesystem>
#include <format>
#include <optional>

namespace {

boost::asio::awaitable<std::expected<void, Error>> relocate_on_disk(std::filesystem::path source, std::filesystem::path destination, SourceRemover remove_source) {
    co_return relocate(source, destination, remove_source);
}

std::string describe(std::exception_ptr ep) {
    try {
        std::rethrow_exception(ep);
    }
    catch (const std::exception& ex) {
        return ex.what();
    }
    catch (...) {
        return "unknown exception";
    }
}

Error with_context(std::string_view torrent, const Error& error) {
    return { error.kind, std::format("{}: {}", torrent, error.message) };
}

}

ServerReconciler::ServerReconciler(boost::asio::any_io_executor disk_exec, std::chrono::seconds request_timeout, SourceRemover remove_source):
    _disk_exec(disk_exec),
    _request_timeout(request_timeout),
    _remove_source(std::move(remove_source))
    {}

boost::asio::awaitable<ServerReport> ServerReconciler::reconcile(ServerProfile profile) const {
    ServerReport report;
    report.server = profile.url;

    std::optional<RemoteClient> client;
    try {
        client.emplace(std::move(profile), _request_timeout);
    }
    catch (const std::exception& ex) {
        MOVER_LOG_ERROR("Skipping server {}: {}", report.server, ex.what());
        report.errors.push_back({ ErrorKind::Transport, ex.what() });
        co_return report;
    }

    auto online = co_await client->is_online();

    if (!online) {
        MOVER_LOG_WARN("Server {} is offline: {}", report.server, online.error().message);
        report.errors.push_back(online.error());
        co_return report;
    }

    if (!*online) {
        MOVER_LOG_WARN("Server {} rejected the version check, skipping this cycle", report.server);
        report.errors.push_back({ ErrorKind::Transport, std::format("Version check on {} was not successful", report.server) });
        co_return report;
    }

    report.online = true;
    MOVER_LOG_INFO("Server {} is online", report.server);

    auto torrents = co_await client->list_completed();

    if (!torrents) {
        MOVER_LOG_ERROR("Could not list completed torrents on {}: {}", report.server, torrents.error().message);
        report.errors.push_back(torrents.error());
        co_return report;
    }

    MOVER_LOG_DEBUG("Server {} reported {} completed torrents", report.server, torrents->size());

    std::vector<std::string> names;
    std::vector<boost::asio::awaitable<TorrentOutcome>> tasks;
    names.reserve(torrents->size());
    tasks.reserve(torrents->size());

    for (auto& torrent: *torrents) {
        names.push_back(torrent.name);
        tasks.push_back(process_torrent(*client, std::move(torrent)));
    }

    auto outcomes = co_await gather(std::move(tasks), [&names](std::size_t i, std::exception_ptr ep) {
        auto message = describe(ep);
        MOVER_LOG_ERROR("Error moving torrent {}: {}", names[i], message);

        TorrentOutcome outcome;
        outcome.name = names[i];
        outcome.status = TorrentOutcome::Status::Failed;
        outcome.errors.push_back({ ErrorKind::CopyFailed, std::format("{}: {}", outcome.name, message) });
        return outcome;
    });

    for (auto& outcome: outcomes) {
        if (outcome.status == TorrentOutcome::Status::Relocated) ++report.relocated;
        else if (outcome.status == TorrentOutcome::Status::Skipped) ++report.skipped;

        for (auto& error: outcome.errors) report.errors.push_back(std::move(error));
    }

    co_return report;
}

boost::asio::awaitable<TorrentOutcome> ServerReconciler::process_torrent(RemoteClient client, TorrentRecord torrent) const {
    TorrentOutcome outcome;
    outcome.name = torrent.name;

    const auto& profile = client.profile();

    auto destination = compute_destination(torrent.category, torrent.name, profile.categories);
    if (!destination) {
        MOVER_LOG_DEBUG("Leaving {} in place, no destination for category '{}'", torrent.name, torrent.category.value_or(""));
        co_return outcome;
    }

    auto source = compute_source(torrent.save_path, torrent.name, profile.root_path, profile.path_prefix);
    if (!source) {
        MOVER_LOG_ERROR("Cannot map {}: {}", torrent.name, source.error().message);
        outcome.status = TorrentOutcome::Status::Failed;
        outcome.errors.push_back(with_context(torrent.name, source.error()));
        co_return outcome;
    }

    auto moved = co_await boost::asio::co_spawn(_disk_exec, relocate_on_disk(*source, *destination, _remove_source), boost::asio::use_awaitable);

    if (!moved) {
        if (moved.error().kind == ErrorKind::PartialMove) {
            MOVER_LOG_WARN("{} is now in both {} and {}, remove the source manually. Torrent {} stays on the server.", torrent.name, source->string(), destination->string(), torrent.hash);
        }
        else {
            MOVER_LOG_ERROR("Error moving {} ({}): {}", torrent.name, to_string(moved.error().kind), moved.error().message);
        }

        outcome.status = TorrentOutcome::Status::Failed;
        outcome.errors.push_back(with_context(torrent.name, moved.error()));
        co_return outcome;
    }

    outcome.status = TorrentOutcome::Status::Relocated;
    MOVER_LOG_INFO("Moved {} -> {}", source->string(), destination->string());

    auto deleted = co_await client.delete_torrent(torrent.hash);

    // the files are already in place, a stale entry on the server is acceptable
    if (!deleted) {
        MOVER_LOG_ERROR("Moved {} but could not remove torrent {} from {}: {}", torrent.name, torrent.hash, profile.url, deleted.error().message);
        outcome.errors.push_back(with_context(torrent.name, deleted.error()));
    }
    else {
        MOVER_LOG_INFO("Removed torrent {} ({}) from {}", torrent.name, torrent.hash, profile.url);
    }

    co_return outcome;
}
