#pragma once

#include "TorrentRecord.hpp"

#include <atomic>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <boost/json.hpp>

namespace test {

class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{ 0 };
        std::random_device rd;
        _path = std::filesystem::temp_directory_path() / ("torrent-mover-test-" + std::to_string(rd()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return _path; }
    std::filesystem::path operator/(std::string_view child) const { return _path / child; }

private:
    std::filesystem::path _path;
};

inline void write_file(const std::filesystem::path& path, std::string_view contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// body of /api/v2/torrents/info, with a few of the extra fields qBittorrent sends
inline std::string torrent_list(const std::vector<TorrentRecord>& torrents) {
    boost::json::array arr;

    for (const auto& t: torrents) {
        boost::json::object obj;
        obj["save_path"] = t.save_path;
        obj["name"] = t.name;
        obj["hash"] = t.hash;
        obj["progress"] = 1.0;
        obj["state"] = "uploading";
        if (t.category) obj["category"] = *t.category;
        else obj["category"] = "";
        arr.push_back(std::move(obj));
    }

    return boost::json::serialize(arr);
}

template <typename T>
T run_until_complete(boost::asio::io_context& ioc, boost::asio::awaitable<T> task) {
    std::optional<T> result;
    std::exception_ptr error;

    boost::asio::co_spawn(ioc, std::move(task), [&](std::exception_ptr ep, T value) {
        error = ep;
        if (!ep) result.emplace(std::move(value));
        ioc.stop();
    });

    ioc.restart();
    ioc.run();

    if (error) std::rethrow_exception(error);
    return std::move(*result);
}

inline void run_until_complete(boost::asio::io_context& ioc, boost::asio::awaitable<void> task) {
    std::exception_ptr error;

    boost::asio::co_spawn(ioc, std::move(task), [&](std::exception_ptr ep) {
        error = ep;
        ioc.stop();
    });

    ioc.restart();
    ioc.run();

    if (error) std::rethrow_exception(error);
}

}
