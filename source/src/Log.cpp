#include "Log.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace logging {

namespace {

struct FileSink {
    std::filesystem::path path;
    std::ofstream out;
    std::uint64_t max_size{};
    std::uint64_t size{};
};

std::mutex sink_mutex;
std::optional<FileSink> file_sink;
std::atomic<Level> min_level{ Level::Info };

constexpr std::string_view level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    char buffer[32]{};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

// keeps exactly one archive: <file>.1
void rotate(FileSink& sink) {
    sink.out.close();

    auto archive = sink.path;
    archive += ".1";

    std::error_code ec;
    std::filesystem::remove(archive, ec);
    std::filesystem::rename(sink.path, archive, ec);

    if (ec) {
        std::fprintf(stderr, "log rotation failed for %s: %s\n", sink.path.string().c_str(), ec.message().c_str());
        sink.out.open(sink.path, std::ios::out | std::ios::app);
    }
    else {
        sink.out.open(sink.path, std::ios::out | std::ios::trunc);
    }

    sink.size = 0;
}

}

std::uint64_t parse_size(std::string_view size) {
    if (size.empty()) throw std::invalid_argument("empty log size");

    std::uint64_t multiplier = 1;
    switch (size.back()) {
        case 'K': multiplier = 1024ULL; break;
        case 'M': multiplier = 1024ULL * 1024; break;
        case 'G': multiplier = 1024ULL * 1024 * 1024; break;
        default: break;
    }
    if (multiplier != 1) size.remove_suffix(1);

    std::uint64_t number{};
    auto [ptr, ec] = std::from_chars(size.data(), size.data() + size.size(), number);

    if (ec != std::errc{} || ptr != size.data() + size.size() || size.empty()) {
        throw std::invalid_argument(std::format("invalid log size: '{}'", size));
    }

    return number * multiplier;
}

void init_file_sink(const std::filesystem::path& file, std::uint64_t max_size) {
    std::scoped_lock lock(sink_mutex);

    FileSink sink;
    sink.path = file;
    sink.max_size = max_size;

    if (file.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file.parent_path(), ec);
    }

    sink.out.open(file, std::ios::out | std::ios::app);
    if (!sink.out.is_open()) throw std::runtime_error(std::format("could not open log file: {}", file.string()));

    std::error_code ec;
    auto existing = std::filesystem::file_size(file, ec);
    sink.size = ec ? 0 : existing;

    file_sink = std::move(sink);
}

void close_file_sink() {
    std::scoped_lock lock(sink_mutex);
    file_sink.reset();
}

void set_level(Level level) {
    min_level.store(level, std::memory_order_relaxed);
}

bool enabled(Level level) {
    return level >= min_level.load(std::memory_order_relaxed);
}

void write(Level level, std::string_view message) {
    auto line = std::format("{} {} - {}\n", timestamp(), level_name(level), message);

    std::scoped_lock lock(sink_mutex);

    std::fputs(line.c_str(), stderr);

    if (!file_sink || !file_sink->out.is_open()) return;

    if (file_sink->max_size > 0 && file_sink->size > 0 && file_sink->size + line.size() > file_sink->max_size) {
        rotate(*file_sink);
    }

    file_sink->out << line;
    file_sink->out.flush();
    file_sink->size += line.size();
}

}
