#include "logger.hpp"
#include <zlib.h>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

namespace fs = std::filesystem;

namespace svckit {

namespace {

constexpr size_t kBatchSize = 16;

struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string text;
    LogFields fields;
};

/**
 * Everything the logger owns. `sink`, `path` and `paused` are guarded by
 * `init_mtx`; `queue` by `queue_mtx`. `sink` is also touched by the writer
 * thread, which only runs while `init_mtx` holders keep away from it.
 */
struct LoggerState {
    std::ofstream sink;
    std::string path;
    bool paused = false;

    std::atomic<LogLevel> min_level{LogLevel::INFO};
    std::atomic<size_t> rotate_at{0};
    std::atomic<size_t> keep_files{1};
    std::atomic<bool> json{false};
    std::atomic<bool> compress{false};
    std::atomic<bool> console{false};
    std::atomic<bool> syslog{false};

    std::deque<std::unique_ptr<LogMessage>> queue;
    std::mutex queue_mtx;
    std::condition_variable queue_cv;
    std::atomic<bool> running{false};
    std::atomic<size_t> pending{0};
    std::thread writer;

    std::mutex init_mtx;
    std::mutex console_mtx;

    ~LoggerState() {
        {
            std::lock_guard<std::mutex> lk(queue_mtx);
            running.store(false);
        }
        queue_cv.notify_all();
        if (writer.joinable())
            writer.join();
    }
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

std::string render(const LogMessage& m, bool json) {
    if (json) {
        nlohmann::json entry = {
            {"timestamp", m.timestamp}, {"level", level_label(m.level)}, {"msg", m.text}};
        for (const auto& [key, value] : m.fields)
            entry[key] = value;
        return entry.dump();
    }
    std::string line = "[" + m.timestamp + "] [" + level_label(m.level) + "] " + m.text;
    for (const auto& [key, value] : m.fields)
        line += " " + key + "=" + value;
    return line;
}

bool compress_into(const fs::path& src, const fs::path& dst) {
    std::ifstream in(src, std::ios::binary);
    if (!in)
        return false;
    gzFile gz = gzopen(dst.string().c_str(), "wb");
    if (gz == nullptr)
        return false;
    std::vector<char> chunk(16 * 1024);
    bool ok = true;
    while (ok && in.read(chunk.data(), static_cast<std::streamsize>(chunk.size())).gcount() > 0)
        ok = gzwrite(gz, chunk.data(), static_cast<unsigned int>(in.gcount())) > 0;
    return gzclose(gz) == Z_OK && ok;
}

fs::path rotated_name(const std::string& base, size_t index, bool gz) {
    return fs::path(base + "." + std::to_string(index) + (gz ? ".gz" : ""));
}

// <log>.N is dropped, every older slot moves up one and the live file
// becomes <log>.1, gzipped when compression is on.
void rotate(LoggerState& s) {
    std::error_code ec;
    const size_t keep = s.keep_files.load();
    const bool gz = s.compress.load();
    s.sink.close();
    if (keep > 0) {
        fs::remove(rotated_name(s.path, keep, gz), ec);
        for (size_t i = keep - 1; i >= 1; --i)
            fs::rename(rotated_name(s.path, i, gz), rotated_name(s.path, i + 1, gz), ec);
        fs::path first = rotated_name(s.path, 1, false);
        fs::rename(s.path, first, ec);
        if (gz && compress_into(first, rotated_name(s.path, 1, true)))
            fs::remove(first, ec);
    }
    s.sink.open(s.path, std::ios::trunc);
}

#ifdef __linux__
int syslog_priority(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return LOG_DEBUG;
    case LogLevel::INFO:
        return LOG_INFO;
    case LogLevel::WARNING:
        return LOG_WARNING;
    case LogLevel::ERR:
        return LOG_ERR;
    }
    return LOG_INFO;
}
#endif

void write_entry(LoggerState& s, const LogMessage& m) {
    if (!s.sink.is_open())
        return;
    const std::string line = render(m, s.json.load());
    s.sink << line << '\n';
    if (const size_t limit = s.rotate_at.load(); limit > 0) {
        s.sink.flush();
        std::error_code ec;
        auto size = fs::file_size(s.path, ec);
        if (!ec && size > limit)
            rotate(s);
    }
#ifdef __linux__
    if (s.syslog.load())
        ::syslog(syslog_priority(m.level), "%s", line.c_str());
#endif
}

void writer_loop(LoggerState& s) {
    std::vector<std::unique_ptr<LogMessage>> batch;
    batch.reserve(kBatchSize);
    for (;;) {
        {
            std::unique_lock<std::mutex> lk(s.queue_mtx);
            s.queue_cv.wait(lk, [&s] { return !s.queue.empty() || !s.running.load(); });
            if (s.queue.empty())
                break;
            while (!s.queue.empty() && batch.size() < kBatchSize) {
                batch.push_back(std::move(s.queue.front()));
                s.queue.pop_front();
            }
        }
        for (const auto& m : batch)
            write_entry(s, *m);
        s.sink.flush();
        s.pending.fetch_sub(batch.size());
        batch.clear();
    }
    s.sink.flush();
}

void start_writer(LoggerState& s) {
    s.running.store(true);
    s.writer = std::thread(writer_loop, std::ref(s));
}

// Drains the queue before the thread exits.
void stop_writer(LoggerState& s) {
    {
        std::lock_guard<std::mutex> qlk(s.queue_mtx);
        s.running.store(false);
    }
    s.queue_cv.notify_all();
    if (s.writer.joinable())
        s.writer.join();
}

} // namespace

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lk(s.init_mtx);
    stop_writer(s);
    s.paused = false;
    s.sink.close();
    s.sink.clear();
    s.rotate_at.store(max_size);
    s.keep_files.store(max_files);
    s.min_level.store(level);

    s.sink.open(path, std::ios::app);
    if (s.sink.is_open()) {
        s.path = path;
    } else {
        std::cerr << "Failed to open log file: " << path << std::endl;
        if (!s.path.empty())
            s.sink.open(s.path, std::ios::app);
    }
    start_writer(s);
}

#ifdef __linux__
void init_syslog(int facility) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lk(s.init_mtx);
    s.syslog.store(true);
    openlog("svckit", LOG_PID | LOG_CONS, facility == 0 ? LOG_DAEMON : facility);
}
#else
void init_syslog(int) {}
#endif

void set_log_level(LogLevel level) { state().min_level.store(level); }

LogLevel parse_log_level(const std::string& name) {
    std::string v;
    for (char c : name)
        v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "debug")
        return LogLevel::DEBUG;
    if (v == "info")
        return LogLevel::INFO;
    if (v == "warning" || v == "warn")
        return LogLevel::WARNING;
    if (v == "error" || v == "err")
        return LogLevel::ERR;
    throw std::runtime_error("Invalid log level: " + name);
}

void set_json_logging(bool enable) { state().json.store(enable); }

void set_log_compression(bool enable) { state().compress.store(enable); }

void set_console_logging(bool enable) { state().console.store(enable); }

bool logger_initialized() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lk(s.init_mtx);
    return s.sink.is_open();
}

void log_event(LogLevel level, const std::string& message, const LogFields& fields) {
    LoggerState& s = state();
    if (level < s.min_level.load())
        return;
    auto entry = std::make_unique<LogMessage>(LogMessage{level, timestamp(), message, fields});
    if (s.console.load()) {
        std::lock_guard<std::mutex> lk(s.console_mtx);
        std::cerr << render(*entry, false) << std::endl;
    }
    {
        std::lock_guard<std::mutex> lk(s.queue_mtx);
        if (!s.running.load() && !s.paused)
            return;
        s.queue.push_back(std::move(entry));
        s.pending.fetch_add(1);
    }
    s.queue_cv.notify_one();
}

void log_debug(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::ERR, msg, fields);
}

void flush_logger() {
    LoggerState& s = state();
    while (s.pending.load() > 0 && s.running.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
}

void pause_logger() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lk(s.init_mtx);
    if (!s.running.load())
        return;
    stop_writer(s);
    std::lock_guard<std::mutex> qlk(s.queue_mtx);
    s.paused = true;
}

void resume_logger() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lk(s.init_mtx);
    if (!s.paused)
        return;
    {
        std::lock_guard<std::mutex> qlk(s.queue_mtx);
        s.paused = false;
    }
    start_writer(s);
}

void shutdown_logger() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lk(s.init_mtx);
    stop_writer(s);
    s.paused = false;
    s.sink.close();
#ifdef __linux__
    if (s.syslog.exchange(false))
        closelog();
#endif
    std::lock_guard<std::mutex> qlk(s.queue_mtx);
    s.queue.clear();
    s.pending.store(0);
}

} // namespace svckit
