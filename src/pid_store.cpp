#include "pid_store.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif
#include "system_utils.hpp"

namespace fs = std::filesystem;

namespace svckit {

bool parse_pid(const std::string& text, long& pid) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    if (begin == end)
        return false;
    long long value = 0;
    for (size_t i = begin; i < end; ++i) {
        char c = text[i];
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + (c - '0');
        if (value > INT_MAX)
            return false;
    }
    if (value <= 0)
        return false;
    pid = static_cast<long>(value);
    return true;
}

fs::path default_pid_dir() {
    std::string env = procutil::env_or_empty("SVCKIT_PID_DIR");
    if (!env.empty())
        return procutil::absolute_path(env);
#ifdef _WIN32
    return fs::temp_directory_path() / "svckit_pids";
#else
    if (procutil::is_superuser())
        return "/var/run";
    std::string home = procutil::env_or_empty("HOME");
    if (home.empty())
        return fs::temp_directory_path() / ".svckit_pids";
    return fs::path(home) / ".svckit_pids";
#endif
}

PidFileStore::PidFileStore(fs::path path) : path_(std::move(path)) {}

PidFileStore PidFileStore::for_service(const fs::path& dir, const std::string& name) {
    return PidFileStore(dir / (name + ".pid"));
}

// The record is written beside its final name and renamed over it, so a
// reader sees either the previous record or the complete new one.
Status PidFileStore::write(long pid) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec)
            return Status::failure(ServiceError::IOError,
                                   "Unable to create PID directory `" +
                                       path_.parent_path().string() + "`: " + ec.message(),
                                   ec.value());
    }
    fs::path tmp = path_;
    tmp += ".tmp";
#ifndef _WIN32
    {
        procutil::UniqueFd fd(open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
        if (!fd)
            return os_failure(ServiceError::IOError,
                              "Unable to write PID file to `" + tmp.string() + "`", errno);
        char buf[32];
        int len = std::snprintf(buf, sizeof(buf), "%ld\n", pid);
        ssize_t w = ::write(fd.get(), buf, static_cast<size_t>(len));
        if (w != static_cast<ssize_t>(len)) {
            int err = w < 0 ? errno : EIO;
            fs::remove(tmp, ec);
            return os_failure(ServiceError::IOError,
                              "Short write to PID file `" + tmp.string() + "`", err);
        }
    }
#else
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open())
            return Status::failure(ServiceError::IOError,
                                   "Unable to write PID file to `" + tmp.string() + "`");
        out << pid << '\n';
        if (!out.flush()) {
            out.close();
            fs::remove(tmp, ec);
            return Status::failure(ServiceError::IOError,
                                   "Short write to PID file `" + tmp.string() + "`");
        }
    }
#endif
    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Status::failure(ServiceError::IOError,
                               "Unable to move PID file into `" + path_.string() +
                                   "`: " + ec.message(),
                               ec.value());
    }
    return Status::success();
}

Status PidFileStore::read(long& pid) const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        if (!exists())
            return Status::failure(ServiceError::NotRunning,
                                   "No PID file at `" + path_.string() + "`");
        return Status::failure(ServiceError::IOError,
                               "Unable to read PID file `" + path_.string() + "`");
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (!parse_pid(content.str(), pid))
        return Status::failure(ServiceError::CorruptState,
                               "PID file `" + path_.string() + "` does not hold a valid pid");
    return Status::success();
}

bool PidFileStore::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec) && !ec;
}

Status PidFileStore::remove() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        return Status::failure(ServiceError::IOError,
                               "Unable to remove PID file `" + path_.string() + "`: " + ec.message(),
                               ec.value());
    return Status::success();
}

std::optional<std::chrono::system_clock::time_point> PidFileStore::written_at() const {
    std::error_code ec;
    auto ftime = fs::last_write_time(path_, ec);
    if (ec)
        return std::nullopt;
    auto delta = ftime - fs::file_time_type::clock::now();
    return std::chrono::system_clock::now() +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(delta);
}

} // namespace svckit
