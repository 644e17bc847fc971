#include "daemonizer.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>
#include <utility>
#ifndef _WIN32
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif
#include "logger.hpp"
#include "system_utils.hpp"

namespace svckit {

Daemonizer::Daemonizer(LivenessStore& store, DaemonizeOptions options)
    : store_(store), options_(std::move(options)) {}

#ifndef _WIN32
namespace {

enum class Step : std::int32_t { Ready = 0, Setsid, SecondFork, PidRecord, Redirect };

struct Readiness {
    std::int32_t step;
    std::int32_t error;
    std::int64_t pid;
};

bool write_all(int fd, const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    while (len > 0) {
        ssize_t n = ::write(fd, p, len);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        p += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

size_t read_all(int fd, void* data, size_t len) {
    char* p = static_cast<char*>(data);
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::read(fd, p + got, len - got);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        if (n == 0)
            break;
        got += static_cast<size_t>(n);
    }
    return got;
}

[[noreturn]] void report_and_exit(int fd, Step step, int err) {
    Readiness msg{static_cast<std::int32_t>(step), err, 0};
    write_all(fd, &msg, sizeof(msg));
    _exit(1);
}

bool make_pipe(int fds[2]) {
    if (pipe(fds) != 0)
        return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

bool redirect_standard_streams(const std::filesystem::path& null_device) {
    procutil::UniqueFd null_fd(open(null_device.c_str(), O_RDWR));
    if (!null_fd)
        return false;
    for (int target : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        if (dup2(null_fd.get(), target) < 0)
            return false;
    }
    if (null_fd.get() <= STDERR_FILENO)
        null_fd.release();
    return true;
}

Status describe_failure(const Readiness& msg) {
    switch (static_cast<Step>(msg.step)) {
    case Step::Setsid:
        return os_failure(ServiceError::ForkFailure, "Unable to create a new session", msg.error);
    case Step::SecondFork:
        return os_failure(ServiceError::ForkFailure, "Unable to fork parent process (2)", msg.error);
    case Step::PidRecord:
        return os_failure(ServiceError::IOError, "Unable to write the PID record", msg.error);
    case Step::Redirect:
        return os_failure(ServiceError::IOError, "Unable to redirect standard streams", msg.error);
    case Step::Ready:
        break;
    }
    return Status::failure(ServiceError::ForkFailure, "Daemon reported an unknown state");
}

} // namespace

DetachResult Daemonizer::detach() {
    DetachResult result;
    int fds[2];
    if (!make_pipe(fds)) {
        result.status = os_failure(ServiceError::ForkFailure, "Unable to create readiness pipe", errno);
        return result;
    }
    procutil::UniqueFd read_end(fds[0]);
    procutil::UniqueFd write_end(fds[1]);

    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
    pause_logger();

    pid_t first = fork();
    if (first < 0) {
        int err = errno;
        resume_logger();
        result.status = os_failure(ServiceError::ForkFailure, "Unable to fork parent process (1)", err);
        return result;
    }

    if (first > 0) {
        // Launcher: wait for the daemon to report, then reap the first child.
        resume_logger();
        write_end.reset();
        Readiness msg{};
        size_t got = read_all(read_end.get(), &msg, sizeof(msg));
        int status = 0;
        while (waitpid(first, &status, 0) < 0 && errno == EINTR) {
        }
        if (got != sizeof(msg)) {
            result.status = Status::failure(ServiceError::ForkFailure,
                                            "Daemon exited before reporting readiness");
            return result;
        }
        if (static_cast<Step>(msg.step) != Step::Ready) {
            result.status = describe_failure(msg);
            return result;
        }
        result.daemon_pid = static_cast<long>(msg.pid);
        log_info("Daemon detached", {{"pid", std::to_string(result.daemon_pid)},
                                     {"record", store_.location()}});
        return result;
    }

    // First child: become session leader, drop inherited umask.
    read_end.reset();
    if (setsid() < 0)
        report_and_exit(write_end.get(), Step::Setsid, errno);
    umask(0);
    signal(SIGHUP, SIG_IGN);

    pid_t second = fork();
    if (second < 0)
        report_and_exit(write_end.get(), Step::SecondFork, errno);
    if (second > 0)
        _exit(0);

    // Final daemon process.
    if (options_.change_directory && chdir("/") != 0)
        log_warning("Daemon keeps the launcher's working directory", {{"errno", std::to_string(errno)}});
    if (Status st = store_.write(procutil::current_pid()); !st)
        report_and_exit(write_end.get(), Step::PidRecord, st.os_error());
    if (!redirect_standard_streams(options_.null_device)) {
        int err = errno;
        if (Status rm = store_.remove(); !rm)
            log_error("Stale PID record left behind", {{"error", rm.message()}});
        report_and_exit(write_end.get(), Step::Redirect, err);
    }
    resume_logger();

    Readiness ok{static_cast<std::int32_t>(Step::Ready), 0,
                 static_cast<std::int64_t>(procutil::current_pid())};
    write_all(write_end.get(), &ok, sizeof(ok));
    write_end.reset();

    result.role = DetachRole::Daemon;
    result.daemon_pid = procutil::current_pid();
    return result;
}
#else
DetachResult Daemonizer::detach() {
    DetachResult result;
    result.status = Status::failure(ServiceError::ForkFailure,
                                    "Process detachment is not available on this host");
    return result;
}
#endif

} // namespace svckit
