#include "termination.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <map>
#include <string>
#include <thread>
#ifdef _WIN32
#include <windows.h>
#else
#include <signal.h>
#include <sys/types.h>
#endif
#include "logger.hpp"
#include "system_utils.hpp"

namespace svckit {

TerminationPolicy::TerminationPolicy() : signal(SIGTERM) {}

int parse_signal(const std::string& text) {
    if (text.empty())
        return -1;
    if (std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        if (text.size() > 2)
            return -1;
        int n = std::stoi(text);
        return (n > 0 && n < 65) ? n : -1;
    }
    std::string name;
    for (char c : text)
        name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (name.rfind("SIG", 0) == 0)
        name = name.substr(3);
    static const std::map<std::string, int> names = {
        {"TERM", SIGTERM},
        {"INT", SIGINT},
#ifndef _WIN32
        {"HUP", SIGHUP},
        {"QUIT", SIGQUIT},
        {"KILL", SIGKILL},
        {"USR1", SIGUSR1},
        {"USR2", SIGUSR2},
#endif
    };
    auto it = names.find(name);
    return it == names.end() ? -1 : it->second;
}

TerminationStrategy::TerminationStrategy(TerminationPolicy policy) : policy_(policy) {
    if (policy_.max_attempts < 1)
        policy_.max_attempts = 1;
}

#ifndef _WIN32
Status TerminationStrategy::terminate(long pid) {
    attempts_ = 0;
    if (pid <= 0)
        return Status::failure(ServiceError::CorruptState,
                               "Refusing to signal pid " + std::to_string(pid));
    const pid_t target = static_cast<pid_t>(pid);
    while (attempts_ < policy_.max_attempts) {
        ++attempts_;
        if (kill(target, policy_.signal) != 0) {
            if (errno == ESRCH) {
                log_debug("Process already gone", {{"pid", std::to_string(pid)}});
                return Status::success();
            }
            return os_failure(ServiceError::SignalDeliveryFailure,
                              "Unable to kill the process " + std::to_string(pid), errno);
        }
        std::this_thread::sleep_for(policy_.poll_interval);
        if (!procutil::process_alive(pid)) {
            log_info("Process terminated", {{"pid", std::to_string(pid)},
                                            {"attempts", std::to_string(attempts_)}});
            return Status::success();
        }
    }
    if (policy_.force_kill) {
        ++attempts_;
        log_warning("Process ignored termination requests, sending SIGKILL",
                    {{"pid", std::to_string(pid)}});
        if (kill(target, SIGKILL) != 0) {
            if (errno == ESRCH)
                return Status::success();
            return os_failure(ServiceError::SignalDeliveryFailure,
                              "Unable to kill the process " + std::to_string(pid), errno);
        }
        std::this_thread::sleep_for(policy_.poll_interval);
        if (!procutil::process_alive(pid))
            return Status::success();
    }
    return Status::failure(ServiceError::TerminationTimeout,
                           "Process " + std::to_string(pid) + " still alive after " +
                               std::to_string(attempts_) + " attempts");
}
#else
Status TerminationStrategy::terminate(long pid) {
    attempts_ = 0;
    if (pid <= 0)
        return Status::failure(ServiceError::CorruptState,
                               "Refusing to signal pid " + std::to_string(pid));
    while (attempts_ < policy_.max_attempts) {
        ++attempts_;
        procutil::UniqueHandle h(OpenProcess(PROCESS_TERMINATE | SYNCHRONIZE, FALSE,
                                             static_cast<DWORD>(pid)));
        if (!h) {
            if (GetLastError() == ERROR_INVALID_PARAMETER)
                return Status::success();
            return Status::failure(ServiceError::SignalDeliveryFailure,
                                   "Unable to open process " + std::to_string(pid),
                                   static_cast<int>(GetLastError()));
        }
        if (!TerminateProcess(h.get(), 1))
            return Status::failure(ServiceError::SignalDeliveryFailure,
                                   "Unable to kill the process " + std::to_string(pid),
                                   static_cast<int>(GetLastError()));
        WaitForSingleObject(h.get(), static_cast<DWORD>(policy_.poll_interval.count()));
        if (!procutil::process_alive(pid))
            return Status::success();
    }
    return Status::failure(ServiceError::TerminationTimeout,
                           "Process " + std::to_string(pid) + " still alive after " +
                               std::to_string(attempts_) + " attempts");
}
#endif

} // namespace svckit
