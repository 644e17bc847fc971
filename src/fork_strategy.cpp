#include "fork_strategy.hpp"
#include <cerrno>
#include <cstdlib>
#include <exception>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#ifndef _WIN32
#include <signal.h>
#include <unistd.h>
#endif
#include "logger.hpp"
#include "stop_signals.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

namespace svckit {

StaleRecordPolicy parse_stale_policy(const std::string& text) {
    if (text == "keep")
        return StaleRecordPolicy::Keep;
    if (text == "clear")
        return StaleRecordPolicy::Clear;
    if (text == "auto")
        return StaleRecordPolicy::Auto;
    throw std::invalid_argument("Invalid stale-record policy: " + text);
}

const char* to_string(StaleRecordPolicy policy) {
    switch (policy) {
    case StaleRecordPolicy::Keep:
        return "keep";
    case StaleRecordPolicy::Clear:
        return "clear";
    case StaleRecordPolicy::Auto:
        return "auto";
    }
    return "auto";
}

DaemonExitGuard::DaemonExitGuard(LivenessStore& store, const ServiceDescriptor& descriptor,
                                 const RestartHook& restart)
    : store_(store), descriptor_(descriptor), restart_(restart) {}

DaemonExitGuard::~DaemonExitGuard() {
    if (!finished_)
        finish();
}

DaemonExit DaemonExitGuard::finish() {
    if (finished_)
        return outcome_;
    finished_ = true;
    const std::string& name = descriptor_.name();

    long recorded = 0;
    Status st = store_.read(recorded);
    // A record that is gone, or that now belongs to another process, was
    // taken away by a stop request.
    if (st.code() == ServiceError::NotRunning || (st && recorded != procutil::current_pid())) {
        outcome_ = DaemonExit::Stopped;
        log_info("Service stopped", {{"service", name}});
        return outcome_;
    }

    if (returned_ && signal_ == 0) {
        outcome_ = DaemonExit::Completed;
        log_info("Service completed", {{"service", name}});
    } else {
        outcome_ = DaemonExit::Abnormal;
        LogFields fields{{"service", name}};
        if (signal_ != 0)
            fields["signal"] = std::to_string(signal_);
        log_error("Service exited abnormally", fields);
    }
    if (Status rm = store_.remove(); !rm)
        log_error("Unable to remove PID record", {{"service", name}, {"error", rm.message()}});

    if (outcome_ == DaemonExit::Abnormal && descriptor_.auto_start()) {
        if (restart_) {
            log_info("Scheduling restart", {{"service", name}});
            restart_(descriptor_);
        } else {
            log_warning("Auto-start service has no restart hook", {{"service", name}});
        }
    }
    return outcome_;
}

#ifndef _WIN32
RestartHook relaunch_hook(LaunchCommand command, std::chrono::milliseconds delay) {
    return [command = std::move(command), delay](const ServiceDescriptor& descriptor) {
        std::vector<std::string> words;
        if (!command.interpreter.empty())
            words.push_back(command.interpreter);
        words.push_back(command.program);
        words.push_back("start");
        words.insert(words.end(), command.args.begin(), command.args.end());
        std::vector<char*> argv;
        for (auto& w : words)
            argv.push_back(w.data());
        argv.push_back(nullptr);

        flush_logger();
        pid_t pid = fork();
        if (pid < 0) {
            log_error("Unable to fork restart helper",
                      {{"service", descriptor.name()}, {"errno", std::to_string(errno)}});
            return;
        }
        if (pid > 0) {
            log_debug("Restart helper forked", {{"pid", std::to_string(pid)}});
            return;
        }
        setsid();
        std::this_thread::sleep_for(delay);
        execv(argv[0], argv.data());
        _exit(127);
    };
}
#else
RestartHook relaunch_hook(LaunchCommand command, std::chrono::milliseconds delay) {
    (void)command;
    (void)delay;
    return [](const ServiceDescriptor& descriptor) {
        log_warning("Self-restart is left to the service manager", {{"service", descriptor.name()}});
    };
}
#endif

namespace {

// The daemon changes to `/` before it writes its record, so both
// directories are pinned to absolute paths while the launcher's cwd holds.
ForkOptions with_absolute_dirs(ForkOptions options) {
    options.pid_dir = procutil::absolute_path(options.pid_dir.empty() ? default_pid_dir()
                                                                      : options.pid_dir);
    options.script_dir = procutil::absolute_path(
        options.script_dir.empty() ? default_script_dir() : options.script_dir);
    return options;
}

} // namespace

ForkStrategy::ForkStrategy(ForkOptions options)
    : options_(with_absolute_dirs(std::move(options))),
      scripts_(options_.script_dir, options_.require_superuser) {
    if (!options_.relaunch.program.empty())
        restart_hook_ = relaunch_hook(options_.relaunch, options_.restart_delay);
}

PidFileStore ForkStrategy::pid_store(const ServiceDescriptor& descriptor) const {
    return PidFileStore::for_service(options_.pid_dir, descriptor.name());
}

bool ForkStrategy::is_installed(const ServiceDescriptor& descriptor) const {
    return scripts_.exists(descriptor.name());
}

Status ForkStrategy::install(const ServiceDescriptor& descriptor, const LaunchCommand& launch) {
    ControlScript script;
    return scripts_.write(descriptor, launch.interpreter, launch.program, launch.args, script);
}

Status ForkStrategy::uninstall(const ServiceDescriptor& descriptor) {
    return scripts_.remove(descriptor.name());
}

bool ForkStrategy::is_running(const ServiceDescriptor& descriptor) const {
    return pid_store(descriptor).exists();
}

Status ForkStrategy::resolve_existing(const ServiceDescriptor& descriptor) {
    PidFileStore store = pid_store(descriptor);
    long pid = 0;
    Status st = store.read(pid);
    if (st.code() == ServiceError::NotRunning)
        return Status::success();
    if (!st && st.code() != ServiceError::CorruptState)
        return st;
    if (st && procutil::process_alive(pid))
        return Status::failure(ServiceError::AlreadyRunning,
                               "Service '" + descriptor.name() + "' is already running (pid " +
                                   std::to_string(pid) + ")");

    const std::string what = st ? "stale PID record for pid " + std::to_string(pid)
                                : std::string("corrupt PID record");
    const bool clear = options_.stale_policy == StaleRecordPolicy::Clear ||
                       (options_.stale_policy == StaleRecordPolicy::Auto && descriptor.auto_start());
    if (!clear)
        return Status::failure(ServiceError::AlreadyRunning,
                               "Found a " + what + " at `" + store.location() +
                                   "`, remove it or start with --stale-record clear");
    if (Status rm = store.remove(); !rm)
        return rm;
    log_warning("Cleared " + what, {{"service", descriptor.name()}, {"record", store.location()}});
    return Status::success();
}

Status ForkStrategy::detach_and_run(const ServiceDescriptor& descriptor, LifecycleHooks& hooks) {
    PidFileStore store = pid_store(descriptor);
    Daemonizer daemonizer(store, options_.daemonize);
    DetachResult result = daemonizer.detach();
    if (!result.status)
        return result.status;
    if (result.role == DetachRole::Daemon)
        run_daemon(descriptor, hooks, store);
    log_info("Service launched", {{"service", descriptor.name()},
                                  {"pid", std::to_string(result.daemon_pid)}});
    return Status::success();
}

void ForkStrategy::run_daemon(const ServiceDescriptor& descriptor, LifecycleHooks& hooks,
                              PidFileStore& store) {
    int code = 0;
    {
        auto token = std::make_shared<CancellationToken>();
        StopSignalScope signals(token);
        DaemonExitGuard guard(store, descriptor, restart_hook_);
        ServiceHandle handle(token);
        log_info("Service running", {{"service", descriptor.name()},
                                     {"pid", std::to_string(procutil::current_pid())}});
        try {
            hooks.on_started(descriptor);
            descriptor.callback()(handle);
            guard.mark_returned();
        } catch (const std::exception& e) {
            log_error("Service callback failed",
                      {{"service", descriptor.name()}, {"error", e.what()}});
        }
        if (int sig = StopSignalScope::last_signal(); sig != 0)
            guard.mark_signalled(sig);
        try {
            hooks.on_stopped(descriptor);
        } catch (const std::exception& e) {
            log_error("on_stopped hook failed",
                      {{"service", descriptor.name()}, {"error", e.what()}});
        }
        code = guard.finish() == DaemonExit::Abnormal ? 1 : 0;
    }
    shutdown_logger();
    _exit(code);
}

Status ForkStrategy::request_stop(const ServiceDescriptor& descriptor) {
    PidFileStore store = pid_store(descriptor);
    long pid = 0;
    Status st = store.read(pid);
    if (!st) {
        if (st.code() == ServiceError::CorruptState) {
            if (Status rm = store.remove(); !rm)
                return rm;
            return Status::failure(ServiceError::CorruptState,
                                   st.message() + ", the record was removed");
        }
        return st;
    }
    // The record goes first: the daemon reads its absence as a requested stop.
    if (Status rm = store.remove(); !rm)
        return rm;
    TerminationStrategy terminator(options_.termination);
    Status result = terminator.terminate(pid);
    if (!result)
        log_error("Stop failed", {{"service", descriptor.name()},
                                  {"pid", std::to_string(pid)},
                                  {"error", result.describe()}});
    return result;
}

ServiceState ForkStrategy::probe(const ServiceDescriptor& descriptor) const {
    ServiceState state;
    state.installed = is_installed(descriptor);
    PidFileStore store = pid_store(descriptor);
    state.running = store.exists();
    if (!state.running)
        return state;
    long pid = 0;
    if (store.read(pid)) {
        state.pid = pid;
        state.stale = !procutil::process_alive(pid);
    } else {
        state.stale = true;
    }
    state.since = store.written_at();
    return state;
}

} // namespace svckit
