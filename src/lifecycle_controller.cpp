#include "lifecycle_controller.hpp"
#include <utility>
#include "logger.hpp"
#include "stop_signals.hpp"
#include "time_utils.hpp"

namespace svckit {

LifecycleController::LifecycleController(ServiceDescriptor descriptor,
                                         std::unique_ptr<ExecutionStrategy> strategy,
                                         std::ostream& out)
    : descriptor_(std::move(descriptor)), strategy_(std::move(strategy)), hooks_(&default_hooks_),
      out_(out) {}

LifecycleController::LifecycleController(ServiceDescriptor descriptor,
                                         std::unique_ptr<ExecutionStrategy> strategy,
                                         LifecycleHooks& hooks, std::ostream& out)
    : descriptor_(std::move(descriptor)), strategy_(std::move(strategy)), hooks_(&hooks),
      out_(out) {}

void LifecycleController::note(const std::string& line) const {
    out_ << "* " << line << std::endl;
    log_info(line, {{"service", descriptor_.name()}});
}

Status LifecycleController::fail(const Status& st) const {
    out_ << "* " << st.message() << std::endl;
    log_error(st.message(), {{"service", descriptor_.name()}, {"error", to_string(st.code())}});
    return st;
}

bool LifecycleController::is_installed() const { return strategy_->is_installed(descriptor_); }

bool LifecycleController::is_running() const { return strategy_->is_running(descriptor_); }

Status LifecycleController::install(const LaunchCommand& launch) {
    if (is_installed())
        return fail(Status::failure(ServiceError::AlreadyInstalled,
                                    "Service '" + descriptor_.name() + "' is already installed"));
    note("Installing " + descriptor_.name());
    if (Status st = strategy_->install(descriptor_, launch); !st)
        return fail(st);
    hooks_->on_installed(descriptor_);
    note("Installed");
    return Status::success();
}

Status LifecycleController::uninstall() {
    if (!is_installed())
        return fail(Status::failure(ServiceError::NotInstalled,
                                    "Service '" + descriptor_.name() + "' is not installed"));
    note("Uninstalling " + descriptor_.name());
    if (is_running()) {
        if (Status st = stop(); !st)
            return st;
    }
    if (Status st = strategy_->uninstall(descriptor_); !st)
        return fail(st);
    hooks_->on_uninstalled(descriptor_);
    note("Uninstalled");
    return Status::success();
}

Status LifecycleController::start() {
    if (!is_installed())
        return fail(Status::failure(ServiceError::NotInstalled,
                                    "Service '" + descriptor_.name() + "' is not installed"));
    if (is_running()) {
        if (Status st = strategy_->resolve_existing(descriptor_); !st)
            return fail(st);
    }
    note("Starting " + descriptor_.name());
    if (Status st = strategy_->detach_and_run(descriptor_, *hooks_); !st)
        return fail(st);
    note("Started");
    return Status::success();
}

Status LifecycleController::stop() {
    if (!is_running())
        return fail(Status::failure(ServiceError::NotRunning,
                                    "Service '" + descriptor_.name() + "' is not running"));
    note("Stopping " + descriptor_.name());
    if (Status st = strategy_->request_stop(descriptor_); !st)
        return fail(st);
    note("Stopped");
    return Status::success();
}

Status LifecycleController::restart() {
    if (is_running()) {
        if (Status st = stop(); !st)
            return st;
    }
    return start();
}

Status LifecycleController::run() {
    log_info("Running in the foreground", {{"service", descriptor_.name()}});
    auto token = std::make_shared<CancellationToken>();
    StopSignalScope signals(token);
    ServiceHandle handle(token);
    descriptor_.callback()(handle);
    log_info("Foreground run finished",
             {{"service", descriptor_.name()},
              {"stop_requested", token->requested() ? "true" : "false"}});
    return Status::success();
}

Status LifecycleController::host_run() {
    Status st = strategy_->host_run(descriptor_, *hooks_);
    if (!st)
        log_error(st.message(), {{"service", descriptor_.name()}});
    return st;
}

ServiceState LifecycleController::status() const { return strategy_->probe(descriptor_); }

std::string describe_state(const ServiceState& state) {
    if (!state.running)
        return state.installed ? "stopped" : "not installed";
    if (state.stale)
        return state.pid > 0 ? "stale (pid " + std::to_string(state.pid) + ")"
                             : std::string("stale (corrupt record)");
    if (state.pid <= 0)
        return "running";
    std::string out = "running (pid " + std::to_string(state.pid);
    if (state.since)
        out += ", up " + format_duration_short(elapsed_since(*state.since));
    out += ")";
    return out;
}

} // namespace svckit
