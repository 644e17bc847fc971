#include "host_managed_strategy.hpp"
#include <exception>
#include <system_error>
#include <thread>
#include <utility>
#include "logger.hpp"

namespace svckit {

const char* to_string(HostStatus status) {
    switch (status) {
    case HostStatus::StartPending:
        return "start-pending";
    case HostStatus::Running:
        return "running";
    case HostStatus::StopPending:
        return "stop-pending";
    case HostStatus::Stopped:
        return "stopped";
    }
    return "stopped";
}

void StopEvent::set() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        set_ = true;
    }
    cv_.notify_all();
}

bool StopEvent::is_set() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return set_;
}

void StopEvent::wait() const {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return set_; });
}

bool StopEvent::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this] { return set_; });
}

HostManagedStrategy::HostManagedStrategy(std::unique_ptr<ServiceHost> host,
                                         HostManagedOptions options)
    : host_(std::move(host)), options_(options) {}

bool HostManagedStrategy::is_installed(const ServiceDescriptor& descriptor) const {
    return host_->is_registered(descriptor.name());
}

Status HostManagedStrategy::install(const ServiceDescriptor& descriptor,
                                    const LaunchCommand& launch) {
    return host_->register_service(descriptor, launch.command_line("serve"));
}

Status HostManagedStrategy::uninstall(const ServiceDescriptor& descriptor) {
    return host_->unregister_service(descriptor.name());
}

bool HostManagedStrategy::is_running(const ServiceDescriptor& descriptor) const {
    return host_->is_active(descriptor.name());
}

Status HostManagedStrategy::detach_and_run(const ServiceDescriptor& descriptor, LifecycleHooks&) {
    Status st = host_->start_service(descriptor.name());
    if (st)
        log_info("Start requested from service manager", {{"service", descriptor.name()}});
    return st;
}

Status HostManagedStrategy::request_stop(const ServiceDescriptor& descriptor) {
    Status st = host_->stop_service(descriptor.name());
    if (st)
        log_info("Stop requested from service manager", {{"service", descriptor.name()}});
    return st;
}

Status HostManagedStrategy::host_run(const ServiceDescriptor& descriptor, LifecycleHooks& hooks) {
    Status outcome;
    Status st = host_->run_dispatcher(
        descriptor.name(), [this, &descriptor, &hooks, &outcome] { outcome = serve(descriptor, hooks); },
        [this] { notify_stop(); });
    if (!st)
        return st;
    return outcome;
}

ServiceState HostManagedStrategy::probe(const ServiceDescriptor& descriptor) const {
    ServiceState state;
    state.installed = host_->is_registered(descriptor.name());
    state.running = state.installed && host_->is_active(descriptor.name());
    if (state.running)
        state.pid = host_->active_pid(descriptor.name());
    return state;
}

void HostManagedStrategy::notify_stop() {
    // Held across the report so serve() cannot report Stopped in between.
    std::lock_guard<std::mutex> lk(run_mtx_);
    if (!token_) {
        log_debug("Stop request ignored, no service is being served");
        return;
    }
    token_->request();
    host_->report_status(HostStatus::StopPending);
    wake_->set();
}

Status HostManagedStrategy::serve(const ServiceDescriptor& descriptor, LifecycleHooks& hooks) {
    auto token = std::make_shared<CancellationToken>();
    auto wake = std::make_shared<StopEvent>();
    auto done = std::make_shared<StopEvent>();
    {
        std::lock_guard<std::mutex> lk(run_mtx_);
        if (token_)
            return Status::failure(ServiceError::AlreadyRunning,
                                   "Service '" + descriptor.name() + "' is already being served");
        token_ = token;
        wake_ = wake;
        host_->report_status(HostStatus::StartPending);
    }
    const std::string name = descriptor.name();

    try {
        std::thread worker([callback = descriptor.callback(), name, token, wake, done] {
            ServiceHandle handle(token);
            try {
                callback(handle);
            } catch (const std::exception& e) {
                log_error("Service callback failed", {{"service", name}, {"error", e.what()}});
            }
            done->set();
            wake->set();
        });
        worker.detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lk(run_mtx_);
            token_.reset();
            wake_.reset();
            host_->report_status(HostStatus::Stopped);
        }
        return Status::failure(ServiceError::HostFailure,
                               std::string("Unable to start worker thread: ") + e.what(),
                               e.code().value());
    }

    host_->report_status(HostStatus::Running);
    log_info("Service running", {{"service", name}});
    try {
        hooks.on_started(descriptor);
    } catch (const std::exception& e) {
        log_error("on_started hook failed", {{"service", name}, {"error", e.what()}});
    }

    wake->wait();
    if (token->requested()) {
        if (!done->wait_for(options_.stop_grace))
            log_warning("Worker still running after stop grace, reporting stopped",
                        {{"service", name},
                         {"grace_ms", std::to_string(options_.stop_grace.count())}});
    } else {
        log_info("Service callback returned", {{"service", name}});
    }

    try {
        hooks.on_stopped(descriptor);
    } catch (const std::exception& e) {
        log_error("on_stopped hook failed", {{"service", name}, {"error", e.what()}});
    }
    {
        std::lock_guard<std::mutex> lk(run_mtx_);
        token_.reset();
        wake_.reset();
        host_->report_status(HostStatus::Stopped);
    }
    log_info("Service stopped", {{"service", name}});
    return Status::success();
}

} // namespace svckit
