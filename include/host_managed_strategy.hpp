#ifndef HOST_MANAGED_STRATEGY_HPP
#define HOST_MANAGED_STRATEGY_HPP
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "execution_strategy.hpp"

namespace svckit {

/** Transitions reported to the service manager. */
enum class HostStatus { StartPending, Running, StopPending, Stopped };

const char* to_string(HostStatus status);

/**
 * @brief Capability a native service manager has to expose.
 *
 * Registration and control requests are issued from the controlling
 * process. run_dispatcher() and report_status() are used from inside the
 * process the manager launched.
 */
class ServiceHost {
  public:
    virtual ~ServiceHost() = default;

    virtual bool is_registered(const std::string& name) const = 0;
    virtual Status register_service(const ServiceDescriptor& descriptor,
                                    const std::string& command_line) = 0;
    virtual Status unregister_service(const std::string& name) = 0;

    /** @return true while the manager reports the service as started. */
    virtual bool is_active(const std::string& name) const = 0;
    virtual long active_pid(const std::string& name) const { (void)name; return 0; }

    virtual Status start_service(const std::string& name) = 0;
    virtual Status stop_service(const std::string& name) = 0;

    /**
     * @brief Hand the calling thread to the manager's dispatcher.
     *
     * The manager calls @p service_main on its control thread and @p on_stop
     * from its control handler when a stop or shutdown request arrives.
     * Returns once @p service_main returned.
     */
    virtual Status run_dispatcher(const std::string& name, std::function<void()> service_main,
                                  std::function<void()> on_stop) = 0;

    virtual void report_status(HostStatus status) = 0;
};

/**
 * @brief One-shot event. Once set it stays set.
 */
class StopEvent {
  public:
    void set();
    bool is_set() const;
    void wait() const;

    /** @return true if the event was set within @p timeout. */
    bool wait_for(std::chrono::milliseconds timeout) const;

  private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    bool set_ = false;
};

struct HostManagedOptions {
    /** How long a stopped service waits for its worker before reporting Stopped. */
    std::chrono::milliseconds stop_grace{5000};
};

/**
 * @brief Execution under a native service manager.
 *
 * serve() reports StartPending, launches the callback on a detached worker
 * thread, reports Running and blocks on a stop event. notify_stop() raises
 * the callback's cancellation token, reports StopPending and sets the event.
 * StartPending, StopPending and Stopped are reported under one lock, so
 * Stopped is always the last status the manager sees.
 *
 * Cancellation is cooperative. The worker is never joined or killed: after
 * a stop request the control thread waits up to the stop grace for the
 * worker to finish and then reports Stopped regardless. A callback that
 * ignores its token keeps running until the process exits. A callback that
 * returns on its own also ends the service.
 */
class HostManagedStrategy : public ExecutionStrategy {
  public:
    HostManagedStrategy(std::unique_ptr<ServiceHost> host,
                        HostManagedOptions options = HostManagedOptions());

    const char* kind() const override { return "host-managed"; }

    bool is_installed(const ServiceDescriptor& descriptor) const override;
    Status install(const ServiceDescriptor& descriptor, const LaunchCommand& launch) override;
    Status uninstall(const ServiceDescriptor& descriptor) override;
    bool is_running(const ServiceDescriptor& descriptor) const override;
    Status detach_and_run(const ServiceDescriptor& descriptor, LifecycleHooks& hooks) override;
    Status request_stop(const ServiceDescriptor& descriptor) override;
    Status host_run(const ServiceDescriptor& descriptor, LifecycleHooks& hooks) override;
    ServiceState probe(const ServiceDescriptor& descriptor) const override;

    /** Control-thread body run once the manager launched the service. */
    Status serve(const ServiceDescriptor& descriptor, LifecycleHooks& hooks);

    /** Stop request delivered by the manager. Safe to call from any thread. */
    void notify_stop();

    ServiceHost& host() { return *host_; }

  private:
    std::unique_ptr<ServiceHost> host_;
    HostManagedOptions options_;

    std::mutex run_mtx_;
    std::shared_ptr<CancellationToken> token_; // guarded by run_mtx_
    std::shared_ptr<StopEvent> wake_;          // guarded by run_mtx_
};

} // namespace svckit

#endif // HOST_MANAGED_STRATEGY_HPP
