#ifndef LIFECYCLE_CONTROLLER_HPP
#define LIFECYCLE_CONTROLLER_HPP
#include <iostream>
#include <memory>
#include <string>
#include "execution_strategy.hpp"
#include "service_descriptor.hpp"
#include "service_error.hpp"

namespace svckit {

/**
 * @brief Install, start, stop and uninstall one service.
 *
 * States are `NotInstalled` and `Installed{Stopped, Running}`. Guards are
 * recomputed from the strategy on every call and never cached, so manual
 * edits to the filesystem or the service manager are picked up. The check
 * and the action are not atomic; a concurrent change between them is
 * reported by the action itself.
 *
 * Each operation writes a terse `* ...` line to the output stream, logs it
 * and returns a Status.
 */
class LifecycleController {
  public:
    LifecycleController(ServiceDescriptor descriptor, std::unique_ptr<ExecutionStrategy> strategy,
                        std::ostream& out = std::cout);
    LifecycleController(ServiceDescriptor descriptor, std::unique_ptr<ExecutionStrategy> strategy,
                        LifecycleHooks& hooks, std::ostream& out = std::cout);

    bool is_installed() const;
    bool is_running() const;

    /** @param launch Command the host uses to re-invoke this program. */
    Status install(const LaunchCommand& launch);

    /** Stops the service first when it is running. */
    Status uninstall();

    /**
     * @brief Launch the service in the background.
     *
     * On the fork host the daemon side of this call never returns; it runs
     * the callback and exits.
     */
    Status start();

    Status stop();

    /** stop() when running, then start(). Not atomic. */
    Status restart();

    /**
     * @brief Run the callback in the calling process.
     *
     * No liveness record, no detachment and no hooks. SIGINT and SIGTERM
     * raise the callback's stop flag. Blocks until the callback returns.
     */
    Status run();

    /** Body for a process launched by the service manager. */
    Status host_run();

    ServiceState status() const;

    const ServiceDescriptor& descriptor() const { return descriptor_; }
    ExecutionStrategy& strategy() { return *strategy_; }

  private:
    void note(const std::string& line) const;
    Status fail(const Status& st) const;

    ServiceDescriptor descriptor_;
    std::unique_ptr<ExecutionStrategy> strategy_;
    LifecycleHooks default_hooks_;
    LifecycleHooks* hooks_;
    std::ostream& out_;
};

/**
 * @brief One-line rendering of @p state.
 *
 * `not installed`, `stopped`, `running (pid N, up 1h2m3s)` or
 * `stale (pid N)`.
 */
std::string describe_state(const ServiceState& state);

} // namespace svckit

#endif // LIFECYCLE_CONTROLLER_HPP
