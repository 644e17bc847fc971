#ifndef EXECUTION_STRATEGY_HPP
#define EXECUTION_STRATEGY_HPP
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "service_descriptor.hpp"
#include "service_error.hpp"

namespace svckit {

/** How the host re-invokes the program for a lifecycle verb. */
struct LaunchCommand {
    std::string interpreter;       ///< Empty when @ref program is directly executable.
    std::string program;           ///< Absolute path of the program.
    std::vector<std::string> args; ///< Extra arguments passed after the verb.

    /** Quoted command line `"<interpreter>" "<program>" <verb> <args...>`. */
    std::string command_line(const std::string& verb) const;
};

/** Point-in-time view of one service, as reported by `status`. */
struct ServiceState {
    bool installed = false;
    bool running = false;
    bool stale = false; ///< A liveness record exists but its process is gone.
    long pid = 0;
    std::optional<std::chrono::system_clock::time_point> since;
};

/**
 * @brief How a service is hosted on this platform.
 *
 * One implementation is selected at startup. The fork variant detaches the
 * calling process and runs the callback inside the daemon; the host-managed
 * variant hands the service to a service manager that runs the callback on
 * a worker thread.
 *
 * None of the queries cache anything. Every call looks at the filesystem or
 * asks the host again.
 */
class ExecutionStrategy {
  public:
    virtual ~ExecutionStrategy() = default;

    /** Short name used in logs, e.g. "fork". */
    virtual const char* kind() const = 0;

    virtual bool is_installed(const ServiceDescriptor& descriptor) const = 0;
    virtual Status install(const ServiceDescriptor& descriptor, const LaunchCommand& launch) = 0;
    virtual Status uninstall(const ServiceDescriptor& descriptor) = 0;

    virtual bool is_running(const ServiceDescriptor& descriptor) const = 0;

    /**
     * @brief A liveness record exists; decide whether start may proceed.
     *
     * @return success when the record was cleared, AlreadyRunning otherwise.
     */
    virtual Status resolve_existing(const ServiceDescriptor& descriptor) {
        return Status::failure(ServiceError::AlreadyRunning,
                               "Service '" + descriptor.name() + "' is already running");
    }

    /**
     * @brief Launch the service in the background.
     *
     * Returns in the calling process once the service is up or failed to come
     * up. On the fork host the detached daemon never returns from this call.
     */
    virtual Status detach_and_run(const ServiceDescriptor& descriptor, LifecycleHooks& hooks) = 0;

    /** Ask a running service to stop and wait for the outcome. */
    virtual Status request_stop(const ServiceDescriptor& descriptor) = 0;

    /**
     * @brief Body executed when the service manager launches the program.
     *
     * Only meaningful on a host-managed platform.
     */
    virtual Status host_run(const ServiceDescriptor& descriptor, LifecycleHooks& hooks) {
        (void)hooks;
        return Status::failure(ServiceError::HostFailure,
                               "Service '" + descriptor.name() +
                                   "' is not hosted by a service manager on this platform");
    }

    virtual ServiceState probe(const ServiceDescriptor& descriptor) const = 0;
};

} // namespace svckit

#endif // EXECUTION_STRATEGY_HPP
