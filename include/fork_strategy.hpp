#ifndef FORK_STRATEGY_HPP
#define FORK_STRATEGY_HPP
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include "control_script.hpp"
#include "daemonizer.hpp"
#include "execution_strategy.hpp"
#include "pid_store.hpp"
#include "termination.hpp"

namespace svckit {

/** What `start` does with a PID record whose process is gone. */
enum class StaleRecordPolicy {
    Keep,  ///< Refuse to start, the operator cleans up.
    Clear, ///< Remove the record and start.
    Auto,  ///< Clear only for services with auto-start.
};

/** @throws std::invalid_argument for anything else than keep, clear or auto. */
StaleRecordPolicy parse_stale_policy(const std::string& text);
const char* to_string(StaleRecordPolicy policy);

/** How a daemon's exit was classified by its exit guard. */
enum class DaemonExit {
    Stopped,   ///< The PID record was removed by a stop request.
    Completed, ///< The callback returned on its own.
    Abnormal,  ///< The callback threw or a foreign signal ended it.
};

/**
 * @brief Invoked after an abnormal exit of an auto-start service.
 *
 * Runs inside the dying daemon after its PID record was removed.
 */
using RestartHook = std::function<void(const ServiceDescriptor&)>;

struct ForkOptions {
    std::filesystem::path pid_dir;    ///< Empty means default_pid_dir().
    std::filesystem::path script_dir; ///< Empty means default_script_dir().
    bool require_superuser = true;
    StaleRecordPolicy stale_policy = StaleRecordPolicy::Auto;
    TerminationPolicy termination;
    DaemonizeOptions daemonize;
    LaunchCommand relaunch; ///< Command the default restart hook runs with `start`.
    std::chrono::milliseconds restart_delay{1000};
};

/**
 * @brief Execution on hosts that can fork.
 *
 * Installation is a control script, liveness is a PID file and `start`
 * double-forks into a daemon that runs the callback in its own process.
 * `stop` removes the PID record first and only then signals the daemon, so
 * the daemon can tell a requested stop from a crash.
 */
class ForkStrategy : public ExecutionStrategy {
  public:
    explicit ForkStrategy(ForkOptions options);

    const char* kind() const override { return "fork"; }

    bool is_installed(const ServiceDescriptor& descriptor) const override;
    Status install(const ServiceDescriptor& descriptor, const LaunchCommand& launch) override;
    Status uninstall(const ServiceDescriptor& descriptor) override;
    bool is_running(const ServiceDescriptor& descriptor) const override;
    Status resolve_existing(const ServiceDescriptor& descriptor) override;
    Status detach_and_run(const ServiceDescriptor& descriptor, LifecycleHooks& hooks) override;
    Status request_stop(const ServiceDescriptor& descriptor) override;
    ServiceState probe(const ServiceDescriptor& descriptor) const override;

    /** Replace the default relaunch behavior. An empty hook disables it. */
    void set_restart_hook(RestartHook hook) { restart_hook_ = std::move(hook); }

    PidFileStore pid_store(const ServiceDescriptor& descriptor) const;
    const ControlScriptWriter& scripts() const { return scripts_; }
    const ForkOptions& options() const { return options_; }

  private:
    [[noreturn]] void run_daemon(const ServiceDescriptor& descriptor, LifecycleHooks& hooks,
                                 PidFileStore& store);

    ForkOptions options_;
    ControlScriptWriter scripts_;
    RestartHook restart_hook_;
};

/**
 * @brief Default restart hook.
 *
 * Forks a detached helper that sleeps @p delay and then executes
 * `<program> <args...> start`.
 */
RestartHook relaunch_hook(LaunchCommand command, std::chrono::milliseconds delay);

/**
 * @brief Scoped classifier for the end of a daemon's life.
 *
 * Created right after detachment. On destruction it inspects the PID record
 * and the recorded outcome, removes the record when the daemon still owns it
 * and runs the restart hook for an abnormal exit of an auto-start service.
 */
class DaemonExitGuard {
  public:
    DaemonExitGuard(LivenessStore& store, const ServiceDescriptor& descriptor,
                    const RestartHook& restart);
    ~DaemonExitGuard();

    DaemonExitGuard(const DaemonExitGuard&) = delete;
    DaemonExitGuard& operator=(const DaemonExitGuard&) = delete;

    /** The callback returned without throwing. */
    void mark_returned() { returned_ = true; }

    /** A termination signal arrived that was not preceded by a stop request. */
    void mark_signalled(int sig) { signal_ = sig; }

    /** Classify now; the destructor then does nothing more. */
    DaemonExit finish();

  private:
    LivenessStore& store_;
    const ServiceDescriptor& descriptor_;
    const RestartHook& restart_;
    bool returned_ = false;
    int signal_ = 0;
    bool finished_ = false;
    DaemonExit outcome_ = DaemonExit::Abnormal;
};

} // namespace svckit

#endif // FORK_STRATEGY_HPP
