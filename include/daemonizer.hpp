#ifndef DAEMONIZER_HPP
#define DAEMONIZER_HPP
#include <filesystem>
#include "pid_store.hpp"
#include "service_error.hpp"

namespace svckit {

/** Which side of the detachment the caller ended up on. */
enum class DetachRole { Launcher, Daemon };

struct DetachResult {
    Status status;
    DetachRole role = DetachRole::Launcher;
    long daemon_pid = 0; ///< Pid of the detached process, valid on success.
};

struct DaemonizeOptions {
    bool change_directory = true; ///< chdir("/") so no mount point stays busy.
    std::filesystem::path null_device = "/dev/null";
};

/**
 * @brief Detaches the calling process into a daemon.
 *
 * Sequence: fork, setsid and umask(0) in the child, fork again so the final
 * process is not a session leader and can never reacquire a controlling
 * terminal, then write the daemon's pid through the LivenessStore and point
 * stdin, stdout and stderr at the null device.
 *
 * The launching process does not exit on its own. It blocks on a readiness
 * pipe until the daemon reports success or the step that failed, reaps the
 * intermediate child and returns with DetachRole::Launcher. The daemon
 * returns with DetachRole::Daemon. No PID record is written unless both
 * forks succeeded.
 */
class Daemonizer {
  public:
    explicit Daemonizer(LivenessStore& store, DaemonizeOptions options = DaemonizeOptions());

    DetachResult detach();

  private:
    LivenessStore& store_;
    DaemonizeOptions options_;
};

} // namespace svckit

#endif // DAEMONIZER_HPP
