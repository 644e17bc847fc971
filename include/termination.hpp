#ifndef TERMINATION_HPP
#define TERMINATION_HPP
#include <chrono>
#include <string>
#include "service_error.hpp"

namespace svckit {

/**
 * @brief How a tracked process is asked to terminate.
 *
 * The defaults mirror the classic init-script behavior: SIGTERM, five
 * attempts, 200 ms apart. With @ref force_kill the budget is followed by a
 * single SIGKILL.
 */
struct TerminationPolicy {
    static constexpr int kDefaultMaxAttempts = 5;
    static constexpr std::chrono::milliseconds kDefaultPollInterval{200};

    int signal;
    int max_attempts = kDefaultMaxAttempts;
    std::chrono::milliseconds poll_interval = kDefaultPollInterval;
    bool force_kill = false;

    TerminationPolicy();
};

/** Parse "TERM", "SIGTERM" or "15". @return -1 when unknown. */
int parse_signal(const std::string& text);

/**
 * @brief Sends termination signals to a pid until it is confirmed dead.
 *
 * Success is declared only when the OS reports that the process no longer
 * exists. Running out of attempts is a TerminationTimeout, never a success.
 * Any signalling error other than "no such process" is a
 * SignalDeliveryFailure.
 */
class TerminationStrategy {
  public:
    explicit TerminationStrategy(TerminationPolicy policy = TerminationPolicy());

    Status terminate(long pid);

    /** Signals sent by the last terminate() call, SIGKILL included. */
    int attempts_used() const { return attempts_; }

    const TerminationPolicy& policy() const { return policy_; }

  private:
    TerminationPolicy policy_;
    int attempts_ = 0;
};

} // namespace svckit

#endif // TERMINATION_HPP
