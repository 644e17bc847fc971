#ifndef STOP_SIGNALS_HPP
#define STOP_SIGNALS_HPP
#include <memory>
#include "service_descriptor.hpp"

namespace svckit {

/**
 * @brief Routes SIGTERM and SIGINT into a CancellationToken.
 *
 * While the scope is alive both signals raise the token instead of killing
 * the process. The previous dispositions are restored on destruction. Only
 * one scope may be active at a time.
 */
class StopSignalScope {
  public:
    explicit StopSignalScope(std::shared_ptr<CancellationToken> token);
    ~StopSignalScope();

    StopSignalScope(const StopSignalScope&) = delete;
    StopSignalScope& operator=(const StopSignalScope&) = delete;

    /** @return Number of the last signal received by any scope, or 0. */
    static int last_signal();

  private:
    std::shared_ptr<CancellationToken> token_;
    struct Saved;
    std::unique_ptr<Saved> saved_;
};

} // namespace svckit

#endif // STOP_SIGNALS_HPP
