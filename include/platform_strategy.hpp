#ifndef PLATFORM_STRATEGY_HPP
#define PLATFORM_STRATEGY_HPP
#include <memory>
#include "execution_strategy.hpp"
#include "fork_strategy.hpp"
#include "host_managed_strategy.hpp"

namespace svckit {

/** Settings for whichever strategy the platform selects. */
struct StrategyConfig {
    ForkOptions fork;
    HostManagedOptions host;
};

/**
 * @brief Select the execution strategy for this platform.
 *
 * Windows gets a HostManagedStrategy talking to the service-control
 * manager, every other platform a ForkStrategy.
 */
std::unique_ptr<ExecutionStrategy> make_platform_strategy(const StrategyConfig& config);

} // namespace svckit

#endif // PLATFORM_STRATEGY_HPP
