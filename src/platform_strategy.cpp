#include "platform_strategy.hpp"
#include "windows_service.hpp"

namespace svckit {

std::unique_ptr<ExecutionStrategy> make_platform_strategy(const StrategyConfig& config) {
#ifdef _WIN32
    return std::make_unique<HostManagedStrategy>(std::make_unique<winservice::ScmHost>(),
                                                 config.host);
#else
    return std::make_unique<ForkStrategy>(config.fork);
#endif
}

} // namespace svckit
