#ifndef CLI_COMMANDS_HPP
#define CLI_COMMANDS_HPP

#include <iostream>
#include <string>

#include "lifecycle_controller.hpp"
#include "options.hpp"
#include "service_descriptor.hpp"

namespace cli {

/**
 * @brief Configure the logger from the parsed logging options.
 *
 * Opens the log file when one is set, applies level, format, compression and
 * syslog settings and enables the stderr echo for `--verbose`.
 */
void setup_logging(const svckit::LoggingOptions& opts);

/**
 * @brief Build the descriptor for this invocation.
 *
 * Name, description and auto-start from @p opts override @p base; the
 * callback is always the one of @p base.
 *
 * @throws std::invalid_argument when the resulting name is unusable.
 */
svckit::ServiceDescriptor resolve_descriptor(const svckit::ServiceDescriptor& base,
                                             const svckit::Options& opts);

/**
 * @brief Run the lifecycle operation named by @p verb.
 *
 * `status` prints the state line to @p out and always succeeds.
 *
 * @return Process exit code, 0 on success and 1 on failure.
 */
int dispatch_verb(const std::string& verb, svckit::LifecycleController& controller,
                  const svckit::LaunchCommand& launch, std::ostream& out);

} // namespace cli

namespace svckit {

/**
 * @brief Entry point for a service program.
 *
 * Parses `argv`, sets up logging, selects the platform strategy and runs one
 * lifecycle verb. A program typically ends its `main` with
 * `return svckit::run_cli(argc, argv, descriptor, hooks);`.
 *
 * @return Process exit code.
 */
int run_cli(int argc, char* argv[], const ServiceDescriptor& descriptor, LifecycleHooks& hooks);

/** run_cli() without lifecycle hooks. */
int run_cli(int argc, char* argv[], const ServiceDescriptor& descriptor);

} // namespace svckit

#endif // CLI_COMMANDS_HPP
