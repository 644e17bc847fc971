#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <optional>
#include <string>
#include <vector>
#include "config_utils.hpp"
#include "logger.hpp"
#include "platform_strategy.hpp"

namespace svckit {

struct LoggingOptions {
    std::string log_file;
    LogLevel log_level = LogLevel::INFO;
    bool json_log = false;
    bool use_syslog = false;
    int syslog_facility = 0;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool compress_logs = false;
    bool verbose = false; ///< Echo log lines to stderr.
};

/** Everything one invocation of a service program asked for. */
struct Options {
    std::string verb = "run";
    std::string config_file; ///< Absolute path, empty without --config.
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<bool> auto_start;
    StrategyConfig strategy;
    LoggingOptions logging;
    bool show_help = false;
    bool show_version = false;

    /** Arguments the control script passes back so the daemon sees the same settings. */
    std::vector<std::string> forwarded_args;

    /** Config keys that matched no option; logged once logging is up. */
    std::vector<std::string> ignored_config_keys;
};

/** @return true for install, uninstall, remove, start, stop, restart, status, run and serve. */
bool is_known_verb(const std::string& verb);

/**
 * @brief Parse the command line, merging in `--config FILE` when given.
 *
 * Command line values override config file values.
 *
 * @throws std::runtime_error on unknown flags, malformed values, more than
 *         one verb or an unreadable config file.
 */
Options parse_options(int argc, char* argv[]);

/** Apply already merged `--key -> value` pairs on top of @p opts. */
void apply_option_values(Options& opts, const ConfigMap& values);

/** Print usage and the option table. */
void print_help(const char* prog, std::ostream& os);

} // namespace svckit

#endif // OPTIONS_HPP
