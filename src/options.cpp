#include "options.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <map>
#include <ostream>
#include <set>
#include <stdexcept>
#include "arg_parser.hpp"
#include "parse_utils.hpp"
#include "system_utils.hpp"
#include "termination.hpp"

namespace fs = std::filesystem;

namespace svckit {

namespace {

struct OptionInfo {
    const char* long_flag;
    char short_flag;
    const char* arg; ///< Empty for switches.
    const char* desc;
    const char* category;
};

const std::vector<OptionInfo>& option_table() {
    static const std::vector<OptionInfo> table = {
        {"--config", 'c', "<file>", "Read options from a YAML or JSON file", "General"},
        {"--help", 'h', "", "Show this help", "General"},
        {"--version", 'V', "", "Show the version", "General"},
        {"--name", 'n', "<name>", "Service name", "Service"},
        {"--description", 0, "<text>", "Service description", "Service"},
        {"--auto-start", 0, "", "Start at boot and relaunch once after a crash", "Service"},
        {"--pid-dir", 0, "<dir>", "Directory for PID files", "Service"},
        {"--script-dir", 0, "<dir>", "Directory for control scripts", "Service"},
        {"--require-root", 0, "", "Require superuser rights to install (default true)",
         "Service"},
        {"--stale-record", 0, "<keep|clear|auto>", "What start does with a stale PID file",
         "Service"},
        {"--signal", 0, "<name|num>", "Signal sent by stop (default TERM)", "Termination"},
        {"--max-attempts", 0, "<n>", "Signals sent before giving up (default 5)", "Termination"},
        {"--poll-interval-ms", 0, "<ms|s>", "Delay between attempts (default 200ms)",
         "Termination"},
        {"--force-kill", 0, "", "Send SIGKILL once the attempts are used up", "Termination"},
        {"--stop-grace-ms", 0, "<ms|s>",
         "Wait for the worker after a service manager stop (default 5s)", "Termination"},
        {"--log-file", 'l', "<path>", "Write log lines to a file", "Logging"},
        {"--log-level", 0, "<level>", "debug, info, warning or error", "Logging"},
        {"--json-log", 0, "", "Write log lines as JSON", "Logging"},
        {"--syslog", 0, "", "Mirror log lines to syslog", "Logging"},
        {"--syslog-facility", 0, "<n>", "Syslog facility number", "Logging"},
        {"--max-log-size", 0, "<bytes>", "Rotate the log file at this size", "Logging"},
        {"--max-log-files", 0, "<n>", "Rotated log files to keep", "Logging"},
        {"--compress-logs", 0, "", "gzip rotated log files", "Logging"},
        {"--verbose", 'v', "", "Echo log lines to stderr", "Logging"},
    };
    return table;
}

const OptionInfo* find_option(const std::string& flag) {
    for (const auto& o : option_table())
        if (flag == o.long_flag)
            return &o;
    return nullptr;
}

bool takes_value(const OptionInfo& o) { return o.arg[0] != '\0'; }

const std::set<std::string> kVerbs = {"install", "uninstall", "remove", "start", "stop",
                                      "restart", "status",    "run",    "serve"};

// Options naming files or directories. The daemon and the control script
// run from another directory, so these are stored absolute.
const std::set<std::string> kPathOptions = {"--pid-dir", "--script-dir", "--log-file"};

std::string resolved(const std::string& value, const fs::path& base = {}) {
    return procutil::absolute_path(value, base).string();
}

bool flag_value(const ConfigMap& values, const std::string& key, bool fallback) {
    auto it = values.find(key);
    if (it == values.end())
        return fallback;
    bool ok = false;
    bool v = parse_bool(it->second, ok);
    if (!ok)
        throw std::runtime_error("Invalid value for " + key + ": " + it->second);
    return v;
}

std::chrono::milliseconds time_value(const std::string& key, const std::string& text) {
    bool ok = false;
    auto v = parse_time_ms(text, ok);
    if (!ok)
        throw std::runtime_error("Invalid value for " + key + ": " + text);
    return v;
}

int int_value(const std::string& key, const std::string& text, int min, int max) {
    bool ok = false;
    int v = parse_int(text, min, max, ok);
    if (!ok)
        throw std::runtime_error("Invalid value for " + key + ": " + text);
    return v;
}

} // namespace

bool is_known_verb(const std::string& verb) { return kVerbs.count(verb) > 0; }

void apply_option_values(Options& opts, const ConfigMap& values) {
    auto get = [&](const char* key) -> const std::string* {
        auto it = values.find(key);
        return it == values.end() ? nullptr : &it->second;
    };
    ForkOptions& fork = opts.strategy.fork;
    LoggingOptions& log = opts.logging;

    opts.show_help = flag_value(values, "--help", opts.show_help);
    opts.show_version = flag_value(values, "--version", opts.show_version);
    if (auto v = get("--name"))
        opts.name = *v;
    if (auto v = get("--description"))
        opts.description = *v;
    if (values.count("--auto-start"))
        opts.auto_start = flag_value(values, "--auto-start", false);
    if (auto v = get("--pid-dir"))
        fork.pid_dir = resolved(*v);
    if (auto v = get("--script-dir"))
        fork.script_dir = resolved(*v);
    fork.require_superuser = flag_value(values, "--require-root", fork.require_superuser);
    if (auto v = get("--stale-record")) {
        try {
            fork.stale_policy = parse_stale_policy(*v);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(e.what());
        }
    }

    if (auto v = get("--signal")) {
        int sig = parse_signal(*v);
        if (sig < 0)
            throw std::runtime_error("Invalid value for --signal: " + *v);
        fork.termination.signal = sig;
    }
    if (auto v = get("--max-attempts"))
        fork.termination.max_attempts = int_value("--max-attempts", *v, 1, 1000);
    if (auto v = get("--poll-interval-ms"))
        fork.termination.poll_interval = time_value("--poll-interval-ms", *v);
    fork.termination.force_kill = flag_value(values, "--force-kill", fork.termination.force_kill);
    if (auto v = get("--stop-grace-ms"))
        opts.strategy.host.stop_grace = time_value("--stop-grace-ms", *v);

    if (auto v = get("--log-file"))
        log.log_file = resolved(*v);
    if (auto v = get("--log-level"))
        log.log_level = parse_log_level(*v);
    log.json_log = flag_value(values, "--json-log", log.json_log);
    log.use_syslog = flag_value(values, "--syslog", log.use_syslog);
    if (auto v = get("--syslog-facility"))
        log.syslog_facility = int_value("--syslog-facility", *v, 0, 1024);
    if (auto v = get("--max-log-size")) {
        bool ok = false;
        log.max_log_size = parse_bytes(*v, 0, static_cast<size_t>(-1), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size: " + *v);
    }
    if (auto v = get("--max-log-files"))
        log.max_log_files = static_cast<size_t>(int_value("--max-log-files", *v, 1, 100));
    log.compress_logs = flag_value(values, "--compress-logs", log.compress_logs);
    log.verbose = flag_value(values, "--verbose", log.verbose);
}

Options parse_options(int argc, char* argv[]) {
    std::set<std::string> value_options;
    std::set<std::string> switches;
    std::map<char, std::string> short_map;
    for (const auto& o : option_table()) {
        (takes_value(o) ? value_options : switches).insert(o.long_flag);
        if (o.short_flag)
            short_map[o.short_flag] = o.long_flag;
    }
    ArgParser parser(argc, argv, value_options, switches, short_map);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");
    if (parser.positional().size() > 1)
        throw std::runtime_error("Only one command may be given, got '" +
                                 parser.positional()[0] + "' and '" + parser.positional()[1] +
                                 "'");

    Options opts;
    if (!parser.positional().empty()) {
        opts.verb = parser.positional().front();
        if (!is_known_verb(opts.verb))
            throw std::runtime_error("Unknown command: " + opts.verb);
        if (opts.verb == "remove")
            opts.verb = "uninstall";
    }

    ConfigMap merged;
    if (parser.has_flag("--config")) {
        std::string cfg = parser.get_option("--config");
        if (cfg.empty())
            throw std::runtime_error("--config requires a file");
        std::error_code ec;
        fs::path abs = fs::absolute(cfg, ec);
        opts.config_file = ec ? cfg : abs.lexically_normal().string();
        std::string err;
        if (!load_config_file(opts.config_file, merged, err))
            throw std::runtime_error("Failed to load config " + opts.config_file + ": " + err);
        const fs::path cfg_dir = fs::path(opts.config_file).parent_path();
        for (auto it = merged.begin(); it != merged.end();) {
            if (!find_option(it->first) || it->first == "--config") {
                opts.ignored_config_keys.push_back(it->first.substr(2));
                it = merged.erase(it);
                continue;
            }
            if (kPathOptions.count(it->first))
                it->second = resolved(it->second, cfg_dir);
            ++it;
        }
        opts.forwarded_args = {"--config", opts.config_file};
    }

    for (const auto& [key, raw] : parser.options()) {
        const std::string value = kPathOptions.count(key) ? resolved(raw) : raw;
        merged[key] = value;
        if (key == "--config" || key == "--help" || key == "--version")
            continue;
        const OptionInfo* info = find_option(key);
        if (info && takes_value(*info)) {
            opts.forwarded_args.push_back(key);
            opts.forwarded_args.push_back(value);
        } else {
            opts.forwarded_args.push_back(value.empty() ? key : key + "=" + value);
        }
    }
    apply_option_values(opts, merged);
    return opts;
}

void print_help(const char* prog, std::ostream& os) {
    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    auto label = [](const OptionInfo& o) {
        std::string flag = "  ";
        flag += o.short_flag ? std::string("-") + o.short_flag + ", " : std::string("    ");
        flag += o.long_flag;
        if (takes_value(o))
            flag += " " + std::string(o.arg);
        return flag;
    };
    for (const auto& o : option_table()) {
        groups[o.category].push_back(&o);
        width = std::max(width, label(o).size());
    }

    os << "Usage: " << prog << " [command] [options]\n\n";
    os << "Commands:\n";
    os << "  install     Install the control script or register the service\n";
    os << "  uninstall   Stop if running, then remove the service (alias: remove)\n";
    os << "  start       Start the service in the background\n";
    os << "  stop        Stop the running service\n";
    os << "  restart     Stop if running, then start\n";
    os << "  status      Print the service state\n";
    os << "  run         Run in the foreground (default)\n\n";
    for (const char* cat : {"General", "Service", "Termination", "Logging"}) {
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << label(*o) << o->desc
               << "\n";
        os << "\n";
    }
}

} // namespace svckit
