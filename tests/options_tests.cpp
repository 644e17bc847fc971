#include <csignal>
#include <sstream>
#include <stdexcept>
#include "test_common.hpp"
#include "options.hpp"

using namespace svckit;
using svckit::test_support::TempDir;
using svckit::test_support::write_file;

namespace {
// Owns argv storage for one parse_options() call.
struct Argv {
    explicit Argv(std::vector<std::string> args) : words(std::move(args)) {
        words.insert(words.begin(), "svc");
        for (auto& w : words)
            ptrs.push_back(w.data());
    }
    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }
    std::vector<std::string> words;
    std::vector<char*> ptrs;
};

Options parse(std::vector<std::string> args) {
    Argv a(std::move(args));
    return parse_options(a.argc(), a.argv());
}
} // namespace

TEST_CASE("Verb defaults to run") {
    Options opts = parse({});
    REQUIRE(opts.verb == "run");
    REQUIRE_FALSE(opts.name);
    REQUIRE(opts.forwarded_args.empty());
    REQUIRE(opts.strategy.fork.require_superuser);
    REQUIRE(opts.strategy.fork.stale_policy == StaleRecordPolicy::Auto);
}

TEST_CASE("Every lifecycle verb is accepted") {
    for (const char* verb : {"install", "uninstall", "start", "stop", "restart", "status", "run",
                             "serve"}) {
        INFO(verb);
        REQUIRE(parse({verb}).verb == verb);
    }
    REQUIRE(parse({"remove"}).verb == "uninstall");
    REQUIRE_FALSE(is_known_verb("reload"));
}

TEST_CASE("Switches never swallow the verb") {
    Options opts = parse({"--verbose", "start"});
    REQUIRE(opts.verb == "start");
    REQUIRE(opts.logging.verbose);
    opts = parse({"-v", "--auto-start", "install", "-n", "worker"});
    REQUIRE(opts.verb == "install");
    REQUIRE(opts.auto_start.value_or(false));
    REQUIRE(opts.name.value_or("") == "worker");
}

TEST_CASE("Malformed command lines are rejected") {
    REQUIRE_THROWS_AS(parse({"launch"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse({"start", "stop"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse({"--frobnicate"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse({"-x"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse({"start", "--name"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse({"--max-attempts", "0"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse({"--max-attempts", "many"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse({"--signal", "SIGNOPE"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse({"--stale-record", "sometimes"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse({"--log-level", "loud"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse({"--auto-start=maybe"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse({"--max-log-files", "101"}), std::runtime_error);
}

TEST_CASE("Termination and logging values are parsed") {
    Options opts = parse({"stop", "--signal", "INT", "--max-attempts", "3",
                          "--poll-interval-ms", "2s", "--force-kill", "--stop-grace-ms", "250",
                          "--log-level", "debug", "--max-log-size", "2k", "--max-log-files",
                          "4", "--compress-logs", "--json-log", "--stale-record", "clear",
                          "--require-root=false"});
    const TerminationPolicy& term = opts.strategy.fork.termination;
    REQUIRE(term.signal == SIGINT);
    REQUIRE(term.max_attempts == 3);
    REQUIRE(term.poll_interval == std::chrono::milliseconds(2000));
    REQUIRE(term.force_kill);
    REQUIRE(opts.strategy.host.stop_grace == std::chrono::milliseconds(250));
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.logging.max_log_size == 2048);
    REQUIRE(opts.logging.max_log_files == 4);
    REQUIRE(opts.logging.compress_logs);
    REQUIRE(opts.logging.json_log);
    REQUIRE(opts.strategy.fork.stale_policy == StaleRecordPolicy::Clear);
    REQUIRE_FALSE(opts.strategy.fork.require_superuser);
}

TEST_CASE("Command line overrides the config file") {
    TempDir dir("options");
    fs::path cfg = dir / "svc.yaml";
    write_file(cfg, "name: from-config\n"
                    "description: configured\n"
                    "service:\n"
                    "  pid-dir: /var/tmp/pids\n"
                    "termination:\n"
                    "  max-attempts: 9\n"
                    "colour: blue\n");
    Options opts = parse({"status", "--config", cfg.string(), "--name", "from-cli"});
    REQUIRE(opts.name.value_or("") == "from-cli");
    REQUIRE(opts.description.value_or("") == "configured");
    REQUIRE(opts.strategy.fork.pid_dir == fs::path("/var/tmp/pids"));
    REQUIRE(opts.strategy.fork.termination.max_attempts == 9);
    REQUIRE(opts.config_file == fs::absolute(cfg).lexically_normal().string());
    REQUIRE(opts.ignored_config_keys == std::vector<std::string>{"colour"});
}

TEST_CASE("Unreadable config file is an error") {
    TempDir dir("options");
    REQUIRE_THROWS_AS(parse({"--config", (dir / "absent.yaml").string()}), std::runtime_error);
}

TEST_CASE("Settings are forwarded for the control script") {
    TempDir dir("options");
    fs::path cfg = dir / "svc.json";
    write_file(cfg, R"({"name": "worker"})");
    Options opts = parse({"install", "-c", cfg.string(), "--verbose", "--max-attempts", "2",
                          "--json-log=false", "--help"});
    std::vector<std::string> expected = {"--config",
                                         fs::absolute(cfg).lexically_normal().string(),
                                         "--json-log=false",
                                         "--max-attempts",
                                         "2",
                                         "--verbose"};
    REQUIRE(opts.forwarded_args == expected);
    REQUIRE(opts.show_help);
}

TEST_CASE("Relative paths are pinned before they are forwarded") {
    const std::string pids = fs::absolute("run").lexically_normal().string();
    Options opts = parse({"start", "--pid-dir", "run"});
    REQUIRE(opts.strategy.fork.pid_dir == fs::path(pids));
    REQUIRE(opts.forwarded_args == std::vector<std::string>{"--pid-dir", pids});

    opts = parse({"--log-file=logs/svc.log"});
    REQUIRE(opts.logging.log_file == fs::absolute("logs/svc.log").lexically_normal().string());

    TempDir dir("options");
    fs::path cfg = dir / "svc.yaml";
    write_file(cfg, "service:\n"
                    "  pid-dir: run\n"
                    "  script-dir: ../init.d\n"
                    "log-file: svc.log\n");
    opts = parse({"status", "--config", cfg.string()});
    REQUIRE(opts.strategy.fork.pid_dir == (dir.path() / "run").lexically_normal());
    REQUIRE(opts.strategy.fork.script_dir == (dir.path() / "../init.d").lexically_normal());
    REQUIRE(opts.logging.log_file == (dir.path() / "svc.log").lexically_normal().string());
}

TEST_CASE("apply_option_values only touches given keys") {
    Options opts;
    opts.logging.verbose = true;
    apply_option_values(opts, {{"--name", "worker"}, {"--auto-start", "false"}});
    REQUIRE(opts.name.value_or("") == "worker");
    REQUIRE(opts.auto_start.has_value());
    REQUIRE_FALSE(*opts.auto_start);
    REQUIRE(opts.logging.verbose);
    REQUIRE_FALSE(opts.description);
}

TEST_CASE("Help lists commands and options by category") {
    std::ostringstream os;
    print_help("svc", os);
    std::string text = os.str();
    REQUIRE(text.rfind("Usage: svc [command] [options]", 0) == 0);
    REQUIRE(text.find("uninstall") != std::string::npos);
    REQUIRE(text.find("Termination:") != std::string::npos);
    REQUIRE(text.find("-c, --config <file>") != std::string::npos);
    REQUIRE(text.find("--stale-record <keep|clear|auto>") != std::string::npos);
}
