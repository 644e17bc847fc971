#include <cerrno>
#include <csignal>
#include <limits>
#include <stdexcept>
#include "test_common.hpp"
#include "arg_parser.hpp"
#include "execution_strategy.hpp"
#include "parse_utils.hpp"
#include "service_error.hpp"
#include "stop_signals.hpp"
#include "time_utils.hpp"

using namespace svckit;

TEST_CASE("parse_int validates range and digits") {
    bool ok = false;
    REQUIRE(parse_int("42", 0, 100, ok) == 42);
    REQUIRE(ok);
    REQUIRE(parse_int("-5", -10, 10, ok) == -5);
    REQUIRE(ok);
    parse_int("101", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("4x", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("99999999999999999999", 0, 100, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes understands unit suffixes") {
    const size_t max = std::numeric_limits<size_t>::max();
    bool ok = false;
    REQUIRE(parse_bytes("512", 0, max, ok) == 512);
    REQUIRE(ok);
    REQUIRE(parse_bytes("4K", 0, max, ok) == 4096);
    REQUIRE(parse_bytes("3kb", 0, max, ok) == 3072);
    REQUIRE(parse_bytes("1M", 0, max, ok) == 1024 * 1024);
    REQUIRE(parse_bytes("2mb", 0, max, ok) == 2 * 1024 * 1024);
    REQUIRE(parse_bytes("10b", 0, max, ok) == 10);
    REQUIRE(ok);
    parse_bytes("1q", 0, max, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("2k", 0, 1000, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_time_ms understands ms, s and m") {
    bool ok = false;
    REQUIRE(parse_time_ms("250", ok) == std::chrono::milliseconds(250));
    REQUIRE(ok);
    REQUIRE(parse_time_ms("250ms", ok) == std::chrono::milliseconds(250));
    REQUIRE(parse_time_ms("3s", ok) == std::chrono::milliseconds(3000));
    REQUIRE(parse_time_ms("2m", ok) == std::chrono::minutes(2));
    REQUIRE(ok);
    parse_time_ms("soon", ok);
    REQUIRE_FALSE(ok);
    parse_time_ms("-1s", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool treats a bare flag as true") {
    bool ok = false;
    REQUIRE(parse_bool("", ok));
    REQUIRE(ok);
    REQUIRE(parse_bool("Yes", ok));
    REQUIRE_FALSE(parse_bool("off", ok));
    REQUIRE(ok);
    parse_bool("perhaps", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("format_duration_short omits leading zero units") {
    using std::chrono::seconds;
    REQUIRE(format_duration_short(seconds(0)) == "0s");
    REQUIRE(format_duration_short(seconds(59)) == "59s");
    REQUIRE(format_duration_short(seconds(61)) == "1m1s");
    REQUIRE(format_duration_short(seconds(3723)) == "1h2m3s");
    REQUIRE(format_duration_short(seconds(3600)) == "1h0m0s");
    REQUIRE(format_duration_short(seconds(90061)) == "1d1h1m1s");
    REQUIRE(format_duration_short(seconds(-5)) == "0s");
}

TEST_CASE("elapsed_since clamps future time points") {
    auto now = std::chrono::system_clock::now();
    REQUIRE(elapsed_since(now + std::chrono::hours(1)) == std::chrono::seconds(0));
    REQUIRE(elapsed_since(now - std::chrono::seconds(90)) >= std::chrono::seconds(90));
}

TEST_CASE("timestamp has a fixed layout") {
    std::string ts = timestamp();
    REQUIRE(ts.size() == 19);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == ' ');
    REQUIRE(ts[13] == ':');
}

TEST_CASE("ArgParser separates switches, options and positionals") {
    const char* raw[] = {"prog", "--verbose", "start", "--name=worker", "-c", "cfg.yaml",
                         "--bogus", "--", "--not-a-flag"};
    std::vector<char*> argv;
    for (const char* a : raw)
        argv.push_back(const_cast<char*>(a));
    ArgParser parser(static_cast<int>(argv.size()), argv.data(), {"--name", "--config"},
                     {"--verbose"}, {{'c', "--config"}});
    REQUIRE(parser.has_flag("--verbose"));
    REQUIRE(parser.get_option("--verbose").empty());
    REQUIRE(parser.get_option("--name") == "worker");
    REQUIRE(parser.get_option("--config") == "cfg.yaml");
    REQUIRE(parser.positional() == std::vector<std::string>{"start", "--not-a-flag"});
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"--bogus"});
    REQUIRE(parser.missing_values().empty());
}

TEST_CASE("ArgParser reports options missing their value") {
    const char* raw[] = {"prog", "--name"};
    std::vector<char*> argv;
    for (const char* a : raw)
        argv.push_back(const_cast<char*>(a));
    ArgParser parser(2, argv.data(), {"--name"}, {});
    REQUIRE_FALSE(parser.has_flag("--name"));
    REQUIRE(parser.missing_values() == std::vector<std::string>{"--name"});
}

TEST_CASE("Status describes failures") {
    Status ok;
    REQUIRE(ok);
    REQUIRE(ok.describe() == "OK");
    Status st = Status::failure(ServiceError::NotRunning, "service worker is not running");
    REQUIRE_FALSE(st);
    REQUIRE(st.describe() == "NotRunning: service worker is not running");
    REQUIRE(Status::failure(ServiceError::HostFailure, "").describe() == "HostFailure");
    Status os = os_failure(ServiceError::IOError, "open", ENOENT);
    REQUIRE(os.os_error() == ENOENT);
    REQUIRE(os.message().rfind("open: ", 0) == 0);
    REQUIRE(std::string(to_string(ServiceError::TerminationTimeout)) == "TerminationTimeout");
}

TEST_CASE("Service names must be usable as file names") {
    REQUIRE(valid_service_name("worker"));
    REQUIRE(valid_service_name("my-svc_2.0"));
    REQUIRE_FALSE(valid_service_name(""));
    REQUIRE_FALSE(valid_service_name(".."));
    REQUIRE_FALSE(valid_service_name("a/b"));
    REQUIRE_FALSE(valid_service_name("a b"));
    REQUIRE_FALSE(valid_service_name("it's"));
}

TEST_CASE("ServiceDescriptor rejects bad input") {
    auto noop = [](ServiceHandle&) {};
    REQUIRE_THROWS_AS(ServiceDescriptor("", "d", false, noop), std::invalid_argument);
    REQUIRE_THROWS_AS(ServiceDescriptor("x/y", "d", false, noop), std::invalid_argument);
    REQUIRE_THROWS_AS(ServiceDescriptor("ok", "d", false, ServiceCallback()),
                      std::invalid_argument);
    ServiceDescriptor d("worker", "desc", false, noop);
    ServiceDescriptor renamed = d.with("other", "new desc", true);
    REQUIRE(renamed.name() == "other");
    REQUIRE(renamed.description() == "new desc");
    REQUIRE(renamed.auto_start());
    REQUIRE(static_cast<bool>(renamed.callback()));
    REQUIRE(d.name() == "worker");
}

TEST_CASE("ServiceHandle::sleep_for wakes on a stop request") {
    auto token = std::make_shared<CancellationToken>();
    ServiceHandle handle(token);
    REQUIRE(handle.sleep_for(std::chrono::milliseconds(10)));
    std::thread stopper([token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token->request();
    });
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(handle.sleep_for(std::chrono::seconds(10)));
    stopper.join();
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    REQUIRE(handle.stop_requested());
}

TEST_CASE("LaunchCommand quotes what needs quoting") {
    LaunchCommand cmd;
    cmd.program = "/opt/svc/bin/worker";
    cmd.args = {"--config", "/etc/my svc.yaml", "--verbose"};
    REQUIRE(cmd.command_line("start") ==
            "\"/opt/svc/bin/worker\" start --config \"/etc/my svc.yaml\" --verbose");
    cmd.interpreter = "/usr/bin/python3";
    cmd.args.clear();
    REQUIRE(cmd.command_line("") == "\"/usr/bin/python3\" \"/opt/svc/bin/worker\"");
}

TEST_CASE("StopSignalScope turns SIGINT into a stop request") {
    auto token = std::make_shared<CancellationToken>();
    {
        StopSignalScope scope(token);
        REQUIRE(StopSignalScope::last_signal() == 0);
        std::raise(SIGINT);
        REQUIRE(token->requested());
        REQUIRE(StopSignalScope::last_signal() == SIGINT);
    }
#ifndef _WIN32
    struct sigaction current {};
    sigaction(SIGINT, nullptr, &current);
    REQUIRE(current.sa_handler != SIG_IGN);
#endif
}

TEST_CASE("procutil reports the calling process") {
    REQUIRE(procutil::current_pid() > 0);
    REQUIRE(procutil::process_alive(procutil::current_pid()));
    REQUIRE_FALSE(procutil::process_alive(0));
    REQUIRE_FALSE(procutil::process_alive(-3));
    REQUIRE(procutil::executable_path(nullptr).is_absolute());
    setenv("SVCKIT_TEST_ENV", "value", 1);
    REQUIRE(procutil::env_or_empty("SVCKIT_TEST_ENV") == "value");
    unsetenv("SVCKIT_TEST_ENV");
    REQUIRE(procutil::env_or_empty("SVCKIT_TEST_ENV").empty());
}
