#include <csignal>
#include <map>
#include <sstream>
#include <stdexcept>
#include "test_common.hpp"
#include "fork_strategy.hpp"
#include "lifecycle_controller.hpp"

using namespace svckit;
using svckit::test_support::make_descriptor;
using svckit::test_support::read_file;
using svckit::test_support::TempDir;
using svckit::test_support::wait_until;
using svckit::test_support::write_file;

namespace {
// Liveness record kept in memory, for exercising the exit guard in-process.
class MemoryStore : public LivenessStore {
  public:
    Status write(long pid) override {
        pid_ = pid;
        return Status::success();
    }
    Status read(long& pid) const override {
        if (pid_ == 0)
            return Status::failure(ServiceError::NotRunning, "no record");
        pid = pid_;
        return Status::success();
    }
    bool exists() const override { return pid_ != 0; }
    Status remove() override {
        pid_ = 0;
        return Status::success();
    }
    std::string location() const override { return "memory"; }

  private:
    long pid_ = 0;
};

ServiceDescriptor descriptor_with(const std::string& name, bool auto_start,
                                  ServiceCallback callback) {
    return ServiceDescriptor(name, "lifecycle test", auto_start, std::move(callback));
}
} // namespace

TEST_CASE("describe_state renders every state") {
    ServiceState s;
    REQUIRE(describe_state(s) == "not installed");
    s.installed = true;
    REQUIRE(describe_state(s) == "stopped");
    s.running = true;
    REQUIRE(describe_state(s) == "running");
    s.pid = 77;
    REQUIRE(describe_state(s) == "running (pid 77)");
    s.since = std::chrono::system_clock::now() - std::chrono::seconds(3723);
    std::string text = describe_state(s);
    REQUIRE(text.rfind("running (pid 77, up 1h2m", 0) == 0);
    s.stale = true;
    REQUIRE(describe_state(s) == "stale (pid 77)");
    s.pid = 0;
    REQUIRE(describe_state(s) == "stale (corrupt record)");
}

TEST_CASE("Stale record policies parse") {
    REQUIRE(parse_stale_policy("keep") == StaleRecordPolicy::Keep);
    REQUIRE(parse_stale_policy("clear") == StaleRecordPolicy::Clear);
    REQUIRE(parse_stale_policy("auto") == StaleRecordPolicy::Auto);
    REQUIRE_THROWS_AS(parse_stale_policy("Keep"), std::invalid_argument);
    REQUIRE(std::string(to_string(StaleRecordPolicy::Clear)) == "clear");
}

TEST_CASE("DaemonExitGuard classifies the end of a daemon") {
    MemoryStore store;
    int restarts = 0;
    RestartHook restart = [&restarts](const ServiceDescriptor&) { ++restarts; };
    ServiceDescriptor plain = make_descriptor("guarded");
    ServiceDescriptor autostart = make_descriptor("guarded", true);
    const long self = procutil::current_pid();

    SECTION("record removed by a stop request") {
        DaemonExitGuard guard(store, autostart, restart);
        guard.mark_signalled(SIGTERM);
        REQUIRE(guard.finish() == DaemonExit::Stopped);
        REQUIRE(restarts == 0);
    }
    SECTION("record taken over by another process") {
        REQUIRE(store.write(self + 1));
        DaemonExitGuard guard(store, autostart, restart);
        REQUIRE(guard.finish() == DaemonExit::Stopped);
        REQUIRE(store.exists());
        REQUIRE(restarts == 0);
    }
    SECTION("callback returned on its own") {
        REQUIRE(store.write(self));
        DaemonExitGuard guard(store, autostart, restart);
        guard.mark_returned();
        REQUIRE(guard.finish() == DaemonExit::Completed);
        REQUIRE_FALSE(store.exists());
        REQUIRE(restarts == 0);
    }
    SECTION("foreign signal restarts an auto-start service") {
        REQUIRE(store.write(self));
        DaemonExitGuard guard(store, autostart, restart);
        guard.mark_returned();
        guard.mark_signalled(SIGTERM);
        REQUIRE(guard.finish() == DaemonExit::Abnormal);
        REQUIRE(guard.finish() == DaemonExit::Abnormal);
        REQUIRE_FALSE(store.exists());
        REQUIRE(restarts == 1);
    }
    SECTION("crash without auto-start only clears the record") {
        REQUIRE(store.write(self));
        DaemonExitGuard guard(store, plain, restart);
        REQUIRE(guard.finish() == DaemonExit::Abnormal);
        REQUIRE_FALSE(store.exists());
        REQUIRE(restarts == 0);
    }
    SECTION("destructor classifies when finish was never called") {
        REQUIRE(store.write(self));
        { DaemonExitGuard guard(store, autostart, restart); }
        REQUIRE_FALSE(store.exists());
        REQUIRE(restarts == 1);
    }
}

#ifndef _WIN32
namespace {
// Hooks leave marker files behind so the launcher can see what the daemon did.
class MarkerHooks : public LifecycleHooks {
  public:
    explicit MarkerHooks(fs::path dir) : dir_(std::move(dir)) {}
    void on_started(const ServiceDescriptor& d) override { mark("started", d); }
    void on_stopped(const ServiceDescriptor& d) override { mark("stopped", d); }
    void on_installed(const ServiceDescriptor& d) override { mark("installed", d); }
    void on_uninstalled(const ServiceDescriptor& d) override { mark("uninstalled", d); }
    bool seen(const std::string& what) const { return fs::exists(dir_ / what); }

  private:
    void mark(const std::string& what, const ServiceDescriptor& d) {
        write_file(dir_ / what, d.name() + " " + std::to_string(procutil::current_pid()));
    }
    fs::path dir_;
};

struct ForkFixture {
    ForkFixture() : hooks(dir.path()) {
        options.pid_dir = dir / "run";
        options.script_dir = dir / "init.d";
        fs::create_directories(options.script_dir);
        options.require_superuser = false;
        options.termination.max_attempts = 40;
        options.termination.poll_interval = std::chrono::milliseconds(50);
        options.restart_delay = std::chrono::milliseconds(0);
        launch.program = "/usr/local/bin/worker";
        launch.args = {"--verbose"};
    }

    std::unique_ptr<LifecycleController> controller(ServiceDescriptor desc,
                                                    RestartHook restart = RestartHook()) {
        auto strategy = std::make_unique<ForkStrategy>(options);
        strategy->set_restart_hook(std::move(restart));
        return std::make_unique<LifecycleController>(std::move(desc), std::move(strategy), hooks,
                                                     out);
    }

    fs::path pid_file(const std::string& name) const { return options.pid_dir / (name + ".pid"); }

    long recorded_pid(const std::string& name) const {
        long pid = 0;
        if (!parse_pid(read_file(pid_file(name)), pid))
            return 0;
        return pid;
    }

    // Pid of a process that already exited.
    static long dead_pid() {
        pid_t pid = svckit::test_support::spawn_sleeper();
        svckit::test_support::reap(pid);
        return pid;
    }

    TempDir dir{"lifecycle"};
    MarkerHooks hooks;
    ForkOptions options;
    LaunchCommand launch;
    std::ostringstream out;
};

// Stops a daemon a failed assertion left behind.
struct DaemonReaper {
    explicit DaemonReaper(const ForkFixture& f, std::string name) : f(f), name(std::move(name)) {}
    ~DaemonReaper() {
        long pid = f.recorded_pid(name);
        if (pid > 0 && pid != procutil::current_pid())
            kill(static_cast<pid_t>(pid), SIGKILL);
    }
    const ForkFixture& f;
    std::string name;
};

// Runs the enclosing scope with @p dir as the working directory.
struct WorkingDir {
    explicit WorkingDir(const fs::path& dir) : saved(fs::current_path()) { fs::current_path(dir); }
    ~WorkingDir() {
        std::error_code ec;
        fs::current_path(saved, ec);
    }
    fs::path saved;
};
} // namespace

TEST_CASE("Relative directories resolve against the launcher's working directory") {
    ForkFixture f;
    WorkingDir cwd(f.dir.path());
    f.options.pid_dir = "run";
    f.options.script_dir = "init.d";
    auto ctl = f.controller(make_descriptor("worker"));
    f.options.pid_dir = f.dir / "run";
    DaemonReaper reaper(f, "worker");

    REQUIRE(ctl->install(f.launch));
    REQUIRE(fs::exists(f.dir / "init.d" / "worker"));
    REQUIRE(ctl->start());
    REQUIRE(fs::exists(f.dir / "run" / "worker.pid"));
    long pid = f.recorded_pid("worker");
    REQUIRE(pid > 0);
    REQUIRE(ctl->is_running());

    REQUIRE(ctl->stop());
    REQUIRE_FALSE(procutil::process_alive(pid));
    REQUIRE_FALSE(fs::exists(f.dir / "run" / "worker.pid"));
    REQUIRE(ctl->uninstall());
}

TEST_CASE("Start before install is refused and leaves no PID record") {
    ForkFixture f;
    auto ctl = f.controller(make_descriptor("worker"));
    Status st = ctl->start();
    REQUIRE(st.code() == ServiceError::NotInstalled);
    REQUIRE_FALSE(fs::exists(f.pid_file("worker")));
    REQUIRE(f.out.str() == "* Service 'worker' is not installed\n");
    f.out.str("");
    REQUIRE(ctl->stop().code() == ServiceError::NotRunning);
    REQUIRE(f.out.str() == "* Service 'worker' is not running\n");
    f.out.str("");
    REQUIRE(ctl->uninstall().code() == ServiceError::NotInstalled);
    REQUIRE(f.out.str() == "* Service 'worker' is not installed\n");
}

TEST_CASE("Service goes through install, start, stop and uninstall") {
    ForkFixture f;
    auto ctl = f.controller(make_descriptor("worker"));
    DaemonReaper reaper(f, "worker");

    REQUIRE(ctl->install(f.launch));
    REQUIRE(ctl->is_installed());
    REQUIRE(f.hooks.seen("installed"));
    fs::path script = f.options.script_dir / "worker";
    REQUIRE(fs::exists(script));
    REQUIRE((fs::status(script).permissions() & fs::perms::owner_exec) != fs::perms::none);
    REQUIRE(ctl->install(f.launch).code() == ServiceError::AlreadyInstalled);
    REQUIRE(f.out.str().find("* Installing worker") == f.out.str().rfind("* Installing worker"));
    REQUIRE(describe_state(ctl->status()) == "stopped");

    REQUIRE(ctl->start());
    long pid = f.recorded_pid("worker");
    REQUIRE(pid > 0);
    REQUIRE(pid != procutil::current_pid());
    REQUIRE(procutil::process_alive(pid));
    REQUIRE(ctl->is_running());
    REQUIRE(wait_until([&] { return f.hooks.seen("started"); }));
    REQUIRE(read_file(f.dir / "started") == "worker " + std::to_string(pid));
    REQUIRE(describe_state(ctl->status()).rfind("running (pid " + std::to_string(pid) + ", up ",
                                                0) == 0);

    REQUIRE(ctl->start().code() == ServiceError::AlreadyRunning);
    REQUIRE(f.recorded_pid("worker") == pid);

    REQUIRE(ctl->stop());
    REQUIRE_FALSE(fs::exists(f.pid_file("worker")));
    REQUIRE_FALSE(procutil::process_alive(pid));
    REQUIRE(wait_until([&] { return f.hooks.seen("stopped"); }));
    REQUIRE(ctl->stop().code() == ServiceError::NotRunning);

    REQUIRE(ctl->uninstall());
    REQUIRE_FALSE(fs::exists(script));
    REQUIRE(f.hooks.seen("uninstalled"));

    const std::string log = f.out.str();
    for (const char* line : {"* Installing worker", "* Installed", "* Starting worker",
                             "* Started", "* Stopping worker", "* Stopped",
                             "* Uninstalling worker", "* Uninstalled"}) {
        INFO(line);
        REQUIRE(log.find(line) != std::string::npos);
    }
}

TEST_CASE("Uninstall stops a running service first") {
    ForkFixture f;
    auto ctl = f.controller(make_descriptor("worker"));
    DaemonReaper reaper(f, "worker");
    REQUIRE(ctl->install(f.launch));
    REQUIRE(ctl->start());
    long pid = f.recorded_pid("worker");
    REQUIRE(ctl->uninstall());
    REQUIRE_FALSE(ctl->is_running());
    REQUIRE_FALSE(ctl->is_installed());
    REQUIRE_FALSE(procutil::process_alive(pid));
}

TEST_CASE("Restart replaces the daemon") {
    ForkFixture f;
    auto ctl = f.controller(make_descriptor("worker"));
    DaemonReaper reaper(f, "worker");
    REQUIRE(ctl->install(f.launch));
    REQUIRE(ctl->restart());
    long first = f.recorded_pid("worker");
    REQUIRE(first > 0);
    REQUIRE(ctl->restart());
    long second = f.recorded_pid("worker");
    REQUIRE(second > 0);
    REQUIRE(second != first);
    REQUIRE_FALSE(procutil::process_alive(first));
    REQUIRE(ctl->stop());
}

TEST_CASE("A callback that returns removes its own record") {
    ForkFixture f;
    auto ctl = f.controller(descriptor_with("oneshot", true, [](ServiceHandle&) {}),
                            [](const ServiceDescriptor&) {});
    REQUIRE(ctl->install(f.launch));
    REQUIRE(ctl->start());
    REQUIRE(wait_until([&] { return !fs::exists(f.pid_file("oneshot")); }));
    REQUIRE(wait_until([&] { return f.hooks.seen("stopped"); }));
    REQUIRE(describe_state(ctl->status()) == "stopped");
}

TEST_CASE("A crashing auto-start service is handed to the restart hook") {
    ForkFixture f;
    fs::path marker = f.dir / "restarted";
    auto ctl = f.controller(
        descriptor_with("crasher", true,
                        [](ServiceHandle&) { throw std::runtime_error("lost the database"); }),
        [marker](const ServiceDescriptor& d) { write_file(marker, d.name()); });
    REQUIRE(ctl->install(f.launch));
    REQUIRE(ctl->start());
    REQUIRE(wait_until([&] { return fs::exists(marker); }));
    REQUIRE(read_file(marker) == "crasher");
    REQUIRE_FALSE(fs::exists(f.pid_file("crasher")));
}

TEST_CASE("A crash without auto-start is not restarted") {
    ForkFixture f;
    fs::path marker = f.dir / "restarted";
    auto ctl = f.controller(
        descriptor_with("crasher", false,
                        [](ServiceHandle&) { throw std::runtime_error("lost the database"); }),
        [marker](const ServiceDescriptor& d) { write_file(marker, d.name()); });
    REQUIRE(ctl->install(f.launch));
    REQUIRE(ctl->start());
    REQUIRE(wait_until([&] { return f.hooks.seen("stopped"); }));
    REQUIRE(wait_until([&] { return !fs::exists(f.pid_file("crasher")); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE_FALSE(fs::exists(marker));
}

TEST_CASE("A signal that bypassed stop counts as abnormal") {
    ForkFixture f;
    fs::path marker = f.dir / "restarted";
    auto ctl = f.controller(make_descriptor("worker", true),
                            [marker](const ServiceDescriptor& d) { write_file(marker, d.name()); });
    DaemonReaper reaper(f, "worker");
    REQUIRE(ctl->install(f.launch));
    REQUIRE(ctl->start());
    long pid = f.recorded_pid("worker");
    REQUIRE(kill(static_cast<pid_t>(pid), SIGTERM) == 0);
    REQUIRE(wait_until([&] { return fs::exists(marker); }));
    REQUIRE_FALSE(fs::exists(f.pid_file("worker")));
    REQUIRE(wait_until([&] { return !procutil::process_alive(pid); }));
}

TEST_CASE("A requested stop of an auto-start service is not restarted") {
    ForkFixture f;
    fs::path marker = f.dir / "restarted";
    auto ctl = f.controller(make_descriptor("worker", true),
                            [marker](const ServiceDescriptor& d) { write_file(marker, d.name()); });
    DaemonReaper reaper(f, "worker");
    REQUIRE(ctl->install(f.launch));
    REQUIRE(ctl->start());
    REQUIRE(ctl->stop());
    REQUIRE(wait_until([&] { return f.hooks.seen("stopped"); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE_FALSE(fs::exists(marker));
}

TEST_CASE("A stop that times out keeps the record removed") {
    ForkFixture f;
    f.options.termination.max_attempts = 2;
    f.options.termination.poll_interval = std::chrono::milliseconds(20);
    auto ctl = f.controller(descriptor_with("stubborn", false, [](ServiceHandle&) {
        for (;;)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }));
    REQUIRE(ctl->install(f.launch));
    REQUIRE(ctl->start());
    long pid = f.recorded_pid("stubborn");
    Status st = ctl->stop();
    REQUIRE(st.code() == ServiceError::TerminationTimeout);
    REQUIRE_FALSE(fs::exists(f.pid_file("stubborn")));
    REQUIRE(procutil::process_alive(pid));
    REQUIRE(describe_state(ctl->status()) == "stopped");
    kill(static_cast<pid_t>(pid), SIGKILL);
    REQUIRE(wait_until([&] { return !procutil::process_alive(pid); }));
}

TEST_CASE("Stale records follow the configured policy") {
    ForkFixture f;
    const long dead = ForkFixture::dead_pid();

    SECTION("keep refuses to start") {
        f.options.stale_policy = StaleRecordPolicy::Keep;
        auto ctl = f.controller(make_descriptor("worker", true));
        REQUIRE(ctl->install(f.launch));
        fs::create_directories(f.options.pid_dir);
        write_file(f.pid_file("worker"), std::to_string(dead) + "\n");
        REQUIRE(describe_state(ctl->status()) == "stale (pid " + std::to_string(dead) + ")");
        Status st = ctl->start();
        REQUIRE(st.code() == ServiceError::AlreadyRunning);
        REQUIRE(st.message().find("stale PID record") != std::string::npos);
        REQUIRE(f.recorded_pid("worker") == dead);
    }
    SECTION("clear removes the record and starts") {
        f.options.stale_policy = StaleRecordPolicy::Clear;
        auto ctl = f.controller(make_descriptor("worker"));
        DaemonReaper reaper(f, "worker");
        REQUIRE(ctl->install(f.launch));
        fs::create_directories(f.options.pid_dir);
        write_file(f.pid_file("worker"), std::to_string(dead) + "\n");
        REQUIRE(ctl->start());
        long pid = f.recorded_pid("worker");
        REQUIRE(pid != dead);
        REQUIRE(procutil::process_alive(pid));
        REQUIRE(ctl->stop());
    }
    SECTION("auto keeps the record of a manual service") {
        auto ctl = f.controller(make_descriptor("worker", false));
        REQUIRE(ctl->install(f.launch));
        fs::create_directories(f.options.pid_dir);
        write_file(f.pid_file("worker"), std::to_string(dead) + "\n");
        REQUIRE(ctl->start().code() == ServiceError::AlreadyRunning);
    }
    SECTION("auto clears the record of an auto-start service") {
        auto ctl = f.controller(make_descriptor("worker", true));
        DaemonReaper reaper(f, "worker");
        REQUIRE(ctl->install(f.launch));
        fs::create_directories(f.options.pid_dir);
        write_file(f.pid_file("worker"), "garbage\n");
        REQUIRE(describe_state(ctl->status()) == "stale (corrupt record)");
        REQUIRE(ctl->start());
        REQUIRE(f.recorded_pid("worker") > 0);
        REQUIRE(ctl->stop());
    }
}

TEST_CASE("Stopping with a corrupt record removes it") {
    ForkFixture f;
    auto ctl = f.controller(make_descriptor("worker"));
    REQUIRE(ctl->install(f.launch));
    fs::create_directories(f.options.pid_dir);
    write_file(f.pid_file("worker"), "-12\n");
    Status st = ctl->stop();
    REQUIRE(st.code() == ServiceError::CorruptState);
    REQUIRE_FALSE(fs::exists(f.pid_file("worker")));
}

TEST_CASE("Foreground run turns SIGTERM into a stop request") {
    ForkFixture f;
    auto saw_stop = std::make_shared<bool>(false);
    auto ctl = f.controller(descriptor_with("fg", false, [saw_stop](ServiceHandle& h) {
        std::raise(SIGTERM);
        *saw_stop = h.stop_requested();
    }));
    REQUIRE(ctl->run());
    REQUIRE(*saw_stop);
    REQUIRE_FALSE(fs::exists(f.pid_file("fg")));
    // Hooks belong to managed runs only.
    REQUIRE_FALSE(f.hooks.seen("started"));
}

TEST_CASE("Foreground run lets callback exceptions through") {
    ForkFixture f;
    auto ctl = f.controller(descriptor_with(
        "fg", false, [](ServiceHandle&) { throw std::runtime_error("bad input"); }));
    REQUIRE_THROWS_AS(ctl->run(), std::runtime_error);
}
#endif
