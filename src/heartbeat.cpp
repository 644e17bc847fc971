/**
 * @file heartbeat.cpp
 * @brief Sample service that logs a heartbeat at a fixed interval.
 *
 * `heartbeat install`, `heartbeat start`, `heartbeat status`,
 * `heartbeat stop` and `heartbeat uninstall` drive the full lifecycle;
 * plain `heartbeat` runs it in the foreground until Ctrl-C.
 */

#include <chrono>
#include <string>

#include "cli_commands.hpp"
#include "logger.hpp"

namespace {

class HeartbeatHooks : public svckit::LifecycleHooks {
  public:
    void on_started(const svckit::ServiceDescriptor& d) override {
        svckit::log_info("heartbeat service up", {{"service", d.name()}});
    }
    void on_stopped(const svckit::ServiceDescriptor& d) override {
        svckit::log_info("heartbeat service down", {{"service", d.name()}});
    }
};

void beat(svckit::ServiceHandle& handle) {
    unsigned long count = 0;
    do {
        svckit::log_info("heartbeat", {{"count", std::to_string(++count)}});
    } while (handle.sleep_for(std::chrono::seconds(5)));
}

} // namespace

int main(int argc, char* argv[]) {
    svckit::ServiceDescriptor descriptor("heartbeat", "Logs a heartbeat every five seconds", false,
                                         beat);
    HeartbeatHooks hooks;
    return svckit::run_cli(argc, argv, descriptor, hooks);
}
