#include "cli_commands.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <utility>

#include "logger.hpp"
#include "platform_strategy.hpp"
#include "system_utils.hpp"
#include "version.hpp"

namespace cli {

void setup_logging(const svckit::LoggingOptions& opts) {
    svckit::set_log_level(opts.log_level);
    svckit::set_json_logging(opts.json_log);
    svckit::set_log_compression(opts.compress_logs);
    svckit::set_console_logging(opts.verbose);
    if (!opts.log_file.empty())
        svckit::init_logger(opts.log_file, opts.log_level, opts.max_log_size, opts.max_log_files);
    if (opts.use_syslog)
        svckit::init_syslog(opts.syslog_facility);
}

svckit::ServiceDescriptor resolve_descriptor(const svckit::ServiceDescriptor& base,
                                             const svckit::Options& opts) {
    return base.with(opts.name.value_or(base.name()), opts.description.value_or(base.description()),
                     opts.auto_start.value_or(base.auto_start()));
}

int dispatch_verb(const std::string& verb, svckit::LifecycleController& controller,
                  const svckit::LaunchCommand& launch, std::ostream& out) {
    svckit::Status st;
    if (verb == "install") {
        st = controller.install(launch);
    } else if (verb == "uninstall" || verb == "remove") {
        st = controller.uninstall();
    } else if (verb == "start") {
        st = controller.start();
    } else if (verb == "stop") {
        st = controller.stop();
    } else if (verb == "restart") {
        st = controller.restart();
    } else if (verb == "status") {
        out << svckit::describe_state(controller.status()) << std::endl;
    } else if (verb == "serve") {
        st = controller.host_run();
    } else if (verb == "run") {
        st = controller.run();
    } else {
        out << "* Unknown command: " << verb << std::endl;
        return 1;
    }
    return st ? 0 : 1;
}

} // namespace cli

namespace svckit {

int run_cli(int argc, char* argv[], const ServiceDescriptor& descriptor, LifecycleHooks& hooks) {
    Options opts;
    try {
        opts = parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    const char* prog = argc > 0 ? argv[0] : descriptor.name().c_str();
    if (opts.show_help) {
        print_help(prog, std::cout);
        return 0;
    }
    if (opts.show_version) {
        std::cout << descriptor.name() << " (svckit " << SVCKIT_VERSION << ")\n";
        return 0;
    }

    int rc = 1;
    try {
        cli::setup_logging(opts.logging);
        for (const auto& key : opts.ignored_config_keys)
            log_warning("Ignoring unknown config key", {{"key", key}, {"file", opts.config_file}});

        ServiceDescriptor resolved = cli::resolve_descriptor(descriptor, opts);
        LaunchCommand launch{"", procutil::executable_path(argc > 0 ? argv[0] : nullptr).string(),
                             opts.forwarded_args};
        opts.strategy.fork.relaunch = launch;
        LifecycleController controller(std::move(resolved),
                                       make_platform_strategy(opts.strategy), hooks, std::cout);
        rc = cli::dispatch_verb(opts.verb, controller, launch, std::cout);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        log_error(e.what());
        rc = 1;
    }
    shutdown_logger();
    return rc;
}

int run_cli(int argc, char* argv[], const ServiceDescriptor& descriptor) {
    LifecycleHooks hooks;
    return run_cli(argc, argv, descriptor, hooks);
}

} // namespace svckit
