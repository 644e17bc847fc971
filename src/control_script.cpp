#include "control_script.hpp"
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>
#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif
#include "logger.hpp"
#include "service_descriptor.hpp"
#include "system_utils.hpp"
#include "version.hpp"

namespace fs = std::filesystem;

namespace svckit {

namespace {

std::string single_line(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text)
        out += (c == '\n' || c == '\r') ? ' ' : c;
    return out;
}

#ifndef _WIN32
Status write_file(const fs::path& path, const std::string& content) {
    procutil::UniqueFd fd(open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0755));
    if (!fd) {
        int err = errno;
        ServiceError kind =
            (err == EACCES || err == EPERM) ? ServiceError::PermissionDenied : ServiceError::IOError;
        return os_failure(kind, "Unable to write control script `" + path.string() + "`", err);
    }
    size_t off = 0;
    while (off < content.size()) {
        ssize_t n = ::write(fd.get(), content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return os_failure(ServiceError::IOError,
                              "Unable to write control script `" + path.string() + "`", errno);
        }
        off += static_cast<size_t>(n);
    }
    return Status::success();
}
#else
Status write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return Status::failure(ServiceError::IOError,
                               "Unable to write control script `" + path.string() + "`");
    out << content;
    if (!out.flush())
        return Status::failure(ServiceError::IOError,
                               "Unable to write control script `" + path.string() + "`");
    return Status::success();
}
#endif

} // namespace

std::string shell_quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

fs::path default_script_dir() {
    std::string env = procutil::env_or_empty("SVCKIT_SCRIPT_DIR");
    if (!env.empty())
        return procutil::absolute_path(env);
    return "/etc/init.d";
}

std::string render_control_script(const ServiceDescriptor& descriptor, const ControlScript& script) {
    std::ostringstream out;
    out << "#!/bin/sh\n";
    out << "### BEGIN INIT INFO\n";
    out << "# Provides:          " << descriptor.name() << "\n";
    out << "# Required-Start:    $remote_fs $syslog\n";
    out << "# Required-Stop:     $remote_fs $syslog\n";
    out << "# Default-Start:     " << (descriptor.auto_start() ? "2 3 4 5" : "") << "\n";
    out << "# Default-Stop:      0 1 6\n";
    out << "# Short-Description: " << single_line(descriptor.description()) << "\n";
    out << "### END INIT INFO\n";
    out << "# Generated by svckit " << SVCKIT_VERSION << ". Reinstall the service to change it.\n\n";

    out << "INTERPRETER_PATH=" << shell_quote(script.interpreter_path) << "\n";
    out << "SERVICE_PATH=" << shell_quote(script.service_path) << "\n\n";

    out << "run_service() {\n    ";
    if (script.interpreter_path.empty())
        out << "\"$SERVICE_PATH\" \"$1\"";
    else
        out << "\"$INTERPRETER_PATH\" \"$SERVICE_PATH\" \"$1\"";
    for (const auto& arg : script.service_args)
        out << " " << shell_quote(arg);
    out << "\n}\n\n";

    out << "case \"$1\" in\n";
    out << "    start)\n        run_service start\n        ;;\n";
    out << "    stop)\n        run_service stop\n        ;;\n";
    out << "    restart)\n        run_service stop\n        run_service start\n        ;;\n";
    out << "    *)\n        echo \"Usage: $0 {start|stop|restart}\" >&2\n        exit 1\n        ;;\n";
    out << "esac\n";
    return out.str();
}

ControlScriptWriter::ControlScriptWriter(fs::path dir, bool require_superuser)
    : dir_(std::move(dir)), require_superuser_(require_superuser) {}

fs::path ControlScriptWriter::script_path(const std::string& name) const { return dir_ / name; }

bool ControlScriptWriter::exists(const std::string& name) const {
    std::error_code ec;
    return fs::exists(script_path(name), ec) && !ec;
}

Status ControlScriptWriter::check_privileges(const char* action) const {
    if (require_superuser_ && !procutil::is_superuser())
        return Status::failure(ServiceError::PermissionDenied,
                               std::string("Insufficient privileges to ") + action +
                                   " service, please run with administrative rights");
    return Status::success();
}

Status ControlScriptWriter::write(const ServiceDescriptor& descriptor,
                                  const std::string& interpreter_path,
                                  const std::string& service_path,
                                  const std::vector<std::string>& service_args,
                                  ControlScript& out) const {
    if (Status st = check_privileges("install"); !st)
        return st;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec))
        return Status::failure(ServiceError::IOError,
                               "Script directory `" + dir_.string() + "` does not exist");

    ControlScript script{script_path(descriptor.name()), interpreter_path, service_path,
                         service_args};
    fs::path tmp = script.path;
    tmp += ".tmp";
    if (Status st = write_file(tmp, render_control_script(descriptor, script)); !st) {
        fs::remove(tmp, ec);
        return st;
    }
    fs::permissions(tmp, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Status::failure(ServiceError::IOError,
                               "Unable to mark `" + script.path.string() +
                                   "` executable: " + ec.message(),
                               ec.value());
    }
    fs::rename(tmp, script.path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Status::failure(ServiceError::IOError,
                               "Unable to install control script `" + script.path.string() +
                                   "`: " + ec.message(),
                               ec.value());
    }
    log_info("Control script written", {{"service", descriptor.name()},
                                        {"path", script.path.string()}});
    out = std::move(script);
    return Status::success();
}

Status ControlScriptWriter::remove(const std::string& name) const {
    if (Status st = check_privileges("uninstall"); !st)
        return st;
    fs::path path = script_path(name);
    std::error_code ec;
    if (!fs::remove(path, ec) || ec) {
        std::string why = ec ? ec.message() : std::string("file does not exist");
        return Status::failure(ServiceError::IOError,
                               "Unable to uninstall, failed to remove control script `" +
                                   path.string() + "`: " + why,
                               ec.value());
    }
    log_info("Control script removed", {{"service", name}, {"path", path.string()}});
    return Status::success();
}

} // namespace svckit
