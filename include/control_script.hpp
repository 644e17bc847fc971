#ifndef CONTROL_SCRIPT_HPP
#define CONTROL_SCRIPT_HPP
#include <filesystem>
#include <string>
#include <vector>
#include "service_error.hpp"

namespace svckit {

class ServiceDescriptor;

/** Host-invocable script forwarding start/stop/restart to the program. */
struct ControlScript {
    std::filesystem::path path;
    std::string interpreter_path; ///< Empty when the service binary runs directly.
    std::string service_path;
    std::vector<std::string> service_args; ///< Appended after each verb.
};

/**
 * @brief Writes and removes the control script of one service.
 *
 * The script is a POSIX shell script with the verbs `start`, `stop` and
 * `restart`; `restart` runs stop and then start, it is not atomic. Every
 * install regenerates the whole file.
 */
class ControlScriptWriter {
  public:
    /**
     * @param dir              Directory scripts are installed into.
     * @param require_superuser Refuse to touch @p dir without superuser rights.
     */
    explicit ControlScriptWriter(std::filesystem::path dir, bool require_superuser = true);

    /** @return `<dir>/<name>`. */
    std::filesystem::path script_path(const std::string& name) const;

    bool exists(const std::string& name) const;

    /**
     * @brief Generate and install the script for @p descriptor.
     *
     * @param out Receives the installed script on success.
     * @return PermissionDenied without the required rights, IOError when the
     *         directory is missing or the file cannot be written.
     */
    Status write(const ServiceDescriptor& descriptor, const std::string& interpreter_path,
                 const std::string& service_path, const std::vector<std::string>& service_args,
                 ControlScript& out) const;

    /** Delete the script of @p name. Failures are reported, never retried. */
    Status remove(const std::string& name) const;

    const std::filesystem::path& directory() const { return dir_; }

  private:
    Status check_privileges(const char* action) const;

    std::filesystem::path dir_;
    bool require_superuser_;
};

/** Render the script text without touching the filesystem. */
std::string render_control_script(const ServiceDescriptor& descriptor, const ControlScript& script);

/** Quote @p value for a POSIX shell so it is never expanded. */
std::string shell_quote(const std::string& value);

/** `$SVCKIT_SCRIPT_DIR` when set, otherwise `/etc/init.d`. */
std::filesystem::path default_script_dir();

} // namespace svckit

#endif // CONTROL_SCRIPT_HPP
