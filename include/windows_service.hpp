#ifndef WINDOWS_SERVICE_HPP
#define WINDOWS_SERVICE_HPP

#include <string>
#include "host_managed_strategy.hpp"

#ifdef _WIN32
#include <windows.h>

namespace winservice {

/**
 * @brief ServiceHost backed by the Windows service-control manager.
 *
 * Registration creates an own-process service whose binary path is the
 * launch command line. The service starts automatically at boot when the
 * descriptor asks for auto-start, on demand otherwise.
 */
class ScmHost : public svckit::ServiceHost {
  public:
    bool is_registered(const std::string& name) const override;
    svckit::Status register_service(const svckit::ServiceDescriptor& descriptor,
                                    const std::string& command_line) override;
    svckit::Status unregister_service(const std::string& name) override;
    bool is_active(const std::string& name) const override;
    long active_pid(const std::string& name) const override;
    svckit::Status start_service(const std::string& name) override;
    svckit::Status stop_service(const std::string& name) override;
    svckit::Status run_dispatcher(const std::string& name, std::function<void()> service_main,
                                  std::function<void()> on_stop) override;
    void report_status(svckit::HostStatus status) override;
};

void WINAPI ServiceMain(DWORD argc, LPSTR* argv);
DWORD WINAPI ServiceCtrlHandler(DWORD ctrl, DWORD type, LPVOID data, LPVOID context);

} // namespace winservice
#endif // _WIN32

#endif // WINDOWS_SERVICE_HPP
