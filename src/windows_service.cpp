#include "windows_service.hpp"

#ifdef _WIN32
#include <windows.h>
#include <utility>
#include <vector>
#include "logger.hpp"
#include "system_utils.hpp"

using svckit::HostStatus;
using svckit::ServiceError;
using svckit::Status;

namespace winservice {

namespace {
SERVICE_STATUS_HANDLE g_status_handle = nullptr;
SERVICE_STATUS g_status{};
std::string g_name;
std::function<void()> g_service_main;
std::function<void()> g_on_stop;

Status scm_failure(const std::string& what) {
    DWORD err = GetLastError();
    if (err == ERROR_ACCESS_DENIED)
        return Status::failure(ServiceError::PermissionDenied,
                               what + ": access denied, please run with administrative rights",
                               static_cast<int>(err));
    return Status::failure(ServiceError::HostFailure,
                           what + " (error " + std::to_string(err) + ")", static_cast<int>(err));
}

procutil::UniqueServiceHandle open_manager(DWORD access) {
    return procutil::UniqueServiceHandle(OpenSCManagerA(nullptr, nullptr, access));
}

bool query_status(const std::string& name, SERVICE_STATUS_PROCESS& out) {
    auto scm = open_manager(SC_MANAGER_CONNECT);
    if (!scm)
        return false;
    procutil::UniqueServiceHandle svc(OpenServiceA(scm.get(), name.c_str(), SERVICE_QUERY_STATUS));
    if (!svc)
        return false;
    DWORD needed = 0;
    return QueryServiceStatusEx(svc.get(), SC_STATUS_PROCESS_INFO, reinterpret_cast<LPBYTE>(&out),
                                sizeof(out), &needed) != 0;
}

DWORD to_native(HostStatus status) {
    switch (status) {
    case HostStatus::StartPending:
        return SERVICE_START_PENDING;
    case HostStatus::Running:
        return SERVICE_RUNNING;
    case HostStatus::StopPending:
        return SERVICE_STOP_PENDING;
    case HostStatus::Stopped:
        return SERVICE_STOPPED;
    }
    return SERVICE_STOPPED;
}
} // namespace

DWORD WINAPI ServiceCtrlHandler(DWORD ctrl, DWORD, LPVOID, LPVOID) {
    switch (ctrl) {
    case SERVICE_CONTROL_STOP:
    case SERVICE_CONTROL_SHUTDOWN:
        if (g_on_stop)
            g_on_stop();
        return NO_ERROR;
    case SERVICE_CONTROL_INTERROGATE:
        return NO_ERROR;
    default:
        return ERROR_CALL_NOT_IMPLEMENTED;
    }
}

void WINAPI ServiceMain(DWORD, LPSTR*) {
    g_status_handle = RegisterServiceCtrlHandlerExA(g_name.c_str(), ServiceCtrlHandler, nullptr);
    if (!g_status_handle) {
        svckit::log_error("RegisterServiceCtrlHandlerEx failed",
                          {{"service", g_name}, {"error", std::to_string(GetLastError())}});
        return;
    }
    g_status.dwServiceType = SERVICE_WIN32_OWN_PROCESS;
    g_status.dwControlsAccepted = SERVICE_ACCEPT_STOP | SERVICE_ACCEPT_SHUTDOWN;
    if (g_service_main)
        g_service_main();
}

void ScmHost::report_status(HostStatus status) {
    if (!g_status_handle)
        return;
    g_status.dwCurrentState = to_native(status);
    g_status.dwWaitHint = status == HostStatus::StartPending || status == HostStatus::StopPending
                              ? 10000
                              : 0;
    if (status == HostStatus::StartPending || status == HostStatus::StopPending)
        ++g_status.dwCheckPoint;
    else
        g_status.dwCheckPoint = 0;
    if (!SetServiceStatus(g_status_handle, &g_status))
        svckit::log_warning("SetServiceStatus failed",
                            {{"state", svckit::to_string(status)},
                             {"error", std::to_string(GetLastError())}});
}

Status ScmHost::run_dispatcher(const std::string& name, std::function<void()> service_main,
                               std::function<void()> on_stop) {
    g_name = name;
    g_service_main = std::move(service_main);
    g_on_stop = std::move(on_stop);
    std::vector<char> name_buf(name.begin(), name.end());
    name_buf.push_back('\0');
    SERVICE_TABLE_ENTRYA table[] = {{name_buf.data(), ServiceMain}, {nullptr, nullptr}};
    if (!StartServiceCtrlDispatcherA(table))
        return scm_failure("Unable to connect to the service control manager");
    return Status::success();
}

bool ScmHost::is_registered(const std::string& name) const {
    auto scm = open_manager(SC_MANAGER_CONNECT);
    if (!scm)
        return false;
    procutil::UniqueServiceHandle svc(OpenServiceA(scm.get(), name.c_str(), SERVICE_QUERY_STATUS));
    return static_cast<bool>(svc);
}

Status ScmHost::register_service(const svckit::ServiceDescriptor& descriptor,
                                 const std::string& command_line) {
    auto scm = open_manager(SC_MANAGER_CREATE_SERVICE);
    if (!scm)
        return scm_failure("Unable to open the service control manager");
    procutil::UniqueServiceHandle svc(CreateServiceA(
        scm.get(), descriptor.name().c_str(), descriptor.name().c_str(), SERVICE_ALL_ACCESS,
        SERVICE_WIN32_OWN_PROCESS, descriptor.auto_start() ? SERVICE_AUTO_START : SERVICE_DEMAND_START,
        SERVICE_ERROR_NORMAL, command_line.c_str(), nullptr, nullptr, nullptr, nullptr, nullptr));
    if (!svc) {
        if (GetLastError() == ERROR_SERVICE_EXISTS)
            return Status::failure(ServiceError::AlreadyInstalled,
                                   "Service '" + descriptor.name() + "' is already installed");
        return scm_failure("Unable to create service '" + descriptor.name() + "'");
    }
    if (!descriptor.description().empty()) {
        std::vector<char> text(descriptor.description().begin(), descriptor.description().end());
        text.push_back('\0');
        SERVICE_DESCRIPTIONA desc{text.data()};
        if (!ChangeServiceConfig2A(svc.get(), SERVICE_CONFIG_DESCRIPTION, &desc))
            svckit::log_warning("Unable to set service description",
                                {{"service", descriptor.name()},
                                 {"error", std::to_string(GetLastError())}});
    }
    return Status::success();
}

Status ScmHost::unregister_service(const std::string& name) {
    auto scm = open_manager(SC_MANAGER_CONNECT);
    if (!scm)
        return scm_failure("Unable to open the service control manager");
    procutil::UniqueServiceHandle svc(OpenServiceA(scm.get(), name.c_str(), DELETE));
    if (!svc)
        return scm_failure("Unable to open service '" + name + "'");
    if (!DeleteService(svc.get()))
        return scm_failure("Unable to delete service '" + name + "'");
    return Status::success();
}

bool ScmHost::is_active(const std::string& name) const {
    SERVICE_STATUS_PROCESS st{};
    if (!query_status(name, st))
        return false;
    return st.dwCurrentState != SERVICE_STOPPED;
}

long ScmHost::active_pid(const std::string& name) const {
    SERVICE_STATUS_PROCESS st{};
    if (!query_status(name, st))
        return 0;
    return static_cast<long>(st.dwProcessId);
}

Status ScmHost::start_service(const std::string& name) {
    auto scm = open_manager(SC_MANAGER_CONNECT);
    if (!scm)
        return scm_failure("Unable to open the service control manager");
    procutil::UniqueServiceHandle svc(OpenServiceA(scm.get(), name.c_str(), SERVICE_START));
    if (!svc)
        return scm_failure("Unable to open service '" + name + "'");
    if (!StartServiceA(svc.get(), 0, nullptr)) {
        if (GetLastError() == ERROR_SERVICE_ALREADY_RUNNING)
            return Status::failure(ServiceError::AlreadyRunning,
                                   "Service '" + name + "' is already running");
        return scm_failure("Unable to start service '" + name + "'");
    }
    return Status::success();
}

Status ScmHost::stop_service(const std::string& name) {
    auto scm = open_manager(SC_MANAGER_CONNECT);
    if (!scm)
        return scm_failure("Unable to open the service control manager");
    procutil::UniqueServiceHandle svc(
        OpenServiceA(scm.get(), name.c_str(), SERVICE_STOP | SERVICE_QUERY_STATUS));
    if (!svc)
        return scm_failure("Unable to open service '" + name + "'");
    SERVICE_STATUS status{};
    if (!ControlService(svc.get(), SERVICE_CONTROL_STOP, &status)) {
        if (GetLastError() == ERROR_SERVICE_NOT_ACTIVE)
            return Status::failure(ServiceError::NotRunning,
                                   "Service '" + name + "' is not running");
        return scm_failure("Unable to stop service '" + name + "'");
    }
    return Status::success();
}

} // namespace winservice
#endif // _WIN32
