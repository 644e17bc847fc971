#include "system_utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string>
#include <system_error>
#ifdef _WIN32
#include <windows.h>
#else
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace procutil {

#ifdef _WIN32
bool is_superuser() {
    HANDLE token = nullptr;
    if (!OpenProcessToken(GetCurrentProcess(), TOKEN_QUERY, &token))
        return false;
    UniqueHandle guard(token);
    TOKEN_ELEVATION elevation{};
    DWORD size = 0;
    if (!GetTokenInformation(token, TokenElevation, &elevation, sizeof(elevation), &size))
        return false;
    return elevation.TokenIsElevated != 0;
}

long current_pid() { return static_cast<long>(GetCurrentProcessId()); }

bool process_alive(long pid) {
    if (pid <= 0)
        return false;
    UniqueHandle h(OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid)));
    if (!h)
        return false;
    DWORD code = 0;
    return GetExitCodeProcess(h.get(), &code) && code == STILL_ACTIVE;
}

fs::path executable_path(const char* argv0) {
    char buf[MAX_PATH];
    DWORD n = GetModuleFileNameA(nullptr, buf, MAX_PATH);
    if (n > 0 && n < MAX_PATH)
        return fs::path(std::string(buf, n));
    std::error_code ec;
    fs::path p = fs::absolute(argv0 ? argv0 : "", ec);
    return ec ? fs::path(argv0 ? argv0 : "") : p;
}
#else
bool is_superuser() { return geteuid() == 0; }

long current_pid() { return static_cast<long>(getpid()); }

#ifdef __linux__
static bool is_zombie(long pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open())
        return false;
    std::string line;
    std::getline(stat, line);
    // The command name is wrapped in parentheses and may contain spaces.
    auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size())
        return false;
    return line[close + 2] == 'Z';
}
#endif

bool process_alive(long pid) {
    if (pid <= 0)
        return false;
    int status = 0;
    if (waitpid(static_cast<pid_t>(pid), &status, WNOHANG) == static_cast<pid_t>(pid))
        return false;
    if (kill(static_cast<pid_t>(pid), 0) != 0 && errno == ESRCH)
        return false;
#ifdef __linux__
    if (is_zombie(pid))
        return false;
#endif
    return true;
}

fs::path executable_path(const char* argv0) {
    std::error_code ec;
#ifdef __linux__
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty())
        return self;
    ec.clear();
#endif
    fs::path p = fs::absolute(argv0 ? argv0 : "", ec);
    if (ec)
        return fs::path(argv0 ? argv0 : "");
    return p.lexically_normal();
}
#endif

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

fs::path absolute_path(const fs::path& p, const fs::path& base) {
    if (p.empty() || p.is_absolute())
        return p;
    if (!base.empty())
        return (absolute_path(base) / p).lexically_normal();
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    return ec ? p : abs.lexically_normal();
}

} // namespace procutil
