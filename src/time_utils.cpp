#include "time_utils.hpp"
#include <ctime>

namespace svckit {

std::string timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_duration_short(std::chrono::seconds dur) {
    long long total = dur.count() < 0 ? 0 : dur.count();
    const long long days = total / 86400;
    const long long hours = (total / 3600) % 24;
    const long long minutes = (total / 60) % 60;
    const long long seconds = total % 60;
    std::string out;
    bool emit = false;
    if (days > 0) {
        out += std::to_string(days) + "d";
        emit = true;
    }
    if (emit || hours > 0) {
        out += std::to_string(hours) + "h";
        emit = true;
    }
    if (emit || minutes > 0)
        out += std::to_string(minutes) + "m";
    out += std::to_string(seconds) + "s";
    return out;
}

std::chrono::seconds elapsed_since(std::chrono::system_clock::time_point since) {
    auto delta = std::chrono::system_clock::now() - since;
    if (delta.count() < 0)
        return std::chrono::seconds(0);
    return std::chrono::duration_cast<std::chrono::seconds>(delta);
}

} // namespace svckit
