#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>

namespace svckit {

namespace {
std::string lower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

// Digits only, no sign. False on overflow of unsigned long long.
bool parse_digits(const std::string& digits, unsigned long long& out) {
    if (digits.empty())
        return false;
    unsigned long long v = 0;
    for (char c : digits) {
        if (c < '0' || c > '9')
            return false;
        unsigned d = static_cast<unsigned>(c - '0');
        if (v > (ULLONG_MAX - d) / 10)
            return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

bool ends_with(const std::string& v, const std::string& suffix) {
    return v.size() >= suffix.size() &&
           v.compare(v.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

int parse_int(const std::string& value, int min, int max, bool& ok) {
    ok = false;
    if (value.empty())
        return 0;
    bool negative = value[0] == '-';
    size_t start = (value[0] == '-' || value[0] == '+') ? 1 : 0;
    unsigned long long magnitude = 0;
    if (!parse_digits(value.substr(start), magnitude))
        return 0;
    long long v = 0;
    if (negative) {
        if (magnitude > static_cast<unsigned long long>(INT_MAX) + 1)
            return 0;
        v = -static_cast<long long>(magnitude);
    } else {
        if (magnitude > static_cast<unsigned long long>(INT_MAX))
            return 0;
        v = static_cast<long long>(magnitude);
    }
    if (v < min || v > max)
        return 0;
    ok = true;
    return static_cast<int>(v);
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lower(value);
    unsigned long long mult = 1;
    const struct {
        const char* suffix;
        unsigned long long mult;
    } units[] = {{"kb", 1024ull},           {"mb", 1024ull * 1024},
                 {"gb", 1024ull * 1024 * 1024}, {"k", 1024ull},
                 {"m", 1024ull * 1024},     {"g", 1024ull * 1024 * 1024},
                 {"b", 1}};
    for (const auto& u : units) {
        if (ends_with(val, u.suffix)) {
            mult = u.mult;
            val.erase(val.size() - std::char_traits<char>::length(u.suffix));
            break;
        }
    }
    unsigned long long base = 0;
    if (!parse_digits(val, base))
        return 0;
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok) {
    ok = false;
    std::string val = lower(value);
    long long mult = 1;
    if (ends_with(val, "ms")) {
        val.erase(val.size() - 2);
    } else if (ends_with(val, "s")) {
        mult = 1000;
        val.pop_back();
    } else if (ends_with(val, "m")) {
        mult = 60 * 1000;
        val.pop_back();
    }
    unsigned long long n = 0;
    if (!parse_digits(val, n) || n > static_cast<unsigned long long>(LLONG_MAX / mult))
        return std::chrono::milliseconds(0);
    ok = true;
    return std::chrono::milliseconds(static_cast<long long>(n) * mult);
}

bool parse_bool(const std::string& value, bool& ok) {
    ok = true;
    std::string v = lower(value);
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}

} // namespace svckit
