#include "service_descriptor.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

namespace svckit {

bool ServiceHandle::sleep_for(std::chrono::milliseconds dur) const {
    constexpr std::chrono::milliseconds slice{50};
    auto deadline = std::chrono::steady_clock::now() + dur;
    while (!stop_requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(slice, left));
    }
    return false;
}

bool valid_service_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..")
        return false;
    return std::none_of(name.begin(), name.end(), [](char c) {
        return c == '/' || c == '\\' || c == '\0' || c == ' ' || c == '\'' || c == '"';
    });
}

ServiceDescriptor::ServiceDescriptor(std::string name, std::string description, bool auto_start,
                                     ServiceCallback callback)
    : name_(std::move(name)), description_(std::move(description)), auto_start_(auto_start),
      callback_(std::move(callback)) {
    if (!valid_service_name(name_))
        throw std::invalid_argument("Invalid service name: '" + name_ + "'");
    if (!callback_)
        throw std::invalid_argument("Service '" + name_ + "' has no callback");
}

ServiceDescriptor ServiceDescriptor::with(std::string name, std::string description,
                                          bool auto_start) const {
    return ServiceDescriptor(std::move(name), std::move(description), auto_start, callback_);
}

} // namespace svckit
