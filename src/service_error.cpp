#include "service_error.hpp"
#include <cstring>
#include <utility>

namespace svckit {

const char* to_string(ServiceError err) {
    switch (err) {
    case ServiceError::None:
        return "None";
    case ServiceError::AlreadyInstalled:
        return "AlreadyInstalled";
    case ServiceError::NotInstalled:
        return "NotInstalled";
    case ServiceError::AlreadyRunning:
        return "AlreadyRunning";
    case ServiceError::NotRunning:
        return "NotRunning";
    case ServiceError::PermissionDenied:
        return "PermissionDenied";
    case ServiceError::ForkFailure:
        return "ForkFailure";
    case ServiceError::SignalDeliveryFailure:
        return "SignalDeliveryFailure";
    case ServiceError::TerminationTimeout:
        return "TerminationTimeout";
    case ServiceError::CorruptState:
        return "CorruptState";
    case ServiceError::IOError:
        return "IOError";
    case ServiceError::HostFailure:
        return "HostFailure";
    }
    return "Unknown";
}

Status Status::failure(ServiceError code, std::string message, int os_error) {
    Status st;
    st.code_ = code;
    st.message_ = std::move(message);
    st.os_error_ = os_error;
    return st;
}

std::string Status::describe() const {
    if (ok())
        return "OK";
    if (message_.empty())
        return to_string(code_);
    return std::string(to_string(code_)) + ": " + message_;
}

Status os_failure(ServiceError code, const std::string& what, int err) {
    return Status::failure(code, what + ": " + std::strerror(err), err);
}

} // namespace svckit
