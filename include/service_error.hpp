#ifndef SERVICE_ERROR_HPP
#define SERVICE_ERROR_HPP
#include <string>

namespace svckit {

/** Failure kinds reported by lifecycle operations. */
enum class ServiceError {
    None = 0,
    AlreadyInstalled,
    NotInstalled,
    AlreadyRunning,
    NotRunning,
    PermissionDenied,
    ForkFailure,
    SignalDeliveryFailure,
    TerminationTimeout,
    CorruptState,
    IOError,
    HostFailure,
};

/** @return Stable name of @p err, e.g. "NotInstalled". */
const char* to_string(ServiceError err);

/**
 * @brief Outcome of a lifecycle step.
 *
 * A default-constructed Status is a success. Failures carry an error kind,
 * a human-readable message and, for failed system calls, the OS error code.
 */
class Status {
  public:
    Status() = default;

    static Status success() { return Status(); }
    static Status failure(ServiceError code, std::string message, int os_error = 0);

    bool ok() const noexcept { return code_ == ServiceError::None; }
    explicit operator bool() const noexcept { return ok(); }

    ServiceError code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    int os_error() const noexcept { return os_error_; }

    /** @return "NotRunning: service worker is not running" style text. */
    std::string describe() const;

  private:
    ServiceError code_ = ServiceError::None;
    std::string message_;
    int os_error_ = 0;
};

/** Build a failure whose message ends with strerror(@p err). */
Status os_failure(ServiceError code, const std::string& what, int err);

} // namespace svckit

#endif // SERVICE_ERROR_HPP
