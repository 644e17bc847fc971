#ifndef SERVICE_DESCRIPTOR_HPP
#define SERVICE_DESCRIPTOR_HPP
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace svckit {

/**
 * @brief One-way stop flag shared between a controller and a callback.
 *
 * The store uses release ordering and the load acquire ordering, so
 * everything written before request() is visible to a reader that observes
 * the flag. The flag is lock-free and may be raised from a signal handler.
 */
class CancellationToken {
  public:
    void request() noexcept { flag_.store(true, std::memory_order_release); }
    bool requested() const noexcept { return flag_.load(std::memory_order_acquire); }

  private:
    std::atomic<bool> flag_{false};
};

/**
 * @brief Handle passed into the user callback.
 *
 * Callbacks are expected to poll stop_requested() in their own loop and
 * return promptly once it reads true. Nothing preempts a callback that
 * ignores it.
 */
class ServiceHandle {
  public:
    explicit ServiceHandle(std::shared_ptr<CancellationToken> token)
        : token_(std::move(token)) {}

    bool stop_requested() const noexcept { return token_->requested(); }

    /**
     * @brief Sleep up to @p dur, waking early on a stop request.
     *
     * @return false when the stop request arrived.
     */
    bool sleep_for(std::chrono::milliseconds dur) const;

    const std::shared_ptr<CancellationToken>& token() const noexcept { return token_; }

  private:
    std::shared_ptr<CancellationToken> token_;
};

using ServiceCallback = std::function<void(ServiceHandle&)>;

/**
 * @brief Identity and metadata of one service.
 *
 * Immutable after construction. The name doubles as the filesystem and
 * service-registry key, so it must be non-empty and free of path separators.
 */
class ServiceDescriptor {
  public:
    /** @throws std::invalid_argument on an unusable name or empty callback. */
    ServiceDescriptor(std::string name, std::string description, bool auto_start,
                      ServiceCallback callback);

    const std::string& name() const noexcept { return name_; }
    const std::string& description() const noexcept { return description_; }

    /** Start at boot and relaunch once after an abnormal exit. */
    bool auto_start() const noexcept { return auto_start_; }

    const ServiceCallback& callback() const noexcept { return callback_; }

    /** Copy with a different name, description or auto-start flag. */
    ServiceDescriptor with(std::string name, std::string description, bool auto_start) const;

  private:
    std::string name_;
    std::string description_;
    bool auto_start_;
    ServiceCallback callback_;
};

/** @return true if @p name can be used as a service identity. */
bool valid_service_name(const std::string& name);

/**
 * @brief Optional lifecycle notifications.
 *
 * Every hook is a no-op by default and is invoked synchronously at the
 * matching transition. on_started and on_stopped run where the service
 * runs: inside the daemon process on the fork host, on the control thread
 * on the host-managed host.
 */
class LifecycleHooks {
  public:
    virtual ~LifecycleHooks() = default;
    virtual void on_started(const ServiceDescriptor&) {}
    virtual void on_stopped(const ServiceDescriptor&) {}
    virtual void on_installed(const ServiceDescriptor&) {}
    virtual void on_uninstalled(const ServiceDescriptor&) {}
};

} // namespace svckit

#endif // SERVICE_DESCRIPTOR_HPP
