#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <filesystem>
#include <string>
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <io.h>
#else
#include <unistd.h>
#endif

namespace procutil {

/**
 * @brief Check whether the caller runs with administrative rights.
 *
 * On POSIX this is an effective uid of 0. On Windows the process token must
 * be elevated.
 */
bool is_superuser();

/** @return Identifier of the calling process. */
long current_pid();

/**
 * @brief Probe the process table for @p pid.
 *
 * A child of the caller that already exited is reaped first so it does not
 * linger as a zombie and read as alive. On Linux a zombie owned by someone
 * else is reported as dead as well.
 *
 * @return true while a process with that id exists.
 */
bool process_alive(long pid);

/**
 * @brief Absolute path of the running executable.
 *
 * Uses /proc/self/exe where available and falls back to resolving
 * @p argv0 against the current directory.
 */
std::filesystem::path executable_path(const char* argv0);

/** @return Value of environment variable @p name or an empty string. */
std::string env_or_empty(const char* name);

/**
 * @brief Resolve @p p against @p base, or the current directory when
 * @p base is empty. Absolute and empty paths are returned unchanged.
 */
std::filesystem::path absolute_path(const std::filesystem::path& p,
                                    const std::filesystem::path& base = {});

/**
 * @brief Owning wrapper for an OS resource described by @p Traits.
 *
 * Traits provide `type`, `invalid()`, `valid(type)` and `close(type)`.
 * Move-only. The resource is closed on destruction or reset().
 */
template <typename Traits> class UniqueResource {
  public:
    using value_type = typename Traits::type;

    UniqueResource() noexcept : value_(Traits::invalid()) {}
    explicit UniqueResource(value_type v) noexcept : value_(v) {}
    ~UniqueResource() { reset(); }

    UniqueResource(const UniqueResource&) = delete;
    UniqueResource& operator=(const UniqueResource&) = delete;

    UniqueResource(UniqueResource&& other) noexcept : value_(other.release()) {}
    UniqueResource& operator=(UniqueResource&& other) noexcept {
        if (this != &other)
            reset(other.release());
        return *this;
    }

    value_type get() const noexcept { return value_; }
    explicit operator bool() const noexcept { return Traits::valid(value_); }

    /** Give up ownership without closing. */
    value_type release() noexcept {
        value_type v = value_;
        value_ = Traits::invalid();
        return v;
    }

    void reset(value_type v = Traits::invalid()) noexcept {
        if (Traits::valid(value_))
            Traits::close(value_);
        value_ = v;
    }

  private:
    value_type value_;
};

struct FdTraits {
    using type = int;
    static int invalid() noexcept { return -1; }
    static bool valid(int fd) noexcept { return fd >= 0; }
    static void close(int fd) noexcept {
#ifdef _WIN32
        _close(fd);
#else
        ::close(fd);
#endif
    }
};

/** File descriptor closed when the owner goes out of scope. */
using UniqueFd = UniqueResource<FdTraits>;

#ifdef _WIN32
struct HandleTraits {
    using type = HANDLE;
    static HANDLE invalid() noexcept { return INVALID_HANDLE_VALUE; }
    static bool valid(HANDLE h) noexcept { return h != nullptr && h != INVALID_HANDLE_VALUE; }
    static void close(HANDLE h) noexcept { CloseHandle(h); }
};

struct ServiceHandleTraits {
    using type = SC_HANDLE;
    static SC_HANDLE invalid() noexcept { return nullptr; }
    static bool valid(SC_HANDLE h) noexcept { return h != nullptr; }
    static void close(SC_HANDLE h) noexcept { CloseServiceHandle(h); }
};

/** Process, token or event handle. */
using UniqueHandle = UniqueResource<HandleTraits>;

/** Service-control manager or service handle. */
using UniqueServiceHandle = UniqueResource<ServiceHandleTraits>;
#endif // _WIN32

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
