#ifndef PID_STORE_HPP
#define PID_STORE_HPP
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include "service_error.hpp"

namespace svckit {

/**
 * @brief Persistent liveness record for one service identity.
 *
 * The presence of the record is the only "is running" oracle the lifecycle
 * controller consults; implementations never probe the process table
 * themselves. At most one record exists per store.
 */
class LivenessStore {
  public:
    virtual ~LivenessStore() = default;

    /** Create or overwrite the record with @p pid. */
    virtual Status write(long pid) = 0;

    /**
     * Read the recorded process id.
     *
     * @return CorruptState when the record exists but is not a positive
     *         integer, NotRunning when there is no record.
     */
    virtual Status read(long& pid) const = 0;

    virtual bool exists() const = 0;

    /** Delete the record. Removing an absent record is not an error. */
    virtual Status remove() = 0;

    /** @return Time the record was last written, if known. */
    virtual std::optional<std::chrono::system_clock::time_point> written_at() const {
        return std::nullopt;
    }

    /** @return Human-readable location used in status lines and logs. */
    virtual std::string location() const = 0;
};

/**
 * @brief LivenessStore backed by a one-line PID file.
 *
 * The file holds the decimal process id followed by a newline and nothing
 * else. The parent directory is created on the first write.
 */
class PidFileStore : public LivenessStore {
  public:
    explicit PidFileStore(std::filesystem::path path);

    /** Store for @p name inside @p dir, i.e. `<dir>/<name>.pid`. */
    static PidFileStore for_service(const std::filesystem::path& dir, const std::string& name);

    Status write(long pid) override;
    Status read(long& pid) const override;
    bool exists() const override;
    Status remove() override;
    std::optional<std::chrono::system_clock::time_point> written_at() const override;
    std::string location() const override { return path_.string(); }

    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
};

/**
 * @brief Default directory for PID files.
 *
 * `$SVCKIT_PID_DIR` when set, `/var/run` for the superuser, otherwise
 * `$HOME/.svckit_pids`.
 */
std::filesystem::path default_pid_dir();

/**
 * @brief Parse the content of a PID record.
 *
 * Surrounding whitespace is ignored; anything else than a positive decimal
 * integer is rejected.
 */
bool parse_pid(const std::string& text, long& pid);

} // namespace svckit

#endif // PID_STORE_HPP
