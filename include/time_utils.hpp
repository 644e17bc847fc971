#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <string>

namespace svckit {

/**
 * @brief Current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format a duration as a compact string like 1h2m3s.
 *
 * Leading zero units are omitted; seconds are always present.
 */
std::string format_duration_short(std::chrono::seconds dur);

/**
 * @brief Time elapsed since @p since, clamped at zero.
 */
std::chrono::seconds elapsed_since(std::chrono::system_clock::time_point since);

} // namespace svckit

#endif // TIME_UTILS_HPP
