#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <string>

namespace svckit {

// Parse a decimal integer with optional '+' or '-'.
// Bounds: inclusive [min, max].
// Invalid input: empty, trailing characters, overflow or out-of-range sets ok=false and returns 0.
int parse_int(const std::string& value, int min, int max, bool& ok);

// Parse a byte size with optional unit suffix.
// Format: unsigned integer followed by B, K/KB, M/MB or G/GB (case-insensitive, powers of 1024).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Parse milliseconds with optional unit suffix.
// Format: non-negative integer optionally suffixed by ms (default), s or m.
// Invalid input: parse failure sets ok=false and returns 0ms.
std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok);

// Parse a boolean config or flag value.
// Accepted: "", 1, true, yes, on and 0, false, no, off (case-insensitive). An empty value is true,
// which is what a bare flag carries.
bool parse_bool(const std::string& value, bool& ok);

} // namespace svckit

#endif // PARSE_UTILS_HPP
