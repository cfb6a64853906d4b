#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Current local time as YYYYmmdd-HHMMSS, safe for use in names.
 */
std::string compact_timestamp();

/**
 * @brief Format an elapsed time with millisecond precision, e.g. "2.35s" or "1m4.20s".
 */
std::string format_elapsed(std::chrono::milliseconds dur);

#endif // TIME_UTILS_HPP
