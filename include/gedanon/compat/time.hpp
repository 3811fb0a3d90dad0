/**
 * @file time.hpp
 * @brief Thread-safe calendar time conversion across POSIX and Windows
 */

#pragma once

#include <ctime>

namespace gedanon::compat {

/**
 * @brief Convert a time_t to UTC calendar time
 * @param time The time to convert
 * @param result Receives the broken-down time
 * @return @p result on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

}  // namespace gedanon::compat
