/*
 * time_utils.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SIMDECK_UTILS_TIME_UTILS_HPP
#define SIMDECK_UTILS_TIME_UTILS_HPP

#include <chrono>
#include <string>

namespace simdeck::utils {

/**
 * @brief Format a time point as RFC3339 UTC with second precision,
 * e.g. "2024-12-01T08:30:00Z"
 */
[[nodiscard]] auto formatRfc3339(std::chrono::system_clock::time_point tp)
    -> std::string;

/**
 * @brief Current time formatted with formatRfc3339()
 */
[[nodiscard]] auto nowRfc3339() -> std::string;

/**
 * @brief Compact UTC stamp usable in file names, e.g. "20241201-083000"
 */
[[nodiscard]] auto fileTimestamp(std::chrono::system_clock::time_point tp)
    -> std::string;

/**
 * @brief Parse a formatRfc3339() string back into a time point
 * @return false if the string is not in that exact form
 */
[[nodiscard]] auto parseRfc3339(const std::string& text,
                                std::chrono::system_clock::time_point& out)
    -> bool;

}  // namespace simdeck::utils

#endif  // SIMDECK_UTILS_TIME_UTILS_HPP
