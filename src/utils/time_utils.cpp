/*
 * time_utils.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace simdeck::utils {

namespace {

auto toUtc(std::chrono::system_clock::time_point tp) -> std::tm {
    auto timeT = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&timeT, &utc);
    return utc;
}

}  // namespace

auto formatRfc3339(std::chrono::system_clock::time_point tp) -> std::string {
    auto utc = toUtc(tp);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

auto nowRfc3339() -> std::string {
    return formatRfc3339(std::chrono::system_clock::now());
}

auto fileTimestamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto utc = toUtc(tp);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y%m%d-%H%M%S");
    return oss.str();
}

auto parseRfc3339(const std::string& text,
                  std::chrono::system_clock::time_point& out) -> bool {
    std::tm utc{};
    std::istringstream iss(text);
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail() || iss.get() != 'Z' ||
        iss.peek() != std::istringstream::traits_type::eof()) {
        return false;
    }
    out = std::chrono::system_clock::from_time_t(timegm(&utc));
    return true;
}

}  // namespace simdeck::utils
