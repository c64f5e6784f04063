/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: ConfigSection CRTP base class for type-safe configuration
sections

**************************************************/

#ifndef SIMDECK_CONFIG_CORE_CONFIG_SECTION_HPP
#define SIMDECK_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "exception.hpp"

namespace simdeck::config {

using json = nlohmann::json;

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(const T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { t.validate() };
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr PATH member naming the key in the file
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&) that keeps the default of
 *    every missing key
 * 4. Implement validate() that throws InvalidConfigException
 *
 * @example
 * ```cpp
 * struct RemoteConfig : ConfigSection<RemoteConfig> {
 *     static constexpr std::string_view PATH = "remote";
 *
 *     int defaultPort = 22;
 *
 *     [[nodiscard]] json serialize() const {
 *         return {{"defaultPort", defaultPort}};
 *     }
 *
 *     [[nodiscard]] static RemoteConfig deserialize(const json& j) {
 *         RemoteConfig config;
 *         config.defaultPort = j.value("defaultPort", config.defaultPort);
 *         return config;
 *     }
 *
 *     void validate() const {}
 * };
 * ```
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Create a section from JSON and validate it
     * @throws InvalidConfigException if a value has the wrong type or fails
     *         validation
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        if (!j.is_object()) {
            throw InvalidConfigException("expected an object",
                                         std::string(Derived::PATH));
        }
        Derived config;
        try {
            config = Derived::deserialize(j);
        } catch (const json::exception& e) {
            throw InvalidConfigException(e.what(), std::string(Derived::PATH));
        }
        config.validate();
        return config;
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }

protected:
    /**
     * @brief Throw an InvalidConfigException for `PATH.field`
     */
    [[noreturn]] static void invalid(std::string_view field,
                                     const std::string& message) {
        throw InvalidConfigException(
            message, std::string(Derived::PATH) + "." + std::string(field));
    }
};

}  // namespace simdeck::config

#endif  // SIMDECK_CONFIG_CORE_CONFIG_SECTION_HPP
