/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef LOGTEST_SETUP_CONFIG_CACHE_HPP
#define LOGTEST_SETUP_CONFIG_CACHE_HPP

#include <compare>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <quill/sinks/Sink.h>

#include "log/log_level.hpp"
#include "log/logging_config.hpp"

namespace logtest::setup {

/// Shared handle to an immutable cached configuration
using ConfigPtr = std::shared_ptr<const log::LoggingConfig>;

/**
 * Identity of a configuration request
 *
 * Targets are kept sorted and de-duplicated so that the same set in any
 * order maps to the same key. A custom sink is keyed by its address; the
 * cached configuration owns the sink, so the address cannot be reused while
 * the entry lives.
 */
struct ConfigKey final {
    std::vector<std::string> targets;          //!< Sorted unique target names
    log::LogLevel level{log::LogLevel::Debug}; //!< Level for the targets
    const quill::Sink *sink{nullptr};          //!< Custom sink identity, nullptr for console
    std::string pattern;                       //!< Format pattern

    /**
     * Build a normalized key
     *
     * @param[in] targets Target names in any order, duplicates allowed
     * @param[in] level Level for the targets
     * @param[in] custom_sink Custom sink, nullptr for the default console
     * @param[in] pattern Format pattern
     * @return Normalized key
     */
    [[nodiscard]] static ConfigKey
    make(std::vector<std::string> targets,
         log::LogLevel level,
         const std::shared_ptr<quill::Sink> &custom_sink,
         std::string_view pattern);

    [[nodiscard]] auto operator<=>(const ConfigKey &other) const = default;
    [[nodiscard]] bool operator==(const ConfigKey &other) const = default;
};

/**
 * Build a configuration enabling a set of targets
 *
 * The listed targets pass at level, every other target passes at Warn and
 * above. Records go to custom_sink if given, otherwise to a fresh
 * TestConsoleSink.
 *
 * @param[in] targets Target names to enable
 * @param[in] level Minimum level for the listed targets
 * @param[in] custom_sink Sink to route to, nullptr for the console
 * @param[in] pattern Format pattern
 * @return New configuration, not applied
 */
[[nodiscard]] log::LoggingConfig build_config(
        const std::vector<std::string> &targets,
        log::LogLevel level,
        std::shared_ptr<quill::Sink> custom_sink = nullptr,
        std::string_view pattern = log::DEFAULT_PATTERN);

/**
 * Thread-safe memo of built configurations
 *
 * Entries are never evicted, so repeated requests for the same key always
 * observe the same instance.
 */
class ConfigCache final {
public:
    /// Builds the configuration for a key on a cache miss
    using Factory = std::function<log::LoggingConfig()>;

    /**
     * Get the cached configuration for a key, building it on a miss
     *
     * The factory runs at most once per key.
     *
     * @param[in] key Request identity
     * @param[in] factory Builds the configuration on a miss
     * @return Cached configuration
     */
    [[nodiscard]] ConfigPtr get_or_build(const ConfigKey &key, const Factory &factory);

    /**
     * Check whether a key has been built
     * @param[in] key Request identity
     * @return true if cached
     */
    [[nodiscard]] bool contains(const ConfigKey &key) const;

    /**
     * Get the number of cached configurations
     * @return Entry count
     */
    [[nodiscard]] std::size_t size() const;

    /**
     * Get the process-wide cache used by get_config_for
     *
     * @return Reference to the global cache
     */
    [[nodiscard]] static ConfigCache &global();

private:
    mutable std::mutex mutex_;              //!< Guards entries_
    std::map<ConfigKey, ConfigPtr> entries_; //!< Built configurations
};

/**
 * Get the cached configuration for a set of targets
 *
 * Builds it with build_config() on first request. Does not apply it.
 *
 * @param[in] targets Target names to enable
 * @param[in] level Minimum level for the listed targets
 * @param[in] custom_sink Sink to route to, nullptr for the console
 * @param[in] pattern Format pattern
 * @return Cached configuration, the same instance for the same request
 */
[[nodiscard]] ConfigPtr get_config_for(
        std::vector<std::string> targets,
        log::LogLevel level = log::LogLevel::Debug,
        const std::shared_ptr<quill::Sink> &custom_sink = nullptr,
        std::string_view pattern = log::DEFAULT_PATTERN);

} // namespace logtest::setup

#endif // LOGTEST_SETUP_CONFIG_CACHE_HPP
