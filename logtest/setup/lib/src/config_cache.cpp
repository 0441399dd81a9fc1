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

#include <algorithm>   // for sort, unique
#include <cstddef>     // for size_t
#include <memory>      // for shared_ptr, make_shared
#include <mutex>       // for lock_guard
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move
#include <vector>      // for vector

#include "log/log_level.hpp"        // for LogLevel
#include "log/logging_config.hpp"   // for LoggingConfig, SinkSpec
#include "setup/config_cache.hpp"   // for ConfigCache, ConfigKey, build_config

namespace logtest::setup {

ConfigKey ConfigKey::make(
        std::vector<std::string> targets,
        const log::LogLevel level,
        const std::shared_ptr<quill::Sink> &custom_sink,
        const std::string_view pattern) {
    std::sort(targets.begin(), targets.end());
    targets.erase(std::unique(targets.begin(), targets.end()), targets.end());
    return ConfigKey{std::move(targets), level, custom_sink.get(), std::string{pattern}};
}

log::LoggingConfig build_config(
        const std::vector<std::string> &targets,
        const log::LogLevel level,
        std::shared_ptr<quill::Sink> custom_sink,
        const std::string_view pattern) {
    log::LoggingConfig config{};
    if (custom_sink) {
        config.with_sink(log::SinkSpec::custom("custom", std::move(custom_sink)));
    } else {
        config.with_sink(log::SinkSpec::test_console());
    }
    config.with_targets(targets, level)
            .with_root_level(log::LogLevel::Warn)
            .with_pattern(std::string{pattern});
    return config;
}

ConfigPtr ConfigCache::get_or_build(const ConfigKey &key, const Factory &factory) {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = entries_.find(key); it != entries_.end()) {
        return it->second;
    }
    auto config = std::make_shared<const log::LoggingConfig>(factory());
    entries_.emplace(key, config);
    return config;
}

bool ConfigCache::contains(const ConfigKey &key) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(key);
}

std::size_t ConfigCache::size() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

ConfigCache &ConfigCache::global() {
    static ConfigCache instance;
    return instance;
}

ConfigPtr get_config_for(
        std::vector<std::string> targets,
        const log::LogLevel level,
        const std::shared_ptr<quill::Sink> &custom_sink,
        const std::string_view pattern) {
    const ConfigKey key = ConfigKey::make(std::move(targets), level, custom_sink, pattern);
    return ConfigCache::global().get_or_build(
            key, [&key, &custom_sink] {
                return build_config(key.targets, key.level, custom_sink, key.pattern);
            });
}

} // namespace logtest::setup
