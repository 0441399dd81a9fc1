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

#include <algorithm>    // for all_of, min
#include <cctype>       // for isalnum
#include <memory>       // for shared_ptr, make_shared
#include <set>          // for set
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move
#include <vector>       // for vector

#include "log/log_errors.hpp"     // for LogErrc, make_error_code
#include "log/log_level.hpp"      // for LogLevel
#include "log/logging_config.hpp" // for LoggingConfig, SinkSpec
#include "log/sinks.hpp"          // for CaptureSink, TestConsoleSink

namespace logtest::log {

bool is_valid_target_name(const std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](const char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '.' ||
               c == ':' || c == '-';
    });
}

SinkSpec SinkSpec::capture(std::string name, std::shared_ptr<CaptureSink> sink) {
    return SinkSpec{std::move(name), SinkKind::Capture, std::move(sink)};
}

SinkSpec SinkSpec::test_console(std::string name) {
    return SinkSpec{std::move(name), SinkKind::TestConsole, std::make_shared<TestConsoleSink>()};
}

SinkSpec SinkSpec::custom(std::string name, std::shared_ptr<quill::Sink> sink) {
    return SinkSpec{std::move(name), SinkKind::Custom, std::move(sink)};
}

bool SinkSpec::operator==(const SinkSpec &other) const {
    if (name != other.name || kind != other.kind) {
        return false;
    }
    if (kind == SinkKind::TestConsole) {
        return (sink == nullptr) == (other.sink == nullptr);
    }
    return sink == other.sink;
}

LoggingConfig LoggingConfig::capture(
        std::shared_ptr<CaptureSink> sink, const LogLevel root_level, const std::string_view pattern) {
    LoggingConfig config{};
    config.with_sink(SinkSpec::capture("capture", std::move(sink)))
            .with_root_level(root_level)
            .with_pattern(std::string{pattern});
    return config;
}

LoggingConfig LoggingConfig::console(const LogLevel root_level, const std::string_view pattern) {
    LoggingConfig config{};
    config.with_sink(SinkSpec::test_console())
            .with_root_level(root_level)
            .with_pattern(std::string{pattern});
    return config;
}

LoggingConfig LoggingConfig::silent() {
    return console(LogLevel::Off);
}

LoggingConfig &LoggingConfig::with_sink(SinkSpec spec) {
    sinks.push_back(std::move(spec));
    return *this;
}

LoggingConfig &LoggingConfig::with_target(std::string name, const LogLevel level) {
    targets.insert_or_assign(std::move(name), level);
    return *this;
}

LoggingConfig &LoggingConfig::with_targets(const std::vector<std::string> &names, const LogLevel level) {
    for (const auto &name : names) {
        with_target(name, level);
    }
    return *this;
}

LoggingConfig &LoggingConfig::with_root_level(const LogLevel level) {
    root_level = level;
    return *this;
}

LoggingConfig &LoggingConfig::with_pattern(std::string new_pattern) {
    pattern = std::move(new_pattern);
    return *this;
}

LoggingConfig &LoggingConfig::with_time_format(std::string format) {
    time_format = std::move(format);
    return *this;
}

LogLevel LoggingConfig::level_for(const std::string_view target) const {
    if (const auto it = targets.find(target); it != targets.end()) {
        return it->second;
    }
    return root_level;
}

LogLevel LoggingConfig::lowest_level() const {
    LogLevel lowest = root_level;
    for (const auto &[name, level] : targets) {
        lowest = std::min(lowest, level);
    }
    return lowest;
}

std::error_code LoggingConfig::validate() const {
    if (sinks.empty()) {
        return LogErrc::NoSinks;
    }

    std::set<std::string_view> names;
    for (const auto &spec : sinks) {
        if (!spec.sink) {
            return LogErrc::NullSink;
        }
        if (!names.insert(spec.name).second) {
            return LogErrc::DuplicateSinkName;
        }
    }

    for (const auto &[name, level] : targets) {
        if (!is_valid_target_name(name)) {
            return LogErrc::InvalidTargetName;
        }
    }

    if (pattern.find("%(message)") == std::string::npos) {
        return LogErrc::InvalidPattern;
    }

    return {};
}

} // namespace logtest::log
