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

#ifndef LOGTEST_LOG_LOGGING_CONFIG_HPP
#define LOGTEST_LOG_LOGGING_CONFIG_HPP

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <quill/sinks/Sink.h>

#include <wise_enum.h>

#include "log/log_level.hpp"
#include "log/sinks.hpp"

namespace logtest::log {

/**
 * Kinds of sink a configuration can route records to
 */
enum class SinkKind {
    Capture,     //!< In-memory CaptureSink
    TestConsole, //!< Stdout passthrough TestConsoleSink
    Custom       //!< Caller-supplied quill::Sink
};

} // namespace logtest::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(logtest::log::SinkKind, Capture, TestConsole, Custom)

namespace logtest::log {

/// Default pattern: level followed by the (target-prefixed) message
inline constexpr std::string_view DEFAULT_PATTERN = "%(log_level) %(message)";

/// Default timestamp format used when a pattern includes %(time)
inline constexpr std::string_view DEFAULT_TIME_FORMAT = "%H:%M:%S.%Qns";

/**
 * A named consumer registered inside a LoggingConfig
 */
struct SinkSpec final {
    std::string name;                  //!< Unique name within the configuration
    SinkKind kind{SinkKind::Custom};   //!< What kind of consumer this is
    std::shared_ptr<quill::Sink> sink; //!< The consumer itself

    /**
     * Create a sink entry for a capture sink
     *
     * @param[in] name Sink name
     * @param[in] sink Capture sink to route to
     * @return SinkSpec of kind Capture
     */
    static SinkSpec capture(std::string name, std::shared_ptr<CaptureSink> sink);

    /**
     * Create a sink entry for a fresh stdout passthrough sink
     *
     * @param[in] name Sink name
     * @return SinkSpec of kind TestConsole
     */
    static SinkSpec test_console(std::string name = "console");

    /**
     * Create a sink entry for a caller-supplied sink
     *
     * @param[in] name Sink name
     * @param[in] sink Sink to route to
     * @return SinkSpec of kind Custom
     */
    static SinkSpec custom(std::string name, std::shared_ptr<quill::Sink> sink);

    /**
     * Structural equality: same name and kind
     *
     * Capture and Custom sinks must also be the same object. TestConsole
     * sinks are stateless, so any two of them are interchangeable.
     *
     * @param[in] other Sink entry to compare with
     * @return true if both entries route records the same way
     */
    [[nodiscard]] bool operator==(const SinkSpec &other) const;
};

/**
 * Immutable description of how the facility routes and filters records
 *
 * Holds the consumers, per-target minimum levels, the root level applied to
 * targets without an entry, and the pattern used to format each record.
 * Built once, then either cached for reuse or handed to Logger::apply.
 */
struct LoggingConfig final {
    std::vector<SinkSpec> sinks;                          //!< Consumers of every record
    std::map<std::string, LogLevel, std::less<>> targets; //!< Per-target minimum level
    LogLevel root_level{LogLevel::Info};                  //!< Level for unlisted targets
    std::string pattern{DEFAULT_PATTERN};                 //!< Quill format pattern
    std::string time_format{DEFAULT_TIME_FORMAT};         //!< Quill timestamp format

    /**
     * Create a configuration routing everything to one capture sink
     *
     * @param[in] sink Capture sink to route to
     * @param[in] root_level Minimum level for all targets
     * @param[in] pattern Quill format pattern
     * @return LoggingConfig with a single Capture sink named "capture"
     */
    static LoggingConfig
    capture(std::shared_ptr<CaptureSink> sink,
            LogLevel root_level = LogLevel::TraceL3,
            std::string_view pattern = DEFAULT_PATTERN);

    /**
     * Create a configuration routing everything to stdout
     *
     * @param[in] root_level Minimum level for all targets
     * @param[in] pattern Quill format pattern
     * @return LoggingConfig with a single TestConsole sink named "console"
     */
    static LoggingConfig
    console(LogLevel root_level = LogLevel::Info, std::string_view pattern = DEFAULT_PATTERN);

    /**
     * Create a configuration that lets no record through
     *
     * @return LoggingConfig with a TestConsole sink and the root at Off
     */
    static LoggingConfig silent();

    /**
     * Add a sink
     *
     * @param[in] spec Sink to add
     * @return Reference to this config for method chaining
     */
    LoggingConfig &with_sink(SinkSpec spec);

    /**
     * Set the minimum level of a single target
     *
     * @param[in] name Target name
     * @param[in] level Minimum level for records on that target
     * @return Reference to this config for method chaining
     */
    LoggingConfig &with_target(std::string name, LogLevel level);

    /**
     * Set the same minimum level for several targets
     *
     * @param[in] names Target names
     * @param[in] level Minimum level for records on those targets
     * @return Reference to this config for method chaining
     */
    LoggingConfig &with_targets(const std::vector<std::string> &names, LogLevel level);

    /**
     * Set the level applied to targets without an entry
     *
     * @param[in] level Root minimum level
     * @return Reference to this config for method chaining
     */
    LoggingConfig &with_root_level(LogLevel level);

    /**
     * Set the record format pattern
     *
     * @param[in] pattern Quill format pattern, must contain %(message)
     * @return Reference to this config for method chaining
     */
    LoggingConfig &with_pattern(std::string pattern);

    /**
     * Set the timestamp format used by %(time)
     *
     * @param[in] format Quill timestamp format
     * @return Reference to this config for method chaining
     */
    LoggingConfig &with_time_format(std::string format);

    /**
     * Get the effective minimum level for a target
     *
     * @param[in] target Target name (empty for the root)
     * @return Target level if listed, root level otherwise
     */
    [[nodiscard]] LogLevel level_for(std::string_view target) const;

    /**
     * Get the lowest level any record could pass at
     *
     * @return Minimum over the root level and every target level
     */
    [[nodiscard]] LogLevel lowest_level() const;

    /**
     * Check the configuration for errors the facility would reject
     *
     * @return Empty error_code if valid, a LogErrc otherwise
     */
    [[nodiscard]] std::error_code validate() const;

    /**
     * Structural equality: equal sink entries, targets, levels and format
     */
    [[nodiscard]] bool operator==(const LoggingConfig &other) const = default;
};

/**
 * Check whether a string is a valid target name
 *
 * @param[in] name Candidate target name
 * @return true if non-empty and made only of [A-Za-z0-9_.:-]
 */
[[nodiscard]] bool is_valid_target_name(std::string_view name) noexcept;

} // namespace logtest::log

#endif // LOGTEST_LOG_LOGGING_CONFIG_HPP
