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

#ifndef LOGTEST_LOG_LOG_LEVEL_HPP
#define LOGTEST_LOG_LOG_LEVEL_HPP

#include <optional>
#include <string_view>

#include <quill/core/LogLevel.h>

#include <wise_enum.h>

namespace logtest::log {

/**
 * Severity levels for the logging facility
 *
 * Ordered from most verbose (TraceL3) to most critical (Critical). Off is
 * never emitted; configuring a target or the root at Off silences it.
 */
enum class LogLevel {
    TraceL3,  //!< Most verbose trace level
    TraceL2,  //!< Medium trace level
    TraceL1,  //!< Least verbose trace level
    Debug,    //!< Debug messages
    Info,     //!< Informational messages
    Notice,   //!< Notice messages
    Warn,     //!< Warning messages
    Error,    //!< Error messages
    Critical, //!< Critical error messages
    Off       //!< Filter level that lets nothing through
};

} // namespace logtest::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        logtest::log::LogLevel,
        TraceL3,
        TraceL2,
        TraceL1,
        Debug,
        Info,
        Notice,
        Warn,
        Error,
        Critical,
        Off)

namespace logtest::log {

/**
 * Check whether a record at message_level passes a filter at threshold
 *
 * @param[in] threshold Minimum level configured for the target or root
 * @param[in] message_level Level of the record being emitted
 * @return true if the record should be emitted
 */
[[nodiscard]] constexpr bool passes(const LogLevel threshold, const LogLevel message_level) noexcept {
    return message_level != LogLevel::Off && threshold != LogLevel::Off &&
           message_level >= threshold;
}

/**
 * Get the name of a log level
 *
 * @param[in] level Level to name
 * @return Level name as spelled in the enum (e.g. "Debug")
 */
[[nodiscard]] std::string_view level_name(LogLevel level);

/**
 * Parse a level name, ignoring ASCII case
 *
 * @param[in] name Level name such as "debug" or "Warn"
 * @return Parsed level, or std::nullopt if the name is unknown
 */
[[nodiscard]] std::optional<LogLevel> parse_level(std::string_view name);

/**
 * Convert a log level to the Quill level used for the underlying logger
 *
 * @param[in] level Facility log level
 * @return Corresponding Quill log level (Off maps to None)
 */
[[nodiscard]] quill::LogLevel to_quill_level(LogLevel level);

} // namespace logtest::log

#endif // LOGTEST_LOG_LOG_LEVEL_HPP
