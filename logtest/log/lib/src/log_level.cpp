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

#include <algorithm>   // for equal
#include <cctype>      // for tolower
#include <optional>    // for optional, nullopt
#include <string_view> // for string_view

#include <quill/core/LogLevel.h> // for LogLevel

#include <wise_enum.h> // for range, to_string

#include "log/log_level.hpp" // for LogLevel

namespace logtest::log {

std::string_view level_name(const LogLevel level) {
    const auto name = ::wise_enum::to_string(level);
    return std::string_view{name.data(), name.size()};
}

std::optional<LogLevel> parse_level(const std::string_view name) {
    const auto equals_ignore_case = [](std::string_view lhs, std::string_view rhs) {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char lc, char rc) {
                   return std::tolower(static_cast<unsigned char>(lc)) ==
                          std::tolower(static_cast<unsigned char>(rc));
               });
    };
    for (const auto value_and_name : ::wise_enum::range<LogLevel>) {
        if (equals_ignore_case(
                    name,
                    std::string_view{value_and_name.name.data(), value_and_name.name.size()})) {
            return value_and_name.value;
        }
    }
    return std::nullopt;
}

quill::LogLevel to_quill_level(const LogLevel level) {
    switch (level) {
    case LogLevel::TraceL3:
        return quill::LogLevel::TraceL3;
    case LogLevel::TraceL2:
        return quill::LogLevel::TraceL2;
    case LogLevel::TraceL1:
        return quill::LogLevel::TraceL1;
    case LogLevel::Debug:
        return quill::LogLevel::Debug;
    case LogLevel::Info:
        return quill::LogLevel::Info;
    case LogLevel::Notice:
        return quill::LogLevel::Notice;
    case LogLevel::Warn:
        return quill::LogLevel::Warning;
    case LogLevel::Error:
        return quill::LogLevel::Error;
    case LogLevel::Critical:
        return quill::LogLevel::Critical;
    case LogLevel::Off:
        return quill::LogLevel::None;
    default:
        return quill::LogLevel::Info;
    }
}

} // namespace logtest::log
