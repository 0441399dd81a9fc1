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

#ifndef LOGTEST_LOG_LOG_MACROS_HPP
#define LOGTEST_LOG_LOG_MACROS_HPP

#include <string_view>

#include <quill/LogMacros.h>

#include "log/log_level.hpp"
#include "log/logger.hpp"

namespace logtest::log {

// NOLINTBEGIN(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while,clang-diagnostic-gnu-zero-variadic-macro-arguments)

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#endif

/**
 * Helper macro for root logging
 *
 * Checks the root level before formatting anything. Records emitted before
 * the facility is configured are discarded.
 *
 * @param level_enum Facility log level enum
 * @param quill_level Corresponding Quill log level
 * @param message Log message format string
 * @param ... Format arguments
 */
#define LT_LOG_HELPER(level_enum, quill_level, message, ...)                                       \
    do {                                                                                           \
        const ::logtest::log::detail::EmitScope lt_emit_scope_{                                    \
                std::string_view{}, ::logtest::log::LogLevel::level_enum};                         \
        if (lt_emit_scope_.enabled()) {                                                            \
            QUILL_LOG_##quill_level(lt_emit_scope_.logger(), message, ##__VA_ARGS__);              \
        }                                                                                          \
    } while (0)

/**
 * Helper macro for target logging
 *
 * Checks the target level (or the root level for unlisted targets) and
 * prefixes the message with the target name. The target expression is
 * evaluated twice.
 *
 * @param level_enum Facility log level enum
 * @param quill_level Corresponding Quill log level
 * @param target Target name
 * @param message Log message format string
 * @param ... Format arguments
 */
#define LT_LOGT_HELPER(level_enum, quill_level, target, message, ...)                              \
    do {                                                                                           \
        const ::logtest::log::detail::EmitScope lt_emit_scope_{                                    \
                std::string_view{target}, ::logtest::log::LogLevel::level_enum};                   \
        if (lt_emit_scope_.enabled()) {                                                            \
            QUILL_LOG_##quill_level(                                                               \
                    lt_emit_scope_.logger(),                                                       \
                    "[{}] " message,                                                               \
                    std::string_view{target},                                                      \
                    ##__VA_ARGS__);                                                                \
        }                                                                                          \
    } while (0)

// TraceL3 level macros
#define LT_LOG_TRACE_L3(fmt, ...) LT_LOG_HELPER(TraceL3, TRACE_L3, fmt, ##__VA_ARGS__)
#define LT_LOGT_TRACE_L3(t, fmt, ...) LT_LOGT_HELPER(TraceL3, TRACE_L3, t, fmt, ##__VA_ARGS__)

// TraceL2 level macros
#define LT_LOG_TRACE_L2(fmt, ...) LT_LOG_HELPER(TraceL2, TRACE_L2, fmt, ##__VA_ARGS__)
#define LT_LOGT_TRACE_L2(t, fmt, ...) LT_LOGT_HELPER(TraceL2, TRACE_L2, t, fmt, ##__VA_ARGS__)

// TraceL1 level macros
#define LT_LOG_TRACE_L1(fmt, ...) LT_LOG_HELPER(TraceL1, TRACE_L1, fmt, ##__VA_ARGS__)
#define LT_LOGT_TRACE_L1(t, fmt, ...) LT_LOGT_HELPER(TraceL1, TRACE_L1, t, fmt, ##__VA_ARGS__)

// Debug level macros
#define LT_LOG_DEBUG(fmt, ...) LT_LOG_HELPER(Debug, DEBUG, fmt, ##__VA_ARGS__)
#define LT_LOGT_DEBUG(t, fmt, ...) LT_LOGT_HELPER(Debug, DEBUG, t, fmt, ##__VA_ARGS__)

// Info level macros
#define LT_LOG_INFO(fmt, ...) LT_LOG_HELPER(Info, INFO, fmt, ##__VA_ARGS__)
#define LT_LOGT_INFO(t, fmt, ...) LT_LOGT_HELPER(Info, INFO, t, fmt, ##__VA_ARGS__)

// Notice level macros
#define LT_LOG_NOTICE(fmt, ...) LT_LOG_HELPER(Notice, NOTICE, fmt, ##__VA_ARGS__)
#define LT_LOGT_NOTICE(t, fmt, ...) LT_LOGT_HELPER(Notice, NOTICE, t, fmt, ##__VA_ARGS__)

// Warn level macros
#define LT_LOG_WARN(fmt, ...) LT_LOG_HELPER(Warn, WARNING, fmt, ##__VA_ARGS__)
#define LT_LOGT_WARN(t, fmt, ...) LT_LOGT_HELPER(Warn, WARNING, t, fmt, ##__VA_ARGS__)

// Error level macros
#define LT_LOG_ERROR(fmt, ...) LT_LOG_HELPER(Error, ERROR, fmt, ##__VA_ARGS__)
#define LT_LOGT_ERROR(t, fmt, ...) LT_LOGT_HELPER(Error, ERROR, t, fmt, ##__VA_ARGS__)

// Critical level macros
#define LT_LOG_CRITICAL(fmt, ...) LT_LOG_HELPER(Critical, CRITICAL, fmt, ##__VA_ARGS__)
#define LT_LOGT_CRITICAL(t, fmt, ...) LT_LOGT_HELPER(Critical, CRITICAL, t, fmt, ##__VA_ARGS__)

#ifdef __clang__
#pragma clang diagnostic pop
#endif

// NOLINTEND(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while,clang-diagnostic-gnu-zero-variadic-macro-arguments)

} // namespace logtest::log

#endif // LOGTEST_LOG_LOG_MACROS_HPP
