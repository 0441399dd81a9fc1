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

#ifndef LOGTEST_LOG_LOG_ERRORS_HPP
#define LOGTEST_LOG_LOG_ERRORS_HPP

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

#include <wise_enum.h>

namespace logtest::log {

/**
 * Logging setup error codes compatible with std::error_code
 *
 * Reported by configuration validation, Logger::apply and the test setup
 * entry points.
 */
// clang-format off
enum class LogErrc : std::uint8_t {
    Success,            //!< Operation succeeded
    InvalidTargetName,  //!< A target name is empty or contains invalid characters
    InvalidPattern,     //!< The format pattern does not contain %(message)
    NoSinks,            //!< The configuration routes to no sink at all
    NullSink,           //!< A sink entry holds no sink object
    DuplicateSinkName,  //!< Two sink entries share a name
    BackendStartFailed, //!< The logging backend thread could not be started
    GuardAlreadyHeld,   //!< The calling thread already holds the serialization guard
    GuardNotHeld,       //!< An exclusive operation was given a guard that holds nothing
    LockTimeout         //!< The serialization guard was not acquired before the deadline
};
// clang-format on

static_assert(
        static_cast<std::uint32_t>(LogErrc::LockTimeout) <= std::numeric_limits<std::uint8_t>::max(),
        "LogErrc enumerator values must fit in std::uint8_t");

} // namespace logtest::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        logtest::log::LogErrc,
        Success,
        InvalidTargetName,
        InvalidPattern,
        NoSinks,
        NullSink,
        DuplicateSinkName,
        BackendStartFailed,
        GuardAlreadyHeld,
        GuardNotHeld,
        LockTimeout)

// Register LogErrc as an error code enum to enable implicit conversion to
// std::error_code
namespace std {
template <> struct is_error_code_enum<logtest::log::LogErrc> : true_type {};
} // namespace std

namespace logtest::log {

/**
 * Custom error category for logging setup errors
 */
class LogErrorCategory final : public std::error_category {
private:
    // Compile-time table indexed by the enum's underlying value
    static constexpr std::array<std::string_view, 10> KMESSAGES{
            "Success: Operation completed successfully",
            "Invalid target name: Target names must be non-empty and use only "
            "[A-Za-z0-9_.:-]",
            "Invalid pattern: The format pattern must contain %(message)",
            "No sinks: The configuration does not route to any sink",
            "Null sink: A sink entry does not hold a sink object",
            "Duplicate sink name: Sink names must be unique within a configuration",
            "Backend start failed: Unable to start the logging backend thread",
            "Guard already held: The calling thread already holds the logging test guard",
            "Guard not held: The operation requires a guard that owns the logging test lock",
            "Lock timeout: The logging test guard was not acquired before the deadline"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<LogErrc>,
            "KMESSAGES array size must match the number of LogErrc enum values");

public:
    /**
     * Get the name of this error category
     *
     * @return The category name as a C-style string
     */
    [[nodiscard]] const char *name() const noexcept override { return "logtest::log"; }

    /**
     * Get a descriptive message for the given error code
     *
     * @param[in] condition The error code value
     * @return A descriptive error message
     */
    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return "Unknown logging error: " + std::to_string(condition);
    }

    /**
     * Map logging errors to standard error conditions where applicable
     *
     * @param[in] condition The error code value
     * @return The equivalent standard error condition
     */
    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<LogErrc>(condition)) {
        case LogErrc::Success:
            return {};
        case LogErrc::InvalidTargetName:
        case LogErrc::InvalidPattern:
        case LogErrc::NoSinks:
        case LogErrc::NullSink:
        case LogErrc::DuplicateSinkName:
            return std::errc::invalid_argument;
        case LogErrc::GuardAlreadyHeld:
            return std::errc::resource_deadlock_would_occur;
        case LogErrc::GuardNotHeld:
            return std::errc::operation_not_permitted;
        case LogErrc::LockTimeout:
            return std::errc::timed_out;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

/**
 * Get the singleton instance of the logging error category
 *
 * @return Reference to the logging error category
 */
[[nodiscard]] inline const LogErrorCategory &log_category() noexcept {
    static const LogErrorCategory instance{};
    return instance;
}

/**
 * Create an error_code from a LogErrc value
 *
 * @param[in] errc The logging error code
 * @return A std::error_code representing the logging error
 */
[[nodiscard]] inline std::error_code make_error_code(const LogErrc errc) noexcept {
    return {static_cast<int>(errc), log_category()};
}

/**
 * Get the name of a LogErrc enum value
 *
 * @param[in] errc The error code
 * @return The enum name as a string
 */
[[nodiscard]] inline const char *get_error_name(const LogErrc errc) noexcept {
    return ::wise_enum::to_string(errc).data();
}

/**
 * Exception thrown by the test setup entry points
 *
 * Carries the LogErrc that made setup fail so a test aborts with a
 * descriptive message instead of running without isolation.
 */
class LoggingSetupError final : public std::system_error {
public:
    /**
     * Construct a setup error from an error code
     *
     * @param[in] ec Error that made setup fail
     * @param[in] context What the caller was doing when it failed
     */
    LoggingSetupError(const std::error_code ec, const std::string &context)
            : std::system_error(ec, context) {}
};

} // namespace logtest::log

#endif // LOGTEST_LOG_LOG_ERRORS_HPP
