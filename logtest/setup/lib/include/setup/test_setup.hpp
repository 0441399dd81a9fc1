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

#ifndef LOGTEST_SETUP_TEST_SETUP_HPP
#define LOGTEST_SETUP_TEST_SETUP_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "log/log_capture.hpp"
#include "log/log_level.hpp"
#include "log/logging_config.hpp"
#include "setup/serialization_lock.hpp"

namespace logtest::setup {

/**
 * Options for the exclusive setup entry points
 */
struct SetupOptions final {
    /// Longest wait for the serialization lock, unset to wait forever
    std::optional<std::chrono::milliseconds> lock_timeout;

    /**
     * Set the lock timeout
     *
     * @param[in] timeout Longest wait for the serialization lock
     * @return Reference to these options for method chaining
     */
    SetupOptions &with_lock_timeout(std::chrono::milliseconds timeout) {
        lock_timeout = timeout;
        return *this;
    }
};

/**
 * Result of an exclusive setup with capture
 *
 * Holds the serialization guard and the records captured while it lives.
 * Drop the session (or its guard) to let the next test in.
 */
struct CaptureSession final {
    SerializationGuard guard; //!< Exclusive access to global logging
    log::LogCapture logs;     //!< Records captured since setup
};

/**
 * Take exclusive control of global logging and install a configuration
 *
 * Waits for every other exclusive setup to release its guard, then applies
 * config. The returned guard keeps other exclusive setups out until it is
 * destroyed. Destroying it reinstalls the once-only configuration, or
 * silences logging if none has been accepted yet.
 *
 * @param[in] config Configuration to install
 * @param[in] options Lock wait options
 * @return Guard owning the serialization lock
 * @throws log::LoggingSetupError if the lock cannot be taken or the
 * configuration is rejected
 */
[[nodiscard]] SerializationGuard
logging_test_setup(const log::LoggingConfig &config, const SetupOptions &options = {});

/**
 * Take exclusive control of global logging and capture every record
 *
 * Installs a fresh CaptureSink for all targets at level with the given
 * pattern. The returned session sees only records emitted after setup.
 *
 * @param[in] level Minimum level captured
 * @param[in] pattern Format pattern for captured lines
 * @param[in] options Lock wait options
 * @return Guard and capture handle
 * @throws log::LoggingSetupError if the lock cannot be taken or the
 * configuration is rejected
 */
[[nodiscard]] CaptureSession logging_test_setup_capture(
        log::LogLevel level = log::LogLevel::TraceL3,
        std::string_view pattern = log::DEFAULT_PATTERN,
        const SetupOptions &options = {});

/**
 * Install a configuration the first time any caller asks for one
 *
 * Later calls are no-ops, whatever configuration they pass. Called during
 * an exclusive setup, the configuration is installed when that setup ends.
 *
 * @param[in] config Configuration to install
 * @throws log::LoggingSetupError if the first installation fails
 */
void init_logging_once(const log::LoggingConfig &config);

/**
 * Install a console configuration for a set of targets, once
 *
 * Uses the cached configuration from get_config_for().
 *
 * @param[in] targets Target names to enable
 * @param[in] level Minimum level for the listed targets
 * @param[in] pattern Format pattern
 * @throws log::LoggingSetupError if the first installation fails
 */
void init_logging_once_for(
        const std::vector<std::string> &targets,
        log::LogLevel level = log::LogLevel::Debug,
        std::string_view pattern = log::DEFAULT_PATTERN);

} // namespace logtest::setup

#endif // LOGTEST_SETUP_TEST_SETUP_HPP
