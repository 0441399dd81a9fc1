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

#ifndef LOGTEST_SETUP_ADMISSION_STATE_HPP
#define LOGTEST_SETUP_ADMISSION_STATE_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>

#include <wise_enum.h>

#include "log/logging_config.hpp"
#include "setup/serialization_lock.hpp"

namespace logtest::setup {

/**
 * Lifecycle of the process-wide logging configuration
 */
enum class InitState {
    Uninitialized, //!< No configuration applied yet
    Initializing,  //!< A caller is applying a configuration right now
    Initialized    //!< A configuration is in effect
};

} // namespace logtest::setup

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(logtest::setup::InitState, Uninitialized, Initializing, Initialized)

namespace logtest::setup {

/**
 * Admission control for installing the logging configuration
 *
 * Makes sure the once-only path installs a configuration exactly once no
 * matter how many threads race for it, and that nobody observes
 * Initialized before the installation has finished. A failed installation
 * returns the state to what it was so that a later caller can retry.
 *
 * Exclusive setups go through reconfigure(), which requires a live guard on
 * the SerializationLock this state is bound to. When that guard is released
 * the once-only configuration is reinstalled; if there is none yet, a silent
 * configuration replaces the exclusive one and the state returns to
 * Uninitialized.
 */
class AdmissionState final {
public:
    /// Function that installs a configuration into the logging facility
    using ApplyFn = std::function<std::error_code(const log::LoggingConfig &)>;

    /**
     * Create an admission state over an apply function
     *
     * @param[in] apply Function that installs a configuration
     * @param[in] lock Lock whose guards authorize reconfigure()
     */
    AdmissionState(ApplyFn apply, SerializationLock &lock);

    ~AdmissionState() = default;

    // Non-copyable, non-movable
    AdmissionState(const AdmissionState &) = delete;
    AdmissionState &operator=(const AdmissionState &) = delete;
    AdmissionState(AdmissionState &&) = delete;
    AdmissionState &operator=(AdmissionState &&) = delete;

    /**
     * Install a configuration unless a once-only one was already accepted
     *
     * Blocks while another caller is installing. Once accepted, later calls
     * return success without touching the facility, even with a different
     * configuration. While an exclusive setup is active the configuration is
     * accepted but installed only when its guard is released.
     *
     * @param[in] config Configuration to install
     * @return Empty error_code on success or no-op, the apply error otherwise
     * @throws Anything the apply function throws, after resetting the state
     */
    [[nodiscard]] std::error_code init_once(const log::LoggingConfig &config);

    /**
     * Install a configuration for the holder of the serialization lock
     *
     * The first successful call under a guard sets a release hook on it that
     * restores the once-only configuration.
     *
     * @param[in] config Configuration to install
     * @param[in,out] guard Guard on the lock this state is bound to
     * @return Empty error_code on success, GuardNotHeld if the guard does not
     * own the bound lock, the apply error otherwise
     * @throws Anything the apply function throws, after resetting the state
     */
    [[nodiscard]] std::error_code
    reconfigure(const log::LoggingConfig &config, SerializationGuard &guard);

    /**
     * Get the current lifecycle state
     * @return Current state
     */
    [[nodiscard]] InitState state() const;

    /**
     * Get the number of successful installations
     *
     * Counts once-only, exclusive and restoring installations alike.
     *
     * @return Successful apply count
     */
    [[nodiscard]] std::size_t apply_count() const;

    /**
     * Get the configuration installed last
     * @return Installed configuration, nullptr if none
     */
    [[nodiscard]] std::shared_ptr<const log::LoggingConfig> installed_config() const;

    /**
     * Get the configuration accepted by the once-only path
     * @return Once-only configuration, nullptr if none yet
     */
    [[nodiscard]] std::shared_ptr<const log::LoggingConfig> once_config() const;

    /**
     * Check whether an exclusive setup currently owns the facility
     * @return true between a successful reconfigure() and its guard release
     */
    [[nodiscard]] bool exclusive_active() const;

    /**
     * Get the admission state guarding the process-wide Logger
     *
     * Bound to SerializationLock::global().
     *
     * @return Reference to the global admission state
     */
    [[nodiscard]] static AdmissionState &global();

private:
    /**
     * Run the apply function with the state set to Initializing
     *
     * Called with lock held on a state that is not Initializing; returns
     * with lock held again.
     *
     * @param[in] config Configuration to install
     * @param[in,out] lock Lock on mutex_
     * @return Apply result
     */
    [[nodiscard]] std::error_code
    install(const log::LoggingConfig &config, std::unique_lock<std::mutex> &lock);

    /// Restore the once-only or silent configuration; runs from the guard hook
    void end_exclusive();

    ApplyFn apply_;                                       //!< Installs a configuration
    SerializationLock &lock_;                             //!< Lock authorizing reconfigure()
    mutable std::mutex mutex_;                            //!< Guards the fields below
    std::condition_variable cv_;                          //!< Signalled when Initializing ends
    InitState state_{InitState::Uninitialized};           //!< Lifecycle state
    std::size_t apply_count_{0};                          //!< Successful installations
    std::shared_ptr<const log::LoggingConfig> installed_; //!< Last installed configuration
    std::shared_ptr<const log::LoggingConfig> once_;      //!< Accepted once-only configuration
    bool exclusive_active_{false};                        //!< An exclusive guard owns the facility
};

} // namespace logtest::setup

#endif // LOGTEST_SETUP_ADMISSION_STATE_HPP
