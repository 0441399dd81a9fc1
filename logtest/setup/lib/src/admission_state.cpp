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

#include <cstddef>      // for size_t
#include <memory>       // for shared_ptr, make_shared
#include <mutex>        // for lock_guard, unique_lock
#include <system_error> // for error_code
#include <utility>      // for move

#include "log/log_errors.hpp"           // for LogErrc
#include "log/log_macros.hpp"           // for LT_LOGT_DEBUG, LT_LOGT_ERROR
#include "log/logger.hpp"               // for Logger
#include "log/logging_config.hpp"       // for LoggingConfig
#include "setup/admission_state.hpp"    // for AdmissionState, InitState
#include "setup/serialization_lock.hpp" // for SerializationGuard, SerializationLock

namespace logtest::setup {

AdmissionState::AdmissionState(ApplyFn apply, SerializationLock &lock)
        : apply_{std::move(apply)}, lock_{lock} {}

std::error_code AdmissionState::init_once(const log::LoggingConfig &config) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return state_ != InitState::Initializing; });

    if (once_ != nullptr) {
        const bool differs = *once_ != config;
        lock.unlock();
        if (differs) {
            LT_LOGT_DEBUG(
                    "logtest",
                    "Logging already initialized; ignoring a different configuration "
                    "with {} sink(s) and {} target(s)",
                    config.sinks.size(),
                    config.targets.size());
        }
        return {};
    }

    // The exclusive holder owns the facility; install when its guard is released
    if (exclusive_active_) {
        if (const auto ec = config.validate(); ec) {
            return ec;
        }
        once_ = std::make_shared<const log::LoggingConfig>(config);
        return {};
    }

    const auto ec = install(config, lock);
    if (!ec) {
        once_ = installed_;
    }
    return ec;
}

std::error_code
AdmissionState::reconfigure(const log::LoggingConfig &config, SerializationGuard &guard) {
    if (!guard.owns(lock_)) {
        return log::LogErrc::GuardNotHeld;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return state_ != InitState::Initializing; });

    const auto ec = install(config, lock);
    if (ec || exclusive_active_) {
        return ec;
    }
    exclusive_active_ = true;
    lock.unlock();

    guard.on_release([this] { end_exclusive(); });
    return ec;
}

void AdmissionState::end_exclusive() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return state_ != InitState::Initializing; });
    exclusive_active_ = false;

    const bool restore_once = once_ != nullptr;
    const log::LoggingConfig config = restore_once ? *once_ : log::LoggingConfig::silent();
    const auto ec = install(config, lock);
    if (!ec && !restore_once) {
        state_ = InitState::Uninitialized;
    }
    lock.unlock();

    if (ec) {
        LT_LOGT_ERROR(
                "logtest", "Failed to restore logging after an exclusive setup: {}", ec.message());
    }
}

std::error_code
AdmissionState::install(const log::LoggingConfig &config, std::unique_lock<std::mutex> &lock) {
    const InitState previous = state_;
    state_ = InitState::Initializing;
    lock.unlock();

    std::error_code ec;
    try {
        ec = apply_(config);
    } catch (...) {
        lock.lock();
        state_ = previous;
        cv_.notify_all();
        throw;
    }

    lock.lock();
    if (ec) {
        state_ = previous;
    } else {
        state_ = InitState::Initialized;
        installed_ = std::make_shared<const log::LoggingConfig>(config);
        ++apply_count_;
    }
    cv_.notify_all();
    return ec;
}

InitState AdmissionState::state() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t AdmissionState::apply_count() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return apply_count_;
}

std::shared_ptr<const log::LoggingConfig> AdmissionState::installed_config() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return installed_;
}

std::shared_ptr<const log::LoggingConfig> AdmissionState::once_config() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return once_;
}

bool AdmissionState::exclusive_active() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return exclusive_active_;
}

AdmissionState &AdmissionState::global() {
    static AdmissionState instance{
            [](const log::LoggingConfig &config) { return log::Logger::apply(config); },
            SerializationLock::global()};
    return instance;
}

} // namespace logtest::setup
