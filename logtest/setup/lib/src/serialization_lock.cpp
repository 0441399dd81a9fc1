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

#include <chrono>       // for steady_clock, milliseconds
#include <functional>   // for function
#include <cstddef>      // for size_t
#include <cstdint>      // for uint64_t
#include <mutex>        // for lock_guard, unique_lock
#include <system_error> // for error_code
#include <thread>       // for this_thread
#include <utility>      // for exchange, move

#include <tl/expected.hpp> // for expected, unexpected

#include "log/log_errors.hpp"           // for LogErrc, make_error_code
#include "setup/serialization_lock.hpp" // for SerializationLock, SerializationGuard

namespace logtest::setup {

SerializationGuard::~SerializationGuard() { release(); }

SerializationGuard::SerializationGuard(SerializationGuard &&other) noexcept
        : lock_{std::exchange(other.lock_, nullptr)}, ticket_{other.ticket_},
          hook_{std::exchange(other.hook_, nullptr)} {}

SerializationGuard &SerializationGuard::operator=(SerializationGuard &&other) noexcept {
    if (this != &other) {
        release();
        lock_ = std::exchange(other.lock_, nullptr);
        ticket_ = other.ticket_;
        hook_ = std::exchange(other.hook_, nullptr);
    }
    return *this;
}

void SerializationGuard::on_release(std::function<void()> hook) {
    if (lock_ != nullptr) {
        hook_ = std::move(hook);
    }
}

void SerializationGuard::release() noexcept {
    if (lock_ == nullptr) {
        return;
    }
    if (auto hook = std::exchange(hook_, nullptr); hook) {
        hook();
    }
    std::exchange(lock_, nullptr)->release(ticket_);
}

tl::expected<SerializationGuard, std::error_code> SerializationLock::acquire() {
    return acquire_impl(nullptr);
}

tl::expected<SerializationGuard, std::error_code>
SerializationLock::try_acquire_for(const std::chrono::milliseconds timeout) {
    const Deadline deadline = std::chrono::steady_clock::now() + timeout;
    return acquire_impl(&deadline);
}

tl::expected<SerializationGuard, std::error_code>
SerializationLock::acquire_impl(const Deadline *deadline) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (locked_ && owner_ == std::this_thread::get_id()) {
        return tl::unexpected<std::error_code>(make_error_code(log::LogErrc::GuardAlreadyHeld));
    }

    const std::uint64_t ticket = next_ticket_++;
    const auto served = [this, ticket] { return now_serving_ == ticket; };

    if (deadline == nullptr) {
        cv_.wait(lock, served);
    } else if (!cv_.wait_until(lock, *deadline, served)) {
        // now_serving_ is still behind this ticket; release() skips it later
        abandoned_.insert(ticket);
        return tl::unexpected<std::error_code>(make_error_code(log::LogErrc::LockTimeout));
    }

    locked_ = true;
    owner_ = std::this_thread::get_id();
    return SerializationGuard{*this, ticket};
}

void SerializationLock::release(const std::uint64_t ticket) noexcept {
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (!locked_ || ticket != now_serving_) {
            return;
        }
        locked_ = false;
        owner_ = std::thread::id{};
        ++now_serving_;
        skip_abandoned();
    }
    cv_.notify_all();
}

void SerializationLock::skip_abandoned() {
    for (auto it = abandoned_.find(now_serving_); it != abandoned_.end();
         it = abandoned_.find(now_serving_)) {
        abandoned_.erase(it);
        ++now_serving_;
    }
}

bool SerializationLock::is_locked() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

bool SerializationLock::held_by_current_thread() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return locked_ && owner_ == std::this_thread::get_id();
}

std::size_t SerializationLock::waiting() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t outstanding = next_ticket_ - now_serving_ - (locked_ ? 1U : 0U);
    return static_cast<std::size_t>(outstanding) - abandoned_.size();
}

SerializationLock &SerializationLock::global() {
    static SerializationLock instance;
    return instance;
}

} // namespace logtest::setup
