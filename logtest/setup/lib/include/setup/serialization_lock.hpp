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

#ifndef LOGTEST_SETUP_SERIALIZATION_LOCK_HPP
#define LOGTEST_SETUP_SERIALIZATION_LOCK_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

#include <tl/expected.hpp>

namespace logtest::setup {

class SerializationLock;

/**
 * RAII proof of exclusive access to the logging facility
 *
 * Releases the owning SerializationLock when destroyed, including during
 * stack unwinding. A moved-from guard owns nothing. A release hook, if set,
 * runs while the lock is still held.
 */
class SerializationGuard final {
public:
    /// Construct a guard that owns nothing
    SerializationGuard() = default;

    /// Destructor - releases the lock if owned
    ~SerializationGuard();

    /**
     * Move constructor - transfers ownership
     * @param[in,out] other Guard to take ownership from
     */
    SerializationGuard(SerializationGuard &&other) noexcept;

    /**
     * Move assignment - releases the current lock, then takes ownership
     * @param[in,out] other Guard to take ownership from
     * @return Reference to this guard
     */
    SerializationGuard &operator=(SerializationGuard &&other) noexcept;

    // Non-copyable
    SerializationGuard(const SerializationGuard &) = delete;
    SerializationGuard &operator=(const SerializationGuard &) = delete;

    /**
     * Check whether this guard holds a lock
     * @return true until the guard is released or moved from
     */
    [[nodiscard]] bool owns_lock() const noexcept { return lock_ != nullptr; }

    /**
     * Explicit conversion to bool for convenient checking
     * @return true if the guard holds a lock
     */
    [[nodiscard]] explicit operator bool() const noexcept { return owns_lock(); }

    /**
     * Check whether this guard holds a specific lock
     * @param[in] lock Lock to compare against
     * @return true if this guard owns lock
     */
    [[nodiscard]] bool owns(const SerializationLock &lock) const noexcept {
        return lock_ == &lock;
    }

    /**
     * Get the admission ticket this guard was served on
     * @return Ticket number, meaningful only while owns_lock()
     */
    [[nodiscard]] std::uint64_t ticket() const noexcept { return ticket_; }

    /**
     * Set the hook run right before the lock is released
     *
     * Replaces any earlier hook. Ignored if the guard owns nothing.
     *
     * @param[in] hook Callback run once, with the lock still held
     */
    void on_release(std::function<void()> hook);

    /**
     * Check whether a release hook is set
     * @return true if release() will run a hook
     */
    [[nodiscard]] bool has_release_hook() const noexcept { return static_cast<bool>(hook_); }

    /// Run the release hook, then release the lock; no-op if nothing is owned
    void release() noexcept;

private:
    friend class SerializationLock;

    SerializationGuard(SerializationLock &lock, std::uint64_t ticket) noexcept
            : lock_{&lock}, ticket_{ticket} {}

    SerializationLock *lock_{nullptr}; //!< Owned lock, nullptr if none
    std::uint64_t ticket_{0};          //!< Ticket this guard was served on
    std::function<void()> hook_;       //!< Run before the lock is released
};

/**
 * FIFO mutual-exclusion lock serializing tests that touch global logging
 *
 * Callers draw a ticket and are served strictly in arrival order. A waiter
 * that times out abandons its ticket, and the lock skips it on release.
 * Holding the lock twice from one thread would deadlock, so a second
 * acquisition by the owning thread fails with GuardAlreadyHeld.
 */
class SerializationLock final {
public:
    SerializationLock() = default;
    ~SerializationLock() = default;

    // Non-copyable, non-movable
    SerializationLock(const SerializationLock &) = delete;
    SerializationLock &operator=(const SerializationLock &) = delete;
    SerializationLock(SerializationLock &&) = delete;
    SerializationLock &operator=(SerializationLock &&) = delete;

    /**
     * Block until the lock is granted
     *
     * @return Guard owning the lock, or GuardAlreadyHeld if the calling
     * thread owns it already
     */
    [[nodiscard]] tl::expected<SerializationGuard, std::error_code> acquire();

    /**
     * Wait at most timeout for the lock
     *
     * @param[in] timeout Longest time to wait
     * @return Guard owning the lock, LockTimeout if the deadline passed, or
     * GuardAlreadyHeld if the calling thread owns it already
     */
    [[nodiscard]] tl::expected<SerializationGuard, std::error_code>
    try_acquire_for(std::chrono::milliseconds timeout);

    /**
     * Check whether any guard currently owns the lock
     * @return true while a guard is alive
     * @note Hint only, the state may change right after the check
     */
    [[nodiscard]] bool is_locked() const;

    /**
     * Check whether the calling thread acquired the live guard
     * @return true if the calling thread owns the lock
     */
    [[nodiscard]] bool held_by_current_thread() const;

    /**
     * Get the number of callers waiting for the lock
     * @return Tickets drawn but not yet served or abandoned
     */
    [[nodiscard]] std::size_t waiting() const;

    /**
     * Get the process-wide lock shared by every logging test
     *
     * @return Reference to the global lock
     */
    [[nodiscard]] static SerializationLock &global();

private:
    friend class SerializationGuard;

    using Deadline = std::chrono::steady_clock::time_point;

    /**
     * Draw a ticket and wait to be served
     *
     * @param[in] deadline Give up after this point, nullptr to wait forever
     * @return Guard on success, an error otherwise
     */
    [[nodiscard]] tl::expected<SerializationGuard, std::error_code>
    acquire_impl(const Deadline *deadline);

    /**
     * Hand the lock to the next live ticket
     * @param[in] ticket Ticket of the releasing guard
     */
    void release(std::uint64_t ticket) noexcept;

    /// Move now_serving_ past abandoned tickets; caller holds mutex_
    void skip_abandoned();

    mutable std::mutex mutex_;           //!< Guards the fields below
    std::condition_variable cv_;         //!< Signalled on every release
    std::uint64_t next_ticket_{0};       //!< Next ticket to hand out
    std::uint64_t now_serving_{0};       //!< Ticket allowed to own the lock
    bool locked_{false};                 //!< A guard owns the lock
    std::thread::id owner_;              //!< Thread that acquired the live guard
    std::set<std::uint64_t> abandoned_;  //!< Tickets whose waiter timed out
};

} // namespace logtest::setup

#endif // LOGTEST_SETUP_SERIALIZATION_LOCK_HPP
