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

/**
 * @file serialization_lock_tests.cpp
 * @brief Unit tests for SerializationLock and SerializationGuard
 */
#include <atomic>       // for atomic
#include <chrono>       // for milliseconds
#include <mutex>        // for mutex, lock_guard
#include <stdexcept>    // for runtime_error
#include <system_error> // for error_code
#include <thread>       // for thread, sleep_for
#include <utility>      // for move
#include <vector>       // for vector

#include <gtest/gtest.h> // for Test, EXPECT_EQ, TEST

#include "log/log_errors.hpp"           // for LogErrc
#include "setup/serialization_lock.hpp" // for SerializationLock, SerializationGuard

namespace {

namespace ls = ::logtest::setup;
namespace fl = ::logtest::log;

using namespace std::chrono_literals;

/**
 * Wait until a number of callers queue up on a lock
 *
 * @param[in] lock Lock to watch
 * @param[in] count Expected number of waiters
 */
void wait_for_waiters(const ls::SerializationLock &lock, const std::size_t count) {
    while (lock.waiting() < count) {
        std::this_thread::sleep_for(1ms);
    }
}

// Test: Verifies a guard owns the lock until it is destroyed
TEST(SerializationLock, GuardReleasesOnScopeExit) {
    ls::SerializationLock lock;
    {
        auto guard = lock.acquire();
        ASSERT_TRUE(guard.has_value());
        EXPECT_TRUE(guard->owns_lock());
        EXPECT_TRUE(guard->owns(lock));
        EXPECT_TRUE(lock.is_locked());
        EXPECT_TRUE(lock.held_by_current_thread());
    }
    EXPECT_FALSE(lock.is_locked());
    EXPECT_TRUE(lock.acquire().has_value());
}

// Test: Verifies a second acquisition by the owning thread fails instead of
// deadlocking
TEST(SerializationLock, ReacquireFromOwnerFails) {
    ls::SerializationLock lock;
    auto guard = lock.acquire();
    ASSERT_TRUE(guard.has_value());

    const auto again = lock.acquire();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), fl::LogErrc::GuardAlreadyHeld);

    const auto timed = lock.try_acquire_for(10ms);
    ASSERT_FALSE(timed.has_value());
    EXPECT_EQ(timed.error(), fl::LogErrc::GuardAlreadyHeld);
}

// Test: Verifies a waiter gives up with LockTimeout and the lock stays usable
TEST(SerializationLock, TimeoutWhileHeld) {
    ls::SerializationLock lock;
    auto guard = lock.acquire();
    ASSERT_TRUE(guard.has_value());

    std::error_code waiter_error;
    std::thread waiter([&lock, &waiter_error] {
        const auto result = lock.try_acquire_for(20ms);
        if (!result.has_value()) {
            waiter_error = result.error();
        }
    });
    waiter.join();
    EXPECT_EQ(waiter_error, fl::LogErrc::LockTimeout);
    EXPECT_EQ(lock.waiting(), 0U);

    guard->release();
    EXPECT_FALSE(lock.is_locked());

    const auto next = lock.try_acquire_for(20ms);
    EXPECT_TRUE(next.has_value());
}

// Test: Verifies an abandoned ticket does not block the callers behind it
TEST(SerializationLock, AbandonedTicketIsSkipped) {
    ls::SerializationLock lock;
    auto guard = lock.acquire();
    ASSERT_TRUE(guard.has_value());

    std::atomic<bool> late_acquired{false};
    std::thread impatient([&lock] { EXPECT_FALSE(lock.try_acquire_for(30ms).has_value()); });
    wait_for_waiters(lock, 1);
    std::thread patient([&lock, &late_acquired] {
        const auto result = lock.acquire();
        late_acquired = result.has_value();
    });
    impatient.join();
    wait_for_waiters(lock, 1);

    guard->release();
    patient.join();
    EXPECT_TRUE(late_acquired);
    EXPECT_FALSE(lock.is_locked());
}

// Test: Verifies critical sections never overlap
TEST(SerializationLock, MutualExclusion) {
    static constexpr int NUM_THREADS = 8;
    static constexpr int ROUNDS = 50;

    ls::SerializationLock lock;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::atomic<int> completed{0};

    std::vector<std::thread> threads;
    threads.reserve(NUM_THREADS);
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&] {
            for (int r = 0; r < ROUNDS; ++r) {
                const auto guard = lock.acquire();
                ASSERT_TRUE(guard.has_value());
                const int now = ++inside;
                int seen = max_inside.load();
                while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::yield();
                --inside;
                ++completed;
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(completed.load(), NUM_THREADS * ROUNDS);
}

// Test: Verifies waiters are served in the order they arrived
TEST(SerializationLock, FifoOrder) {
    static constexpr int NUM_WAITERS = 5;

    ls::SerializationLock lock;
    auto guard = lock.acquire();
    ASSERT_TRUE(guard.has_value());

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::thread> waiters;
    waiters.reserve(NUM_WAITERS);
    for (int i = 0; i < NUM_WAITERS; ++i) {
        waiters.emplace_back([&lock, &order_mutex, &order, i] {
            const auto waiter_guard = lock.acquire();
            ASSERT_TRUE(waiter_guard.has_value());
            const std::lock_guard<std::mutex> order_lock(order_mutex);
            order.push_back(i);
        });
        // Each waiter draws its ticket before the next one starts
        wait_for_waiters(lock, static_cast<std::size_t>(i) + 1);
    }

    guard->release();
    for (auto &waiter : waiters) {
        waiter.join();
    }

    ASSERT_EQ(order.size(), static_cast<std::size_t>(NUM_WAITERS));
    for (int i = 0; i < NUM_WAITERS; ++i) {
        EXPECT_EQ(order[static_cast<std::size_t>(i)], i);
    }
}

// Test: Verifies the lock is released when the holder unwinds with an
// exception
TEST(SerializationLock, ReleasedOnException) {
    ls::SerializationLock lock;
    EXPECT_THROW(
            {
                const auto guard = lock.acquire();
                EXPECT_TRUE(guard.has_value());
                throw std::runtime_error("test body failed");
            },
            std::runtime_error);
    EXPECT_FALSE(lock.is_locked());
}

// Test: Verifies moving a guard transfers ownership exactly once
TEST(SerializationLock, MoveTransfersOwnership) {
    ls::SerializationLock lock;
    auto acquired = lock.acquire();
    ASSERT_TRUE(acquired.has_value());

    const auto ticket = acquired->ticket();

    ls::SerializationGuard moved = std::move(*acquired);
    EXPECT_FALSE(acquired->owns_lock());
    EXPECT_TRUE(moved.owns_lock());
    EXPECT_EQ(moved.ticket(), ticket);

    ls::SerializationGuard target;
    EXPECT_FALSE(target);
    target = std::move(moved);
    EXPECT_TRUE(target);
    EXPECT_EQ(target.ticket(), ticket);
    EXPECT_TRUE(lock.is_locked());

    target.release();
    EXPECT_FALSE(lock.is_locked());
    target.release();
    EXPECT_FALSE(lock.is_locked());
}

// Test: Verifies each acquisition is served on a later ticket
TEST(SerializationLock, TicketsIncrease) {
    ls::SerializationLock lock;
    auto first = lock.acquire();
    ASSERT_TRUE(first.has_value());
    const auto first_ticket = first->ticket();
    first->release();

    auto second = lock.acquire();
    ASSERT_TRUE(second.has_value());
    EXPECT_GT(second->ticket(), first_ticket);
    EXPECT_TRUE(second->owns(lock));

    ls::SerializationLock other_lock;
    EXPECT_FALSE(second->owns(other_lock));
}

// Test: Verifies the release hook runs once, before the lock is handed on
TEST(SerializationLock, ReleaseHookRunsOnceWhileHeld) {
    ls::SerializationLock lock;
    int runs = 0;
    bool held_during_hook = false;
    {
        auto guard = lock.acquire();
        ASSERT_TRUE(guard.has_value());
        guard->on_release([&] {
            ++runs;
            held_during_hook = lock.is_locked() && lock.held_by_current_thread();
        });
        EXPECT_TRUE(guard->has_release_hook());

        guard->release();
        EXPECT_FALSE(guard->has_release_hook());
        guard->release();
    }

    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(held_during_hook);
    EXPECT_FALSE(lock.is_locked());
}

// Test: Verifies the release hook follows the guard through a move and is
// ignored by a guard that owns nothing
TEST(SerializationLock, ReleaseHookMovesWithGuard) {
    ls::SerializationLock lock;
    int runs = 0;

    ls::SerializationGuard empty;
    empty.on_release([&runs] { ++runs; });
    EXPECT_FALSE(empty.has_release_hook());

    auto acquired = lock.acquire();
    ASSERT_TRUE(acquired.has_value());
    acquired->on_release([&runs] { ++runs; });

    ls::SerializationGuard moved = std::move(*acquired);
    EXPECT_FALSE(acquired->has_release_hook());
    EXPECT_TRUE(moved.has_release_hook());

    acquired->release();
    EXPECT_EQ(runs, 0);
    moved.release();
    EXPECT_EQ(runs, 1);
}

} // namespace
