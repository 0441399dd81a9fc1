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

#ifndef LOGTEST_LOG_LOGGER_HPP
#define LOGTEST_LOG_LOGGER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <system_error>

// Disable Quill's non-prefixed macros to avoid conflicts
#define QUILL_DISABLE_NON_PREFIXED_MACROS

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include "log/log_level.hpp"
#include "log/logging_config.hpp"

namespace logtest::log {

/**
 * Frontend options for test logging
 *
 * Uses an unbounded blocking queue so that no record emitted by a test is
 * ever dropped before it reaches a capture sink.
 */
struct TestFrontendOptions final {
    static constexpr quill::QueueType queue_type = // NOLINT(readability-identifier-naming)
            quill::QueueType::UnboundedBlocking;   //!< Never drop records
    static constexpr uint32_t initial_queue_capacity = // NOLINT(readability-identifier-naming)
            128 * 1024;                                //!< 128 KB initial capacity
    static constexpr uint32_t
            blocking_queue_retry_interval_ns = // NOLINT(readability-identifier-naming)
            800;                               //!< Retry interval when the queue is full
    static constexpr size_t unbounded_queue_max_capacity = // NOLINT(readability-identifier-naming)
            static_cast<size_t>(2) * 1024 * 1024 * 1024;   //!< 2 GB upper bound per thread
    static constexpr quill::HugePagesPolicy
            huge_pages_policy =            // NOLINT(readability-identifier-naming)
            quill::HugePagesPolicy::Never; //!< Disable huge pages for compatibility
};

/**
 * Frontend implementation alias for the test frontend options
 */
using TestFrontend = quill::FrontendImpl<TestFrontendOptions>;

/**
 * Logger implementation alias for the test frontend options
 */
using QuillLogger = quill::LoggerImpl<TestFrontendOptions>;

namespace detail {
class EmitScope;
} // namespace detail

/**
 * Process-wide logging facility
 *
 * Wraps a Quill logger whose sinks, pattern and levels come from the last
 * applied LoggingConfig. Until the first successful apply() every record is
 * discarded. Records are filtered per target before they are enqueued.
 *
 * Sinks run on the backend thread. A sink that blocks stalls flush() and
 * every LogCapture read, but never apply() or record emission.
 */
class Logger final {
public:
    /**
     * Apply a configuration to the facility
     *
     * Validates the configuration, starts the backend thread on first use,
     * creates a fresh Quill logger over the configured sinks and swaps it in
     * together with the target levels. On error the active configuration is
     * left untouched.
     *
     * @param[in] config Configuration to apply
     * @return Empty error_code on success, a LogErrc otherwise
     */
    [[nodiscard]] static std::error_code apply(const LoggingConfig &config);

    /**
     * Block until records enqueued by the calling thread reached the sinks
     *
     * Holds no facility lock while waiting. No-op if the facility was never
     * configured.
     */
    static void flush();

    /**
     * Check whether any configuration has been applied
     *
     * @return true after the first successful apply()
     */
    [[nodiscard]] static bool is_configured();

    /**
     * Get the number of successful apply() calls
     *
     * @return Configuration generation, 0 before the first apply()
     */
    [[nodiscard]] static std::uint64_t generation();

    /**
     * Get the configuration currently in effect
     *
     * @return Active configuration, or nullptr if never configured
     */
    [[nodiscard]] static std::shared_ptr<const LoggingConfig> active_config();

    /**
     * Check whether a record would pass the active filters
     *
     * @param[in] target Target name, empty for the root
     * @param[in] level Level of the record
     * @return true if the record would be emitted
     */
    [[nodiscard]] static bool should_log(std::string_view target, LogLevel level);

    /**
     * Destructor - public so the function-local instance can be destroyed
     */
    ~Logger() noexcept;

    // Non-copyable, non-movable
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

private:
    Logger() = default;

    /**
     * Get the singleton logger instance
     *
     * @return Reference to the singleton logger instance
     */
    [[nodiscard]] static Logger &get_instance();

    /**
     * Implementation for applying a configuration
     *
     * @param[in] config Configuration to apply
     * @return Empty error_code on success, a LogErrc otherwise
     */
    [[nodiscard]] std::error_code apply_impl(const LoggingConfig &config);

    /**
     * Start the backend thread if it is not running yet
     *
     * @return Empty error_code on success, BackendStartFailed otherwise
     */
    [[nodiscard]] static std::error_code ensure_backend();

    std::mutex apply_mutex_;            //!< Serializes apply() calls
    std::atomic<QuillLogger *> flush_logger_{nullptr}; //!< Never removed, used to flush
    mutable std::shared_mutex state_mutex_; //!< Guards the fields below
    QuillLogger *quill_logger_{nullptr};    //!< Logger records are enqueued on
    std::shared_ptr<const LoggingConfig> config_; //!< Configuration in effect
    std::uint64_t generation_{0};           //!< Successful apply() count

    friend class detail::EmitScope;
};

namespace detail {

/**
 * Scope of a single record emission
 *
 * Resolves the Quill logger for a record and keeps the facility from
 * swapping it out until the record has been enqueued. The Quill queue is
 * unbounded, so the shared lock is never held across a blocking call.
 */
class EmitScope final {
public:
    /**
     * Resolve the logger for a record
     *
     * @param[in] target Target name, empty for the root
     * @param[in] level Level of the record
     */
    EmitScope(std::string_view target, LogLevel level);

    /**
     * Check whether the record passes the active filters
     *
     * @return true if logger() may be used to emit the record
     */
    [[nodiscard]] bool enabled() const noexcept { return logger_ != nullptr; }

    /**
     * Get the logger to emit on
     *
     * @return Quill logger, nullptr if the record is filtered out
     */
    [[nodiscard]] QuillLogger *logger() const noexcept { return logger_; }

    // Non-copyable, non-movable
    EmitScope(const EmitScope &) = delete;
    EmitScope &operator=(const EmitScope &) = delete;
    EmitScope(EmitScope &&) = delete;
    EmitScope &operator=(EmitScope &&) = delete;

    ~EmitScope() = default;

private:
    std::shared_lock<std::shared_mutex> lock_; //!< Held until the record is enqueued
    QuillLogger *logger_{nullptr};             //!< Resolved logger or nullptr
};

} // namespace detail

} // namespace logtest::log

#endif // LOGTEST_LOG_LOGGER_HPP
