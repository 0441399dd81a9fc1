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

#include <chrono>       // for nanoseconds, microseconds
#include <cstdint>      // for uint64_t
#include <atomic>       // for memory_order
#include <memory>       // for shared_ptr, make_shared
#include <mutex>        // for lock_guard, unique_lock
#include <shared_mutex> // for shared_lock, shared_mutex
#include <string>       // for string, to_string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move
#include <vector>       // for vector

#include <quill/Backend.h>                      // for Backend
#include <quill/backend/BackendOptions.h>       // for BackendOptions
#include <quill/core/Common.h>                  // for Timezone, ClockSourceType
#include <quill/core/PatternFormatterOptions.h> // for PatternFormatterOptions
#include <quill/core/QuillError.h>              // for QuillError
#include <quill/sinks/NullSink.h>               // for NullSink
#include <quill/sinks/Sink.h>                   // for Sink

#include "log/log_errors.hpp"     // for LogErrc, make_error_code
#include "log/log_level.hpp"      // for LogLevel, passes, to_quill_level
#include "log/logger.hpp"         // for Logger, EmitScope, TestFrontend
#include "log/logging_config.hpp" // for LoggingConfig

namespace logtest::log {

namespace {
constexpr auto BACKEND_SLEEP_DURATION = std::chrono::nanoseconds{100};
} // anonymous namespace

Logger::~Logger() noexcept {
    if (quill::Backend::is_running()) {
        quill::Backend::stop();
    }
}

Logger &Logger::get_instance() {
    static Logger instance;
    return instance;
}

std::error_code Logger::apply(const LoggingConfig &config) {
    return get_instance().apply_impl(config);
}

void Logger::flush() {
    // Flush requests travel on the calling thread's queue, so a logger that is
    // never removed flushes records emitted through any generation
    QuillLogger *logger = get_instance().flush_logger_.load(std::memory_order_acquire);
    if (logger != nullptr) {
        logger->flush_log();
    }
}

bool Logger::is_configured() {
    auto &instance = get_instance();
    const std::shared_lock<std::shared_mutex> lock(instance.state_mutex_);
    return instance.config_ != nullptr;
}

std::uint64_t Logger::generation() {
    auto &instance = get_instance();
    const std::shared_lock<std::shared_mutex> lock(instance.state_mutex_);
    return instance.generation_;
}

std::shared_ptr<const LoggingConfig> Logger::active_config() {
    auto &instance = get_instance();
    const std::shared_lock<std::shared_mutex> lock(instance.state_mutex_);
    return instance.config_;
}

bool Logger::should_log(const std::string_view target, const LogLevel level) {
    auto &instance = get_instance();
    const std::shared_lock<std::shared_mutex> lock(instance.state_mutex_);
    return instance.config_ != nullptr && passes(instance.config_->level_for(target), level);
}

std::error_code Logger::ensure_backend() {
    if (quill::Backend::is_running()) {
        return {};
    }

    quill::BackendOptions backend_options;
    backend_options.thread_name = "LogTestBackend";
    backend_options.enable_yield_when_idle = true;
    backend_options.sleep_duration = BACKEND_SLEEP_DURATION;
    backend_options.log_timestamp_ordering_grace_period = std::chrono::microseconds{0};

    try {
        quill::Backend::start(backend_options);
    } catch (const quill::QuillError &) {
        return LogErrc::BackendStartFailed;
    }
    return {};
}

std::error_code Logger::apply_impl(const LoggingConfig &config) {
    if (const auto ec = config.validate(); ec) {
        return ec;
    }

    const std::lock_guard<std::mutex> apply_lock(apply_mutex_);

    if (const auto ec = ensure_backend(); ec) {
        return ec;
    }

    if (flush_logger_.load(std::memory_order_relaxed) == nullptr) {
        auto null_sink = TestFrontend::create_or_get_sink<quill::NullSink>("logtest_null");
        flush_logger_.store(
                TestFrontend::create_or_get_logger(
                        "logtest_flush",
                        std::move(null_sink),
                        quill::PatternFormatterOptions{},
                        quill::ClockSourceType::System),
                std::memory_order_release);
    }

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.reserve(config.sinks.size());
    for (const auto &spec : config.sinks) {
        sinks.push_back(spec.sink);
    }

    const quill::PatternFormatterOptions formatter_opts{
            config.pattern, config.time_format, quill::Timezone::LocalTime};

    // Each generation gets its own Quill logger: Quill binds sinks and pattern
    // at logger creation and returns the existing logger for a known name
    const std::string logger_name = "logtest_" + std::to_string(generation_ + 1);
    QuillLogger *new_logger = TestFrontend::create_or_get_logger(
            logger_name, sinks, formatter_opts, quill::ClockSourceType::System);
    new_logger->set_log_level(to_quill_level(config.lowest_level()));

    auto new_config = std::make_shared<const LoggingConfig>(config);

    QuillLogger *retired_logger = nullptr;
    {
        const std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
        retired_logger = quill_logger_;
        quill_logger_ = new_logger;
        config_ = std::move(new_config);
        ++generation_;
    }

    // No EmitScope can still hold the retired logger; the backend drains its
    // pending records before releasing it
    if (retired_logger != nullptr) {
        TestFrontend::remove_logger(retired_logger);
    }

    return {};
}

namespace detail {

EmitScope::EmitScope(const std::string_view target, const LogLevel level)
        : lock_{Logger::get_instance().state_mutex_} {
    const auto &instance = Logger::get_instance();
    if (instance.config_ != nullptr && passes(instance.config_->level_for(target), level)) {
        logger_ = instance.quill_logger_;
    }
}

} // namespace detail

} // namespace logtest::log
