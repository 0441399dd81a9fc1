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

#include <cstdint>  // for int64_t
#include <memory>   // for make_shared

#include <benchmark/benchmark.h> // for State, BENCHMARK, BENCHMARK_MAIN

#include "log/log_capture.hpp"    // for LogCapture
#include "log/log_errors.hpp"     // for LoggingSetupError
#include "log/log_level.hpp"      // for LogLevel
#include "log/log_macros.hpp"     // for LT_LOG_INFO, LT_LOGT_DEBUG
#include "log/logger.hpp"         // for Logger
#include "log/logging_config.hpp" // for LoggingConfig
#include "log/sinks.hpp"          // for CaptureSink

namespace {

namespace fl = ::logtest::log;

constexpr int64_t BURST_SIZE = 1000; //!< Records per burst iteration

/**
 * Route all records to a fresh capture sink
 *
 * @param[in] level Root level
 * @return Capture handle over the new sink
 */
fl::LogCapture configure_capture(const fl::LogLevel level) {
    auto sink = std::make_shared<fl::CaptureSink>();
    fl::LogCapture capture{sink->logs()};
    fl::LoggingConfig config = fl::LoggingConfig::capture(sink, level, "%(message)");
    config.with_target("bench", fl::LogLevel::Debug);
    if (const auto ec = fl::Logger::apply(config); ec) {
        throw fl::LoggingSetupError(ec, "configuring benchmark logging");
    }
    return capture;
}

void capture_logging(benchmark::State &state) {
    const auto capture = configure_capture(fl::LogLevel::Info);
    int64_t counter = 0;
    for (auto _ : state) {
        LT_LOG_INFO("Captured record {}", counter++);
    }
    fl::Logger::flush();
    capture.logs()->clear();
    state.SetItemsProcessed(state.iterations());
}

void target_logging(benchmark::State &state) {
    const auto capture = configure_capture(fl::LogLevel::Warn);
    int64_t counter = 0;
    for (auto _ : state) {
        LT_LOGT_DEBUG("bench", "Target record {}", counter++);
    }
    fl::Logger::flush();
    capture.logs()->clear();
    state.SetItemsProcessed(state.iterations());
}

void filtered_logging(benchmark::State &state) {
    const auto capture = configure_capture(fl::LogLevel::Warn);
    int64_t counter = 0;
    for (auto _ : state) {
        LT_LOG_DEBUG("Filtered record {}", counter++);
    }
    benchmark::DoNotOptimize(counter);
    state.SetItemsProcessed(state.iterations());
}

void burst_capture_logging(benchmark::State &state) {
    const auto capture = configure_capture(fl::LogLevel::Info);
    for (auto _ : state) {
        for (int64_t i = 0; i < BURST_SIZE; ++i) {
            LT_LOG_INFO("Burst record {}", i);
        }
        fl::Logger::flush();
        state.PauseTiming();
        capture.logs()->clear();
        state.ResumeTiming();
    }
    state.SetItemsProcessed(state.iterations() * BURST_SIZE);
}

void reconfigure(benchmark::State &state) {
    auto sink = std::make_shared<fl::CaptureSink>();
    const auto config = fl::LoggingConfig::capture(sink, fl::LogLevel::Info);
    for (auto _ : state) {
        if (const auto ec = fl::Logger::apply(config); ec) {
            state.SkipWithError(ec.message().c_str());
            break;
        }
    }
}

void multi_threaded_capture_logging(benchmark::State &state) {
    // The loop start is a barrier, so every thread logs into this configuration
    if (state.thread_index() == 0) {
        const auto capture = configure_capture(fl::LogLevel::Info);
        benchmark::DoNotOptimize(capture.logs().get());
    }
    int64_t counter = 0;
    for (auto _ : state) {
        LT_LOG_INFO("Thread {} record {}", state.thread_index(), counter++);
    }
    fl::Logger::flush();
    state.SetItemsProcessed(state.iterations());
}

} // namespace

// Register benchmarks

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

BENCHMARK(capture_logging);
BENCHMARK(target_logging);
BENCHMARK(filtered_logging);
BENCHMARK(burst_capture_logging);
BENCHMARK(reconfigure);
BENCHMARK(multi_threaded_capture_logging)->ThreadRange(1, 8);

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

BENCHMARK_MAIN();
