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

#ifndef LOGTEST_LOG_SINKS_HPP
#define LOGTEST_LOG_SINKS_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <quill/core/LogLevel.h>
#include <quill/core/MacroMetadata.h>
#include <quill/sinks/Sink.h>

namespace logtest::log {

/**
 * Ordered, thread-safe sequence of formatted log lines
 *
 * Shared between the CaptureSink that appends and the test that reads.
 * Records are never removed by the sink.
 */
class CapturedLog final {
public:
    /**
     * Append one formatted line
     *
     * @param[in] line Formatted log statement
     */
    void append(std::string line);

    /**
     * Copy the current sequence
     *
     * @return Lines in arrival order
     */
    [[nodiscard]] std::vector<std::string> snapshot() const;

    /**
     * Get the number of captured lines
     *
     * @return Line count
     */
    [[nodiscard]] std::size_t size() const;

    /**
     * Drop every captured line
     */
    void clear();

private:
    mutable std::mutex mutex_;      //!< Guards lines_
    std::vector<std::string> lines_; //!< Captured lines in arrival order
};

/**
 * Quill sink that stores every formatted statement in a CapturedLog
 */
class CaptureSink final : public quill::Sink {
public:
    /**
     * Create a capture sink over a fresh CapturedLog
     */
    CaptureSink();

    /**
     * Create a capture sink appending to an existing CapturedLog
     *
     * @param[in] logs Sequence to append to
     */
    explicit CaptureSink(std::shared_ptr<CapturedLog> logs);

    void write_log(
            quill::MacroMetadata const *log_metadata,
            uint64_t log_timestamp,
            std::string_view thread_id,
            std::string_view thread_name,
            std::string const &process_id,
            std::string_view logger_name,
            quill::LogLevel log_level,
            std::string_view log_level_description,
            std::string_view log_level_short_code,
            std::vector<std::pair<std::string, std::string>> const *named_args,
            std::string_view log_message,
            std::string_view log_statement) override;

    void flush_sink() noexcept override {}

    /**
     * Get the shared sequence this sink appends to
     *
     * @return Handle to the captured lines
     */
    [[nodiscard]] const std::shared_ptr<CapturedLog> &logs() const noexcept { return logs_; }

private:
    std::shared_ptr<CapturedLog> logs_;
};

/**
 * Quill sink that prints every statement to standard output
 *
 * Writes through std::cout and flushes after each record so harnesses that
 * redirect stdout (e.g. testing::internal::CaptureStdout) see the output of
 * the test that produced it.
 */
class TestConsoleSink final : public quill::Sink {
public:
    void write_log(
            quill::MacroMetadata const *log_metadata,
            uint64_t log_timestamp,
            std::string_view thread_id,
            std::string_view thread_name,
            std::string const &process_id,
            std::string_view logger_name,
            quill::LogLevel log_level,
            std::string_view log_level_description,
            std::string_view log_level_short_code,
            std::vector<std::pair<std::string, std::string>> const *named_args,
            std::string_view log_message,
            std::string_view log_statement) override;

    // Every statement is flushed as it is written
    void flush_sink() noexcept override {}
};

} // namespace logtest::log

#endif // LOGTEST_LOG_SINKS_HPP
