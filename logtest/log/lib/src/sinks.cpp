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

#include <cstdint>     // for uint64_t
#include <iostream>    // for cout
#include <memory>      // for shared_ptr, make_shared
#include <mutex>       // for lock_guard
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move, pair
#include <vector>      // for vector

#include <quill/core/LogLevel.h>      // for LogLevel
#include <quill/core/MacroMetadata.h> // for MacroMetadata

#include "log/sinks.hpp" // for CapturedLog, CaptureSink, TestConsoleSink

namespace logtest::log {

namespace {
/**
 * Strip the line terminator appended by the pattern formatter
 *
 * @param[in] statement Formatted statement
 * @return Statement without its trailing newline
 */
std::string_view strip_newline(std::string_view statement) {
    if (!statement.empty() && statement.back() == '\n') {
        statement.remove_suffix(1);
    }
    return statement;
}
} // anonymous namespace

void CapturedLog::append(std::string line) {
    const std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
}

std::vector<std::string> CapturedLog::snapshot() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

std::size_t CapturedLog::size() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

void CapturedLog::clear() {
    const std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

CaptureSink::CaptureSink() : logs_{std::make_shared<CapturedLog>()} {}

CaptureSink::CaptureSink(std::shared_ptr<CapturedLog> logs) : logs_{std::move(logs)} {
    if (!logs_) {
        logs_ = std::make_shared<CapturedLog>();
    }
}

void CaptureSink::write_log(
        quill::MacroMetadata const * /* log_metadata */,
        uint64_t /* log_timestamp */,
        std::string_view /* thread_id */,
        std::string_view /* thread_name */,
        std::string const & /* process_id */,
        std::string_view /* logger_name */,
        quill::LogLevel /* log_level */,
        std::string_view /* log_level_description */,
        std::string_view /* log_level_short_code */,
        std::vector<std::pair<std::string, std::string>> const * /* named_args */,
        std::string_view /* log_message */,
        std::string_view log_statement) {
    logs_->append(std::string{strip_newline(log_statement)});
}

void TestConsoleSink::write_log(
        quill::MacroMetadata const * /* log_metadata */,
        uint64_t /* log_timestamp */,
        std::string_view /* thread_id */,
        std::string_view /* thread_name */,
        std::string const & /* process_id */,
        std::string_view /* logger_name */,
        quill::LogLevel /* log_level */,
        std::string_view /* log_level_description */,
        std::string_view /* log_level_short_code */,
        std::vector<std::pair<std::string, std::string>> const * /* named_args */,
        std::string_view /* log_message */,
        std::string_view log_statement) {
    std::cout << log_statement << std::flush;
}

} // namespace logtest::log
