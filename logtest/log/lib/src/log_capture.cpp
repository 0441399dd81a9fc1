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

#include <algorithm>   // for count_if
#include <cstddef>     // for size_t
#include <memory>      // for shared_ptr, make_shared
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move
#include <vector>      // for vector

#include "log/log_capture.hpp" // for LogCapture
#include "log/logger.hpp"      // for Logger
#include "log/sinks.hpp"       // for CapturedLog

namespace logtest::log {

LogCapture::LogCapture(std::shared_ptr<CapturedLog> logs) : logs_{std::move(logs)} {
    if (!logs_) {
        logs_ = std::make_shared<CapturedLog>();
    }
}

std::vector<std::string> LogCapture::snapshot() const {
    Logger::flush();
    return logs_->snapshot();
}

std::size_t LogCapture::size() const {
    Logger::flush();
    return logs_->size();
}

std::size_t LogCapture::count_containing(const std::string_view text) const {
    const auto lines = snapshot();
    return static_cast<std::size_t>(
            std::count_if(lines.begin(), lines.end(), [text](const std::string &line) {
                return line.find(text) != std::string::npos;
            }));
}

} // namespace logtest::log
