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

#ifndef LOGTEST_LOG_LOG_CAPTURE_HPP
#define LOGTEST_LOG_LOG_CAPTURE_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "log/sinks.hpp"

namespace logtest::log {

/**
 * Test-facing read handle over a CapturedLog
 *
 * Shares ownership of the captured sequence with the CaptureSink that fills
 * it; the sequence lives until both are gone.
 */
class LogCapture final {
public:
    /**
     * Wrap a captured sequence
     *
     * @param[in] logs Sequence filled by a CaptureSink
     */
    explicit LogCapture(std::shared_ptr<CapturedLog> logs);

    /**
     * Flush the logger and copy the captured lines
     *
     * Records emitted by the calling thread before this call are included.
     *
     * @return Lines in arrival order
     */
    [[nodiscard]] std::vector<std::string> snapshot() const;

    /**
     * Flush the logger and count the captured lines
     *
     * @return Line count
     */
    [[nodiscard]] std::size_t size() const;

    /**
     * Flush the logger and count lines containing a substring
     *
     * @param[in] text Substring to look for
     * @return Number of lines containing text
     */
    [[nodiscard]] std::size_t count_containing(std::string_view text) const;

    /**
     * Get the underlying shared sequence
     *
     * @return Shared handle to the captured lines
     */
    [[nodiscard]] const std::shared_ptr<CapturedLog> &logs() const noexcept { return logs_; }

private:
    std::shared_ptr<CapturedLog> logs_;
};

} // namespace logtest::log

#endif // LOGTEST_LOG_LOG_CAPTURE_HPP
