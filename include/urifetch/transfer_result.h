/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of urifetch.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace urifetch {

// Status codes shared by drivers and the orchestrator. Values 2..127 are
// driver specific.
inline constexpr int kStatusSuccess{0};
inline constexpr int kStatusNotFound{1};
inline constexpr int kStatusTimeout{128};
inline constexpr int kStatusFatal{129};
inline constexpr int kStatusArchiveFailure{250};
inline constexpr int kStatusSinkConflict{251};
inline constexpr int kStatusNoDriver{252};
inline constexpr int kStatusAborted{253};

inline constexpr int kExitSuccess{0};
inline constexpr int kExitFailure{1};
inline constexpr int kExitOutputDir{254};
inline constexpr int kExitInvalidOptions{255};

struct transfer_result {
  int status{kStatusSuccess};
  std::string message{};

  bool ok() const { return status == kStatusSuccess; }
  bool not_found() const { return status == kStatusNotFound; }

  static transfer_result success() { return {}; }

  static transfer_result failure(int status, std::string message = {}) {
    return {status, std::move(message)};
  }
};

// Process exit code used when aborting on the first failed URI.
int exit_code_for_status(int status);

std::string_view status_description(int status);

} // namespace urifetch
