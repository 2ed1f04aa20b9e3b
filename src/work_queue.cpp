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

#include <utility>

#include <urifetch/error.h>
#include <urifetch/work_queue.h>

namespace urifetch {

work_queue::work_queue(std::vector<std::string> seed)
    : q_(std::make_move_iterator(seed.begin()),
         std::make_move_iterator(seed.end())) {}

void work_queue::push_back(std::string uri) { q_.push_back(std::move(uri)); }

void work_queue::push_front(std::string uri) { q_.push_front(std::move(uri)); }

void work_queue::push_front(std::span<std::string const> uris) {
  q_.insert(q_.begin(), uris.begin(), uris.end());
}

std::string work_queue::pop_front() {
  URIFETCH_CHECK(!q_.empty(), "pop_front() on empty work queue");
  auto rv = std::move(q_.front());
  q_.pop_front();
  return rv;
}

} // namespace urifetch
