/*
   Copyright 2025 The Bytewalk Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "length_queue.hpp"

namespace bytewalk::ser {

LengthQueue::LengthQueue(std::initializer_list<value_type> counts, value_type max_count)
    : max_count_{max_count}, counts_(counts) {}

outcome::result<void> LengthQueue::enqueue(size_t count) {
    if (count > max_count_) return Error::kSequenceTooLong;
    counts_.push_back(static_cast<value_type>(count));
    return outcome::success();
}

outcome::result<LengthQueue::value_type> LengthQueue::dequeue() noexcept {
    if (counts_.empty()) return Error::kLengthQueueEmpty;
    const auto ret{counts_.front()};
    counts_.pop_front();
    return ret;
}

}  // namespace bytewalk::ser
