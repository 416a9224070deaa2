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

#pragma once
#include <cstdint>
#include <deque>
#include <initializer_list>

#include <core/common/outcome.hpp>
#include <core/serialization/base.hpp>
#include <core/serialization/errors.hpp>

namespace bytewalk::ser {

//! \brief Relays sequence element counts from encode to decode
//! \details Sequences are never length-prefixed on the wire. Instead every sequence encountered during an encode
//! enqueues its element count here, and the matching decode dequeues the counts in the very same order.
//! This only holds as long as both traversals are depth-first, left to right and walk identical type shapes.
//! \remarks An instance is scoped to a single top-level call and is not meant to be shared across threads
class LengthQueue {
  public:
    using value_type = uint32_t;
    using container_type = std::deque<value_type>;

    explicit LengthQueue(value_type max_count = kMaxSequenceCount) : max_count_{max_count} {}
    LengthQueue(std::initializer_list<value_type> counts, value_type max_count = kMaxSequenceCount);

    //! \brief Appends the element count of a sequence being encoded
    //! \remarks Counts beyond the configured maximum fail with kSequenceTooLong
    [[nodiscard]] outcome::result<void> enqueue(size_t count);

    //! \brief Pops the element count of the next sequence being decoded
    //! \remarks An empty queue signals an encode/decode shape disagreement and fails with kLengthQueueEmpty
    [[nodiscard]] outcome::result<value_type> dequeue() noexcept;

    [[nodiscard]] size_t size() const noexcept { return counts_.size(); }
    [[nodiscard]] bool empty() const noexcept { return counts_.empty(); }
    [[nodiscard]] const container_type& items() const noexcept { return counts_; }
    [[nodiscard]] value_type max_count() const noexcept { return max_count_; }

    void clear() noexcept { counts_.clear(); }

    bool operator==(const LengthQueue& other) const noexcept { return counts_ == other.counts_; }

  private:
    value_type max_count_;
    container_type counts_{};
};

}  // namespace bytewalk::ser
