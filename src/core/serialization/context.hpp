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
#include <deque>
#include <string>
#include <string_view>

#include <boost/noncopyable.hpp>

#include <core/common/outcome.hpp>
#include <core/serialization/base.hpp>
#include <core/serialization/length_queue.hpp>
#include <core/serialization/stream.hpp>

namespace bytewalk::ser {

//! \brief Collects the location of a failure while the error unwinds the recursive descent
//! \details Every level of the walk which propagates an error prepends where it was (a field name or an element
//! index), so that once the error reaches the top the full path to the offending field is known.
class Trail {
  public:
    //! \brief Records the name of the field being walked when an error occurred
    void unwind(std::string_view field_name);

    //! \brief Records the index of the sequence element being walked when an error occurred
    void unwind(size_t element_index);

    //! \brief Returns the dotted path to the field where the error occurred (e.g. "SubLogs[1].Secret")
    //! \remarks Empty if nothing has been recorded or if the error is about the top-level value itself
    [[nodiscard]] std::string path() const;

    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    void clear() noexcept { segments_.clear(); }

  private:
    std::deque<std::string> segments_{};  // Outermost segment first
};

//! \brief Everything a single top-level encode or decode call works on
//! \details Binds the byte stream, the length relay queue, the settings and the failure trail of one call.
//! Both strategies thread it by reference through the recursive descent, hence no state is shared among
//! concurrent calls.
class Context : private boost::noncopyable {
  public:
    Context(ByteStream& stream, LengthQueue& lengths, const Settings& settings, Trail& trail) noexcept
        : stream_{stream}, lengths_{lengths}, settings_{settings}, trail_{trail} {}

    [[nodiscard]] ByteStream& stream() noexcept { return stream_; }
    [[nodiscard]] LengthQueue& lengths() noexcept { return lengths_; }
    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }
    [[nodiscard]] Trail& trail() noexcept { return trail_; }

    void unwind(std::string_view field_name) { trail_.unwind(field_name); }
    void unwind(size_t element_index) { trail_.unwind(element_index); }

    //! \brief Dequeues the relayed count of the next sequence to be decoded
    //! \remarks Counts beyond Settings::max_sequence_count fail with kSequenceTooLong before anything is allocated
    [[nodiscard]] outcome::result<size_t> next_count();

    //! \brief Returns how many elements a sequence of count elements may reserve in advance
    //! \details Bounded by the unread bytes of the stream, whatever count the length queue relays. Containers still
    //! grow past the hint when their elements take no bytes at all (e.g. empty nested sequences)
    [[nodiscard]] size_t reserve_hint(size_t count) const noexcept;

  private:
    ByteStream& stream_;
    LengthQueue& lengths_;
    const Settings& settings_;
    Trail& trail_;
};

}  // namespace bytewalk::ser
