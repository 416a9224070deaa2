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
#include <optional>
#include <string>

#include <core/common/base.hpp>
#include <core/serialization/base.hpp>
#include <core/serialization/errors.hpp>

namespace bytewalk::ser {

//! \brief A contiguous append-only write buffer paired with a forward-only read cursor
//! \remarks There is no seeking nor rewinding: data is consumed exactly once in the order it has been written
class ByteStream {
  public:
    using size_type = typename Bytes::size_type;
    using value_type = typename Bytes::value_type;

    explicit ByteStream(size_type max_size = kMaxStreamSize) : max_size_{max_size} {}
    explicit ByteStream(ByteView data, size_type max_size = kMaxStreamSize);
    ByteStream(ByteStream&& other) noexcept = default;
    ByteStream& operator=(ByteStream&& other) noexcept = default;
    ~ByteStream() = default;

    //! \brief Appends provided data to internal buffer
    [[nodiscard]] outcome::result<void> write(ByteView data);

    //! \brief Appends provided data to internal buffer
    [[nodiscard]] outcome::result<void> write(const uint8_t* ptr, size_type count);

    //! \brief Appends a single byte to internal buffer
    [[nodiscard]] outcome::result<void> push_back(value_type item);

    //! \brief Returns a view of requested bytes count from the actual read position
    //! \remarks After the view is returned the read position is advanced by count
    //! \remarks If count is omitted the whole unconsumed part of data is returned
    //! \remarks Should count exceed the unconsumed part of data kReadOverflow is returned and the read position
    //! is left untouched
    [[nodiscard]] outcome::result<ByteView> read(std::optional<size_type> count = std::nullopt) noexcept;

    //! \brief Whether the end of stream's data has been reached
    [[nodiscard]] bool eof() const noexcept;

    //! \brief Returns the size of the contained data
    [[nodiscard]] size_type size() const noexcept;

    //! \brief Whether this stream contains any data
    [[nodiscard]] bool empty() const noexcept;

    //! \brief Returns the size of yet-to-be-consumed data
    [[nodiscard]] size_type avail() const noexcept;

    //! \brief Returns the current read position
    [[nodiscard]] size_type tellg() const noexcept;

    //! \brief Returns a view of the whole written data
    [[nodiscard]] ByteView view() const noexcept;

    //! \brief Moves the written data out of the stream
    //! \remarks After this operation the stream is empty and eof() == true
    [[nodiscard]] Bytes release() noexcept;

    //! \brief Clears data and moves the read position to the beginning
    void clear() noexcept;

    //! \brief Returns the hexed representation of the data buffer
    [[nodiscard]] std::string to_string() const;

  private:
    size_type max_size_;          // Max number of bytes this stream may hold
    Bytes buffer_{};              // Data buffer
    size_type read_position_{0};  // Current read position
};

}  // namespace bytewalk::ser
