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

#include "stream.hpp"

#include <iterator>
#include <utility>

#include <boost/algorithm/hex.hpp>

namespace bytewalk::ser {

ByteStream::ByteStream(const ByteView data, size_type max_size) : max_size_{max_size} {
    buffer_.assign(data.begin(), data.end());
}

outcome::result<void> ByteStream::write(ByteView data) {
    if (data.size() > max_size_ - buffer_.size()) return Error::kInputTooLarge;
    buffer_.append(data.data(), data.size());
    return outcome::success();
}

outcome::result<void> ByteStream::write(const uint8_t* const ptr, size_type count) { return write({ptr, count}); }

outcome::result<void> ByteStream::push_back(value_type item) {
    if (buffer_.size() >= max_size_) return Error::kInputTooLarge;
    buffer_.push_back(item);
    return outcome::success();
}

outcome::result<ByteView> ByteStream::read(std::optional<size_type> count) noexcept {
    const auto bytes_being_read{count.value_or(avail())};
    if (bytes_being_read > avail()) return Error::kReadOverflow;
    ByteView ret(buffer_.data() + read_position_, bytes_being_read);
    read_position_ += bytes_being_read;
    return ret;
}

bool ByteStream::eof() const noexcept { return read_position_ >= buffer_.size(); }

ByteStream::size_type ByteStream::size() const noexcept { return buffer_.size(); }

bool ByteStream::empty() const noexcept { return buffer_.empty(); }

ByteStream::size_type ByteStream::avail() const noexcept { return buffer_.size() - read_position_; }

ByteStream::size_type ByteStream::tellg() const noexcept { return read_position_; }

ByteView ByteStream::view() const noexcept { return {buffer_.data(), buffer_.size()}; }

Bytes ByteStream::release() noexcept {
    Bytes ret{std::move(buffer_)};
    clear();
    return ret;
}

void ByteStream::clear() noexcept {
    buffer_.clear();
    read_position_ = 0;
}

std::string ByteStream::to_string() const {
    std::string ret;
    ret.reserve(buffer_.size() * 2);
    boost::algorithm::hex_lower(buffer_.begin(), buffer_.end(), std::back_inserter(ret));
    return ret;
}

}  // namespace bytewalk::ser
