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

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include <core/common/outcome.hpp>

namespace bytewalk {

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T>;

template <class T>
concept SignedIntegral = std::signed_integral<T>;

template <class T>
concept Integral = UnsignedIntegral<T> or SignedIntegral<T>;

//! \brief Scalars with a fixed natural width which can be written verbatim to a stream
//! \remarks long double is excluded as its width and layout are platform dependent
template <class T>
concept Scalar = std::is_arithmetic_v<T> and not std::same_as<std::remove_cv_t<T>, long double>;

//! \brief Stores and manipulates arbitrary long byte sequences
using Bytes = std::basic_string<uint8_t>;

//! \brief Represents a non-owning view of a byte sequence
class ByteView : public std::basic_string_view<uint8_t> {
  public:
    constexpr ByteView() noexcept = default;

    constexpr ByteView(const std::basic_string_view<uint8_t>& other) noexcept
        : std::basic_string_view<uint8_t>{other.data(), other.length()} {}

    constexpr ByteView(const Bytes& str) noexcept : std::basic_string_view<uint8_t>{str.data(), str.length()} {}

    constexpr ByteView(const uint8_t* data, size_type length) noexcept
        : std::basic_string_view<uint8_t>{data, length} {}

    template <std::size_t N>
    constexpr ByteView(const uint8_t (&array)[N]) noexcept : std::basic_string_view<uint8_t>{array, N} {}

    template <std::size_t N>
    constexpr ByteView(const std::array<uint8_t, N>& array) noexcept
        : std::basic_string_view<uint8_t>{array.data(), N} {}

    [[nodiscard]] bool is_null() const noexcept { return data() == nullptr; }
};

// Sizes base 2 https://en.wikipedia.org/wiki/Binary_prefix
static constexpr uint64_t kKiB{1024};        // 2^{10} bytes
static constexpr uint64_t kMiB{kKiB << 10};  // 2^{20} bytes
static constexpr uint64_t kGiB{kMiB << 10};  // 2^{30} bytes

// Literals for sizes base 2
constexpr uint64_t operator"" _KiB(unsigned long long value) { return value * kKiB; }
constexpr uint64_t operator"" _MiB(unsigned long long value) { return value * kMiB; }
constexpr uint64_t operator"" _GiB(unsigned long long value) { return value * kGiB; }

}  // namespace bytewalk
