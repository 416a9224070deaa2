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
#include <bit>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>

#include <core/common/base.hpp>
#include <core/common/endian.hpp>
#include <core/serialization/base.hpp>
#include <core/serialization/errors.hpp>
#include <core/serialization/stream.hpp>

//! \brief All functions dedicated to objects and types serialization
namespace bytewalk::ser {

//! \brief The scalar kinds which can be written verbatim to a stream
enum class PrimitiveKind : uint8_t {
    kBool,
    kChar,
    kChar16,
    kChar32,
    kInt8,
    kUInt8,
    kInt16,
    kUInt16,
    kInt32,
    kUInt32,
    kInt64,
    kUInt64,
    kFloat32,
    kFloat64,
};

//! \brief Returns the number of bytes a primitive kind occupies on the wire
constexpr uint32_t primitive_width(PrimitiveKind kind) noexcept {
    switch (kind) {
        using enum PrimitiveKind;
        case kBool:
        case kChar:
        case kInt8:
        case kUInt8:
            return 1U;
        case kChar16:
        case kInt16:
        case kUInt16:
            return 2U;
        case kChar32:
        case kInt32:
        case kUInt32:
        case kFloat32:
            return 4U;
        case kInt64:
        case kUInt64:
        case kFloat64:
            return 8U;
    }
    return 0U;
}

//! \brief Returns the name of a primitive kind as it appears in shape signatures
std::string_view primitive_name(PrimitiveKind kind) noexcept;

//! \brief Maps a scalar type to its primitive kind
//! \remarks Kinds are assigned by signedness and width so that e.g. long and long long map to the same kind
template <Scalar T>
constexpr PrimitiveKind primitive_kind_of() noexcept {
    using U = std::remove_cv_t<T>;
    using enum PrimitiveKind;
    if constexpr (std::same_as<U, bool>) {
        return kBool;
    } else if constexpr (std::same_as<U, char> or std::same_as<U, char8_t>) {
        return kChar;
    } else if constexpr (std::same_as<U, char16_t> or (std::same_as<U, wchar_t> and sizeof(U) == 2)) {
        return kChar16;
    } else if constexpr (std::same_as<U, char32_t> or std::same_as<U, wchar_t>) {
        return kChar32;
    } else if constexpr (std::floating_point<U>) {
        static_assert(sizeof(U) == 4 or sizeof(U) == 8, "Unsupported floating point width");
        return sizeof(U) == 4 ? kFloat32 : kFloat64;
    } else if constexpr (sizeof(U) == 1) {
        return std::signed_integral<U> ? kInt8 : kUInt8;
    } else if constexpr (sizeof(U) == 2) {
        return std::signed_integral<U> ? kInt16 : kUInt16;
    } else if constexpr (sizeof(U) == 4) {
        return std::signed_integral<U> ? kInt32 : kUInt32;
    } else {
        static_assert(sizeof(U) == 8, "Unsupported integral width");
        return std::signed_integral<U> ? kInt64 : kUInt64;
    }
}

//! \brief ssizeof stands for serialized size of. Returns the serialized size of scalar types
template <typename T>
inline constexpr uint32_t ssizeof = sizeof(T);
template <>
inline constexpr uint32_t ssizeof<bool> = 1U;

//! \brief Lowest level serialization for scalar types
//! \remarks Multi-byte scalars are always written little endian
template <Scalar T>
inline outcome::result<void> write_data(ByteStream& stream, T obj) {
    if constexpr (std::same_as<T, bool>) {
        return stream.push_back(static_cast<uint8_t>(obj ? 0x01 : 0x00));
    } else {
        std::array<uint8_t, sizeof(T)> bytes{};
        if constexpr (sizeof(T) == 1) {
            bytes[0] = std::bit_cast<uint8_t>(obj);
        } else if constexpr (sizeof(T) == 2) {
            endian::store_little_u16(bytes.data(), std::bit_cast<uint16_t>(obj));
        } else if constexpr (sizeof(T) == 4) {
            endian::store_little_u32(bytes.data(), std::bit_cast<uint32_t>(obj));
        } else {
            static_assert(sizeof(T) == 8, "Unsupported scalar width");
            endian::store_little_u64(bytes.data(), std::bit_cast<uint64_t>(obj));
        }
        return stream.write(bytes);
    }
}

//! \brief Lowest level deserialization for scalar types
template <Scalar T>
inline outcome::result<void> read_data(ByteStream& stream, T& object) {
    const auto read_result{stream.read(ssizeof<T>)};
    if (read_result.has_error()) return read_result.error();
    const uint8_t* data{read_result.value().data()};
    if constexpr (std::same_as<T, bool>) {
        object = (data[0] == 0x01);
    } else if constexpr (sizeof(T) == 1) {
        object = std::bit_cast<T>(data[0]);
    } else if constexpr (sizeof(T) == 2) {
        object = std::bit_cast<T>(endian::load_little_u16(data));
    } else if constexpr (sizeof(T) == 4) {
        object = std::bit_cast<T>(endian::load_little_u32(data));
    } else {
        static_assert(sizeof(T) == 8, "Unsupported scalar width");
        object = std::bit_cast<T>(endian::load_little_u64(data));
    }
    return outcome::success();
}

//! \brief Lowest level deserialization for scalar types
template <Scalar T>
inline outcome::result<T> read_as(ByteStream& stream) {
    T ret{};
    if (const auto read_result{read_data(stream, ret)}; read_result.has_error()) {
        return read_result.error();
    }
    return ret;
}

//! \brief Writes a scalar of the given kind from an untyped memory location
//! \remarks src must point to an object whose width matches the width of kind
[[nodiscard]] outcome::result<void> write_primitive(ByteStream& stream, PrimitiveKind kind, const void* src);

//! \brief Reads a scalar of the given kind into an untyped memory location
//! \remarks dst must point to an object whose width matches the width of kind
[[nodiscard]] outcome::result<void> read_primitive(ByteStream& stream, PrimitiveKind kind, void* dst);

//! \brief Writes text as a 2 bytes little endian byte count followed by the raw bytes
[[nodiscard]] outcome::result<void> write_text(ByteStream& stream, std::string_view text);

//! \brief Reads text written by write_text
[[nodiscard]] outcome::result<std::string> read_text(ByteStream& stream);

}  // namespace bytewalk::ser
