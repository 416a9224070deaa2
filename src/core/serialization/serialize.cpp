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

#include "serialize.hpp"

#include <gsl/gsl_util>

#include <core/common/assert.hpp>
#include <core/common/cast.hpp>

namespace bytewalk::ser {

std::string_view primitive_name(PrimitiveKind kind) noexcept {
    switch (kind) {
        using enum PrimitiveKind;
        case kBool:
            return "bool";
        case kChar:
            return "char";
        case kChar16:
            return "char16";
        case kChar32:
            return "char32";
        case kInt8:
            return "int8";
        case kUInt8:
            return "uint8";
        case kInt16:
            return "int16";
        case kUInt16:
            return "uint16";
        case kInt32:
            return "int32";
        case kUInt32:
            return "uint32";
        case kInt64:
            return "int64";
        case kUInt64:
            return "uint64";
        case kFloat32:
            return "float32";
        case kFloat64:
            return "float64";
    }
    return "unknown";
}

outcome::result<void> write_primitive(ByteStream& stream, PrimitiveKind kind, const void* src) {
    if (kind == PrimitiveKind::kBool) {
        bool value{false};
        std::memcpy(&value, src, sizeof(bool));
        return write_data(stream, value);
    }
    // Objects are copied into same-width unsigned integers so any scalar type with a matching width
    // (e.g. long vs long long, float vs uint32_t) can be handled without aliasing concerns
    switch (primitive_width(kind)) {
        case 1U: {
            uint8_t value{0};
            std::memcpy(&value, src, sizeof(value));
            return write_data(stream, value);
        }
        case 2U: {
            uint16_t value{0};
            std::memcpy(&value, src, sizeof(value));
            return write_data(stream, value);
        }
        case 4U: {
            uint32_t value{0};
            std::memcpy(&value, src, sizeof(value));
            return write_data(stream, value);
        }
        case 8U: {
            uint64_t value{0};
            std::memcpy(&value, src, sizeof(value));
            return write_data(stream, value);
        }
        default:
            ASSERT(false && "Should not happen");
    }
    return Error::kUnexpectedError;
}

outcome::result<void> read_primitive(ByteStream& stream, PrimitiveKind kind, void* dst) {
    if (kind == PrimitiveKind::kBool) {
        const auto value{read_as<bool>(stream)};
        if (value.has_error()) return value.error();
        std::memcpy(dst, &value.value(), sizeof(bool));
        return outcome::success();
    }
    switch (primitive_width(kind)) {
        case 1U: {
            const auto value{read_as<uint8_t>(stream)};
            if (value.has_error()) return value.error();
            std::memcpy(dst, &value.value(), sizeof(uint8_t));
            return outcome::success();
        }
        case 2U: {
            const auto value{read_as<uint16_t>(stream)};
            if (value.has_error()) return value.error();
            std::memcpy(dst, &value.value(), sizeof(uint16_t));
            return outcome::success();
        }
        case 4U: {
            const auto value{read_as<uint32_t>(stream)};
            if (value.has_error()) return value.error();
            std::memcpy(dst, &value.value(), sizeof(uint32_t));
            return outcome::success();
        }
        case 8U: {
            const auto value{read_as<uint64_t>(stream)};
            if (value.has_error()) return value.error();
            std::memcpy(dst, &value.value(), sizeof(uint64_t));
            return outcome::success();
        }
        default:
            ASSERT(false && "Should not happen");
    }
    return Error::kUnexpectedError;
}

outcome::result<void> write_text(ByteStream& stream, std::string_view text) {
    if (text.size() > kMaxTextSize) return Error::kTextTooLong;
    if (const auto result{write_data(stream, gsl::narrow_cast<uint16_t>(text.size()))}; result.has_error()) {
        return result.error();
    }
    return stream.write(string_view_to_byte_view(text));
}

outcome::result<std::string> read_text(ByteStream& stream) {
    const auto text_length{read_as<uint16_t>(stream)};
    if (text_length.has_error()) return text_length.error();
    const auto data{stream.read(text_length.value())};
    if (data.has_error()) return data.error();
    return std::string(byte_view_to_string_view(data.value()));
}

}  // namespace bytewalk::ser
