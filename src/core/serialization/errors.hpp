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
#include <string>

#include <boost/system/error_code.hpp>
#include <magic_enum.hpp>

namespace bytewalk::ser {

enum class Error {
    kSuccess,                // Not actually an error
    kInvalidArgument,        // A null value or an empty buffer has been provided
    kNoSerializableFields,   // A record type exposes no usable field
    kDynamicElementType,     // A sequence element type cannot be resolved statically
    kUnsupportedType,        // No classification rule matches the type
    kInputTooLarge,          // The write operation would exceed the maximum stream size
    kTextTooLong,            // The text does not fit the 2 bytes length prefix
    kSequenceTooLong,        // The sequence element count exceeds the configured maximum
    kReadOverflow,           // The read operation would overflow the buffer
    kLengthQueueEmpty,       // A sequence length has been requested but none has been relayed
    kLengthQueueNotDrained,  // Relayed sequence lengths have not been entirely consumed
    kExtentMismatch,         // The relayed count does not match the extent of a fixed size array
    kTrailingData,           // Unconsumed bytes remain after a complete decode
    kShapeMismatch,          // The payload signature does not match the decoding type
    kUnexpectedError,        // An unexpected error occurred
};

//! \brief Groups error codes by the party which is expected to amend the situation
enum class ErrorKind {
    kNone,                   // No error
    kConfiguration,          // The type declaration is not serializable as is
    kArgument,               // The value or the buffer handed to the codec is not acceptable
    kUnsupportedType,        // The type is not among the supported shapes
    kStreamUnderflow,        // The buffer is shorter than the type requires
    kProtocolMismatch,       // Encode and decode disagree about the type shape
    kInternal,               // Should not happen
};

//! \brief Returns the kind the provided error belongs to
constexpr ErrorKind error_kind(Error err) noexcept {
    switch (err) {
        using enum Error;
        case kSuccess:
            return ErrorKind::kNone;
        case kNoSerializableFields:
        case kDynamicElementType:
            return ErrorKind::kConfiguration;
        case kInvalidArgument:
        case kInputTooLarge:
        case kTextTooLong:
        case kSequenceTooLong:
            return ErrorKind::kArgument;
        case kUnsupportedType:
            return ErrorKind::kUnsupportedType;
        case kReadOverflow:
            return ErrorKind::kStreamUnderflow;
        case kLengthQueueEmpty:
        case kLengthQueueNotDrained:
        case kExtentMismatch:
        case kTrailingData:
        case kShapeMismatch:
            return ErrorKind::kProtocolMismatch;
        default:
            return ErrorKind::kInternal;
    }
}

class ErrorCategory : public boost::system::error_category {
  public:
    virtual ~ErrorCategory() noexcept = default;
    const char* name() const noexcept override { return "SerializationError"; }
    std::string message(int err_code) const override {
        std::string desc{"Unknown error"};
        if (const auto enumerator = magic_enum::enum_cast<ser::Error>(err_code); enumerator.has_value()) {
            desc.assign(std::string(magic_enum::enum_name<ser::Error>(*enumerator)));
            desc.erase(0, 1);  // Remove the constant `k` prefix
        }
        return desc;
    }
    boost::system::error_condition default_error_condition(int err_code) const noexcept override {
        const auto enumerator = magic_enum::enum_cast<ser::Error>(err_code);
        if (not enumerator.has_value()) {
            return {err_code, *this};  // No conversion
        }
        switch (error_kind(*enumerator)) {
            using enum ErrorKind;
            case kNone:
                return make_error_condition(boost::system::errc::success);
            case kConfiguration:
            case kUnsupportedType:
                return make_error_condition(boost::system::errc::not_supported);
            case kArgument:
                return make_error_condition(boost::system::errc::invalid_argument);
            case kStreamUnderflow:
                return make_error_condition(boost::system::errc::no_buffer_space);
            case kProtocolMismatch:
                return make_error_condition(boost::system::errc::protocol_error);
            default:
                return {err_code, *this};
        }
    }
};

// Overload the global make_error_code() free function with our
// custom enum. It will be found via ADL by the compiler if needed.
inline boost::system::error_code make_error_code(ser::Error err_code) {
    static ser::ErrorCategory category{};
    return {static_cast<int>(err_code), category};
}
}  // namespace bytewalk::ser

namespace boost::system {
// Tell the C++ 11 STL metaprogramming that our enums are registered with the
// error code system
template <>
struct is_error_code_enum<bytewalk::ser::Error> : public std::true_type {};
}  // namespace boost::system
