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

#include <core/common/base.hpp>

namespace bytewalk::ser {

static constexpr uint32_t kMaxSequenceCount{0x02000000};  // Max element count relayed for a single sequence
static constexpr size_t kMaxStreamSize{512_MiB};          // As safety precaution
static constexpr size_t kMaxTextSize{UINT16_MAX};         // Text length prefix is 2 bytes wide

//! \brief Selects how a type is walked during encode and decode
enum class Strategy : uint32_t {
    kCompiled,  // A plan is built once per type and reused
    kDirect     // The type shape is described and interpreted on every call
};

//! \brief Holds the limits and checks applied to a single encode or decode call
struct Settings {
    size_t max_stream_size{kMaxStreamSize};         // Writes beyond this size fail with kInputTooLarge
    uint32_t max_sequence_count{kMaxSequenceCount};  // Relayed counts beyond this value fail with kSequenceTooLong
    bool allow_trailing_data{false};                 // Whether unconsumed bytes after a decode are tolerated
    bool verify_signature{true};                     // Whether a payload signature must match the decoding type
};

}  // namespace bytewalk::ser
