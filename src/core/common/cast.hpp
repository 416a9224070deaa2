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
#include <string_view>

#include <core/common/base.hpp>

namespace bytewalk {

//! \brief Views text as raw bytes without copying
inline ByteView string_view_to_byte_view(std::string_view v) {
    return {reinterpret_cast<const uint8_t*>(v.data()), v.length()};
}

//! \brief Views raw bytes as text without copying
inline std::string_view byte_view_to_string_view(ByteView v) {
    return {reinterpret_cast<const char*>(v.data()), v.length()};
}

}  // namespace bytewalk
