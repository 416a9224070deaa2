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

#include "context.hpp"

#include <algorithm>

#include <absl/strings/str_cat.h>

namespace bytewalk::ser {

void Trail::unwind(std::string_view field_name) { segments_.emplace_front(field_name); }

void Trail::unwind(size_t element_index) { segments_.push_front(absl::StrCat("[", element_index, "]")); }

std::string Trail::path() const {
    std::string ret;
    for (const auto& segment : segments_) {
        if (not ret.empty() and not segment.starts_with('[')) ret.push_back('.');
        ret.append(segment);
    }
    return ret;
}

outcome::result<size_t> Context::next_count() {
    const auto count{lengths_.dequeue()};
    if (count.has_error()) return count.error();
    if (count.value() > settings_.max_sequence_count) return Error::kSequenceTooLong;
    return static_cast<size_t>(count.value());
}

size_t Context::reserve_hint(size_t count) const noexcept { return std::min<size_t>(count, stream_.avail()); }

}  // namespace bytewalk::ser
