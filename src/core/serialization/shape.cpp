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

#include "shape.hpp"

#include <absl/strings/str_cat.h>

namespace bytewalk::ser {

std::string Shape::signature() const {
    switch (kind) {
        using enum ShapeKind;
        case kPrimitive:
            return std::string(primitive_name(primitive));
        case kText:
            return "text";
        case kEnum:
            return absl::StrCat("enum(", primitive_name(primitive), ")");
        case kSequence: {
            const std::string element_signature{element ? element->signature() : "?"};
            if (extent.has_value()) return absl::StrCat("[", element_signature, ";", *extent, "]");
            return absl::StrCat("[", element_signature, "]");
        }
        case kRecord: {
            std::string ret{"{"};
            for (const auto& field : fields) {
                if (ret.size() > 1) ret.push_back(',');
                absl::StrAppend(&ret, field.name, ":", field.shape->signature());
            }
            ret.push_back('}');
            return ret;
        }
        case kDynamic:
            return "dynamic";
        default:
            return "unsupported";
    }
}

}  // namespace bytewalk::ser
