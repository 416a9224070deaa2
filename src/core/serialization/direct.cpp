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

#include "direct.hpp"

#include <string>

namespace bytewalk::ser::direct {

namespace {

    outcome::result<void> write_sequence(Context& ctx, const Shape& shape, const void* value) {
        if (const auto result{ctx.lengths().enqueue(shape.sequence.count(value))}; result.has_error()) {
            return result.error();
        }
        const Shape& element_shape{*shape.element};
        return shape.sequence.each(value, [&ctx, &element_shape](const void* element, size_t index) {
            const auto result{write(ctx, element_shape, element)};
            if (result.has_error()) ctx.unwind(index);
            return result;
        });
    }

    outcome::result<void> read_sequence(Context& ctx, const Shape& shape, void* value) {
        const auto count{ctx.next_count()};
        if (count.has_error()) return count.error();
        const Shape& element_shape{*shape.element};
        const auto filler{[&ctx, &element_shape](void* element, size_t index) {
            const auto result{read(ctx, element_shape, element)};
            if (result.has_error()) ctx.unwind(index);
            return result;
        }};
        return shape.sequence.fill(value, count.value(), ctx.reserve_hint(count.value()), filler);
    }

}  // namespace

outcome::result<void> write(Context& ctx, const Shape& shape, const void* value) {
    switch (shape.kind) {
        using enum ShapeKind;
        case kPrimitive:
        case kEnum:
            // Enums share the object representation of their underlying integral
            return write_primitive(ctx.stream(), shape.primitive, value);
        case kText:
            return write_text(ctx.stream(), *static_cast<const std::string*>(value));
        case kSequence:
            return write_sequence(ctx, shape, value);
        case kRecord:
            for (const auto& field : shape.fields) {
                if (const auto result{write(ctx, *field.shape, field.get(value))}; result.has_error()) {
                    ctx.unwind(field.name);
                    return result.error();
                }
            }
            return outcome::success();
        case kDynamic:
            return Error::kDynamicElementType;
        default:
            return Error::kUnsupportedType;
    }
}

outcome::result<void> read(Context& ctx, const Shape& shape, void* value) {
    switch (shape.kind) {
        using enum ShapeKind;
        case kPrimitive:
        case kEnum:
            return read_primitive(ctx.stream(), shape.primitive, value);
        case kText: {
            auto text{read_text(ctx.stream())};
            if (text.has_error()) return text.error();
            *static_cast<std::string*>(value) = std::move(text.value());
            return outcome::success();
        }
        case kSequence:
            return read_sequence(ctx, shape, value);
        case kRecord:
            for (const auto& field : shape.fields) {
                if (const auto result{read(ctx, *field.shape, field.ref(value))}; result.has_error()) {
                    ctx.unwind(field.name);
                    return result.error();
                }
            }
            return outcome::success();
        case kDynamic:
            return Error::kDynamicElementType;
        default:
            return Error::kUnsupportedType;
    }
}

}  // namespace bytewalk::ser::direct
