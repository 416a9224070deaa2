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
#include <concepts>

#include <core/serialization/context.hpp>
#include <core/serialization/shape.hpp>

//! \brief Interpretation of type shapes against live values
//! \details The direct strategy keeps nothing between calls: the shape of the type is described on every call and
//! every field or element is reached through the type-erased accessors of the shape. Its output is byte identical
//! to the one of a compiled plan for the same type and value.
namespace bytewalk::ser::direct {

//! \brief Appends the encoding of the value at the given address, whose type is described by shape
[[nodiscard]] outcome::result<void> write(Context& ctx, const Shape& shape, const void* value);

//! \brief Decodes into the value at the given address, whose type is described by shape
//! \remarks The target value must be a live (e.g. default constructed) instance
[[nodiscard]] outcome::result<void> read(Context& ctx, const Shape& shape, void* value);

//! \brief Describes T and appends the encoding of value
template <class T>
outcome::result<void> encode(Context& ctx, const T& value) {
    const auto shape{describe<T>(ctx.trail())};
    if (shape.has_error()) return shape.error();
    return write(ctx, *shape.value(), &value);
}

//! \brief Describes T and decodes a default constructed instance of it
template <class T>
    requires std::default_initializable<T>
outcome::result<T> decode(Context& ctx) {
    const auto shape{describe<T>(ctx.trail())};
    if (shape.has_error()) return shape.error();
    T ret{};
    if (const auto result{read(ctx, *shape.value(), &ret)}; result.has_error()) return result.error();
    return ret;
}

}  // namespace bytewalk::ser::direct
