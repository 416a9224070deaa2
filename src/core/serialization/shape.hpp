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
#include <algorithm>
#include <any>
#include <array>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <vector>

#include <boost/core/demangle.hpp>

#include <core/common/base.hpp>
#include <core/serialization/context.hpp>
#include <core/serialization/errors.hpp>
#include <core/serialization/fields.hpp>
#include <core/serialization/serialize.hpp>

namespace bytewalk::ser {

//! \brief The closed set of shapes a type may be classified into
enum class ShapeKind : uint8_t {
    kPrimitive,    // Scalar written verbatim at its natural width
    kText,         // 2 bytes length prefix followed by raw bytes
    kEnum,         // Written as its underlying integral
    kSequence,     // Homogeneous elements, count relayed out of band
    kRecord,       // Declared fields in declared order
    kDynamic,      // Element type not statically known (rejected)
    kUnsupported,  // No rule matches (rejected)
};

template <class T>
struct is_std_array : std::false_type {};

template <class E, std::size_t N>
struct is_std_array<std::array<E, N>> : std::true_type {};

template <class T>
concept Text = std::same_as<T, std::string>;

template <class T>
concept Enumeration = std::is_enum_v<T>;

template <class T>
concept FixedSequence = is_std_array<T>::value;

//! \brief Iterable containers of a single element type which can be rebuilt by appending
template <class T>
concept DynamicSequence = not Text<T> and std::default_initializable<T> and
                          requires(T& seq, const T& cseq, typename T::value_type&& element) {
                              typename T::value_type;
                              { cseq.size() } -> std::convertible_to<size_t>;
                              cseq.begin();
                              cseq.end();
                              seq.clear();
                              seq.push_back(std::move(element));
                          };

template <class T>
concept Sequence = FixedSequence<T> or DynamicSequence<T>;

template <class T>
concept Dynamic = std::same_as<T, std::any>;

template <class T>
concept Record = HasFields<T> and std::default_initializable<T>;

//! \brief Classifies a type. Rules are applied in order and the first match wins
template <class T>
constexpr ShapeKind shape_of() noexcept {
    using enum ShapeKind;
    if constexpr (Text<T>) {
        return kText;
    } else if constexpr (Scalar<T>) {
        return kPrimitive;
    } else if constexpr (Enumeration<T>) {
        return kEnum;
    } else if constexpr (Sequence<T>) {
        return kSequence;
    } else if constexpr (Dynamic<T>) {
        return kDynamic;
    } else if constexpr (Record<T>) {
        return kRecord;
    } else {
        return kUnsupported;
    }
}

template <class T>
inline constexpr ShapeKind shape_of_v = shape_of<std::remove_cv_t<T>>();

//! \brief Returns the human readable name of a type
template <class T>
std::string type_name() {
    return boost::core::demangle(typeid(T).name());
}

struct Shape;
using ShapePtr = std::shared_ptr<const Shape>;

//! \brief A record field with its type-erased accessors
//! \remarks get and ref map the address of the owning record to the address of the member
struct FieldShape {
    std::string name;
    ShapePtr shape;
    std::function<const void*(const void*)> get;
    std::function<void*(void*)> ref;
};

using ElementVisitor = std::function<outcome::result<void>(const void* element, size_t index)>;
using ElementFiller = std::function<outcome::result<void>(void* element, size_t index)>;

//! \brief Type-erased operations on a sequence
struct SequenceAccess {
    //! \brief Returns the number of elements
    std::function<size_t(const void* seq)> count;
    //! \brief Visits every element in iteration order
    std::function<outcome::result<void>(const void* seq, const ElementVisitor& visit)> each;
    //! \brief Replaces the contents with count elements, each one populated by fill in order
    //! \remarks Growable sequences reserve at most capacity elements up front
    std::function<outcome::result<void>(void* seq, size_t count, size_t capacity, const ElementFiller& fill)> fill;
};

//! \brief Runtime description of the classification of a type
struct Shape {
    ShapeKind kind{ShapeKind::kUnsupported};
    std::string type_name;
    PrimitiveKind primitive{PrimitiveKind::kUInt8};  // Primitive kind or underlying kind of an enum
    ShapePtr element{nullptr};                       // Sequences only
    std::optional<size_t> extent{std::nullopt};      // Fixed size sequences only
    SequenceAccess sequence{};                       // Sequences only
    std::vector<FieldShape> fields{};                // Records only

    //! \brief Returns a canonical rendering of the structure of this shape
    //! \remarks Field names take part in the signature while type names do not. Two types render the same
    //! signature only if they go on the wire identically and their fields are named and ordered identically
    [[nodiscard]] std::string signature() const;
};

template <class T>
outcome::result<ShapePtr> describe(Trail& trail);

namespace detail {

    template <Sequence T>
    SequenceAccess sequence_access() {
        SequenceAccess ret;
        ret.count = [](const void* seq) -> size_t { return static_cast<const T*>(seq)->size(); };
        ret.each = [](const void* seq, const ElementVisitor& visit) -> outcome::result<void> {
            size_t index{0};
            for (const auto& element : *static_cast<const T*>(seq)) {
                outcome::result<void> result{outcome::success()};
                if constexpr (std::is_reference_v<std::iter_reference_t<typename T::const_iterator>>) {
                    result = visit(&element, index);
                } else {
                    // Proxied elements (e.g. std::vector<bool>) have no address of their own
                    const typename T::value_type copy{element};
                    result = visit(&copy, index);
                }
                if (result.has_error()) return result.error();
                ++index;
            }
            return outcome::success();
        };
        ret.fill = [](void* seq, size_t count, size_t capacity, const ElementFiller& fill) -> outcome::result<void> {
            auto& target{*static_cast<T*>(seq)};
            if constexpr (FixedSequence<T>) {
                if (count != std::tuple_size_v<T>) return Error::kExtentMismatch;
                for (size_t i{0}; i < count; ++i) {
                    if (const auto result{fill(&target[i], i)}; result.has_error()) return result.error();
                }
            } else {
                target.clear();
                if constexpr (requires { target.reserve(capacity); }) target.reserve(std::min(count, capacity));
                for (size_t i{0}; i < count; ++i) {
                    typename T::value_type element{};
                    if (const auto result{fill(&element, i)}; result.has_error()) return result.error();
                    target.push_back(std::move(element));
                }
            }
            return outcome::success();
        };
        return ret;
    }

    template <class T, class Owner, class Member>
    outcome::result<void> append_field(std::vector<FieldShape>& fields, const Field<Owner, Member>& field,
                                       Trail& trail) {
        auto shape{describe<Member>(trail)};
        if (shape.has_error()) {
            trail.unwind(field.name);
            return shape.error();
        }
        const auto member{field.member};
        fields.push_back(FieldShape{
            std::string(field.name), std::move(shape.value()),
            [member](const void* owner) -> const void* { return &(static_cast<const T*>(owner)->*member); },
            [member](void* owner) -> void* { return &(static_cast<T*>(owner)->*member); }});
        return outcome::success();
    }

    template <class T, class Owner, class Member>
    outcome::result<void> append_field(std::vector<FieldShape>&, const IgnoredField<Owner, Member>&, Trail&) {
        return outcome::success();
    }

}  // namespace detail

//! \brief Describes the shape of a type along with the accessors to walk its instances at runtime
//! \remarks The description is recursive: sequences describe their element type and records every usable field
//! \remarks Fails with kNoSerializableFields for records without usable fields, kDynamicElementType for
//! elements of undetermined type and kUnsupportedType for anything else no rule applies to
template <class T>
outcome::result<ShapePtr> describe(Trail& trail) {
    using enum ShapeKind;
    constexpr auto kind{shape_of_v<T>};
    auto shape{std::make_shared<Shape>()};
    shape->kind = kind;
    shape->type_name = type_name<T>();

    if constexpr (kind == kPrimitive) {
        shape->primitive = primitive_kind_of<T>();
    } else if constexpr (kind == kEnum) {
        shape->primitive = primitive_kind_of<std::underlying_type_t<T>>();
    } else if constexpr (kind == kSequence) {
        auto element{describe<typename T::value_type>(trail)};
        if (element.has_error()) {
            trail.unwind("[]");
            return element.error();
        }
        shape->element = std::move(element.value());
        if constexpr (FixedSequence<T>) shape->extent = std::tuple_size_v<T>;
        shape->sequence = detail::sequence_access<T>();
    } else if constexpr (kind == kRecord) {
        if constexpr (usable_fields_count<T>() == 0) {
            return Error::kNoSerializableFields;
        } else {
            outcome::result<void> status{outcome::success()};
            std::apply(
                [&](const auto&... field) {
                    static_cast<void>(
                        ((status = detail::append_field<T>(shape->fields, field, trail), status.has_value()) and ...));
                },
                Describe<T>::fields());
            if (status.has_error()) return status.error();
        }
    } else if constexpr (kind == kDynamic) {
        return Error::kDynamicElementType;
    } else if constexpr (kind == kUnsupported) {
        return Error::kUnsupportedType;
    }
    return ShapePtr{std::move(shape)};
}

//! \brief Describes the shape of a type discarding the location of any failure
template <class T>
outcome::result<ShapePtr> describe() {
    Trail trail;
    return describe<T>(trail);
}

}  // namespace bytewalk::ser
