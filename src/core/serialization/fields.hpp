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
#include <tuple>
#include <type_traits>
#include <utility>

//! \brief Declaration of the serializable fields of a record
//! \details A record exposes its fields, in the order they go on the wire, through a static member function
//! returning a tuple of field bindings:
//! \code
//! struct SubLog {
//!     int32_t sub_id{0};
//!     double secret{0.0};
//!     std::string cache{};
//!
//!     static auto fields() {
//!         return std::make_tuple(ser::field("SubId", &SubLog::sub_id),   //
//!                                ser::field("Secret", &SubLog::secret),  //
//!                                ser::ignored("Cache", &SubLog::cache));
//!     }
//! };
//! \endcode
//! Types which cannot be modified get the same by specializing ser::Describe.
namespace bytewalk::ser {

//! \brief Binds a name to a readable and writable data member of a record
template <class Owner, class Member>
struct Field {
    using owner_type = Owner;
    using member_type = Member;
    std::string_view name;
    Member Owner::*member;
};

//! \brief A data member deliberately left out of serialization
template <class Owner, class Member>
struct IgnoredField {
    using owner_type = Owner;
    using member_type = Member;
    std::string_view name;
    Member Owner::*member;
};

template <class Owner, class Member>
constexpr Field<Owner, Member> field(std::string_view name, Member Owner::*member) noexcept {
    static_assert(std::is_object_v<Member> and not std::is_const_v<Member>,
                  "Only non-const data members can be serialized");
    return {name, member};
}

template <class Owner, class Member>
constexpr IgnoredField<Owner, Member> ignored(std::string_view name, Member Owner::*member) noexcept {
    return {name, member};
}

template <class T>
struct is_ignored_field : std::false_type {};

template <class Owner, class Member>
struct is_ignored_field<IgnoredField<Owner, Member>> : std::true_type {};

//! \brief Gives access to the field bindings of a record type
//! \remarks Specialize for types whose definition cannot host a static fields() member
template <class T>
struct Describe {
    static auto fields()
        requires requires { T::fields(); }
    {
        return T::fields();
    }
};

template <class T>
concept HasFields = requires { Describe<T>::fields(); };

//! \brief Returns the number of fields which actually go on the wire
template <HasFields T>
constexpr size_t usable_fields_count() noexcept {
    using Tuple = decltype(Describe<T>::fields());
    return []<size_t... I>(std::index_sequence<I...>) {
        return (size_t{0} + ... + (is_ignored_field<std::tuple_element_t<I, Tuple>>::value ? 0U : 1U));
    }(std::make_index_sequence<std::tuple_size_v<Tuple>>{});
}

}  // namespace bytewalk::ser
