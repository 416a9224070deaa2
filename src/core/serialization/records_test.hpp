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
#include <any>
#include <array>
#include <cstdint>
#include <list>
#include <string>
#include <tuple>
#include <vector>

#include <core/serialization/fields.hpp>

//! \brief Record types shared by the serialization tests
namespace bytewalk::ser::test {

enum class Color : uint8_t {
    kRed = 1,
    kGreen = 2,
    kBlue = 200,
};

enum class Priority : int32_t {
    kLow = -1,
    kNormal = 0,
    kHigh = 1000,
};

struct SubLog {
    int32_t sub_id{0};
    double secret{0.0};

    static auto fields() {
        return std::make_tuple(field("SubId", &SubLog::sub_id),  //
                               field("Secret", &SubLog::secret));
    }
    bool operator==(const SubLog&) const = default;
};

struct Log {
    int64_t id{0};
    std::string message{};
    std::vector<SubLog> sub_logs{};
    Color color{Color::kRed};

    static auto fields() {
        return std::make_tuple(field("Id", &Log::id),              //
                               field("Message", &Log::message),    //
                               field("SubLogs", &Log::sub_logs),  //
                               field("Color", &Log::color));
    }
    bool operator==(const Log&) const = default;
};

struct Scalars {
    bool flag{false};
    char letter{'\0'};
    char16_t wide{u'\0'};
    int8_t i8{0};
    uint8_t u8{0};
    int16_t i16{0};
    uint16_t u16{0};
    int32_t i32{0};
    uint32_t u32{0};
    int64_t i64{0};
    uint64_t u64{0};
    float f32{0.0F};
    double f64{0.0};

    static auto fields() {
        return std::make_tuple(field("Flag", &Scalars::flag), field("Letter", &Scalars::letter),
                               field("Wide", &Scalars::wide), field("I8", &Scalars::i8), field("U8", &Scalars::u8),
                               field("I16", &Scalars::i16), field("U16", &Scalars::u16), field("I32", &Scalars::i32),
                               field("U32", &Scalars::u32), field("I64", &Scalars::i64), field("U64", &Scalars::u64),
                               field("F32", &Scalars::f32), field("F64", &Scalars::f64));
    }
    bool operator==(const Scalars&) const = default;
};

struct Grid {
    std::vector<std::vector<std::vector<int16_t>>> cells{};
    std::array<uint8_t, 3> rgb{};
    std::list<std::string> tags{};
    Priority priority{Priority::kNormal};

    static auto fields() {
        return std::make_tuple(field("Cells", &Grid::cells), field("Rgb", &Grid::rgb), field("Tags", &Grid::tags),
                               field("Priority", &Grid::priority));
    }
    bool operator==(const Grid&) const = default;
};

//! \brief A record nesting a record holding a sequence of records
struct Archive {
    std::string name{};
    Log head{};
    std::vector<Log> history{};
    std::array<SubLog, 2> pinned{};

    static auto fields() {
        return std::make_tuple(field("Name", &Archive::name), field("Head", &Archive::head),
                               field("History", &Archive::history), field("Pinned", &Archive::pinned));
    }
    bool operator==(const Archive&) const = default;
};

struct Cached {
    int32_t value{0};
    std::string cache{};

    static auto fields() {
        return std::make_tuple(field("Value", &Cached::value),  //
                               ignored("Cache", &Cached::cache));
    }
};

struct NoFields {
    int32_t value{0};

    static auto fields() { return std::make_tuple(); }
};

struct OnlyIgnored {
    int32_t value{0};

    static auto fields() { return std::make_tuple(ignored("Value", &OnlyIgnored::value)); }
};

struct WithAny {
    int32_t id{0};
    std::vector<std::any> items{};

    static auto fields() {
        return std::make_tuple(field("Id", &WithAny::id),  //
                               field("Items", &WithAny::items));
    }
};

struct WithPointer {
    int32_t id{0};
    const int32_t* target{nullptr};

    static auto fields() {
        return std::make_tuple(field("Id", &WithPointer::id),  //
                               field("Target", &WithPointer::target));
    }
};

//! \brief Same wire layout as YX with fields declared in the opposite order
struct XY {
    int32_t x{0};
    int32_t y{0};

    static auto fields() {
        return std::make_tuple(field("X", &XY::x),  //
                               field("Y", &XY::y));
    }
};

struct YX {
    int32_t y{0};
    int32_t x{0};

    static auto fields() {
        return std::make_tuple(field("Y", &YX::y),  //
                               field("X", &YX::x));
    }
};

//! \brief A record which cannot host a fields() member and is described from outside
struct Legacy {
    uint16_t code{0};
    std::string label{};
    bool operator==(const Legacy&) const = default;
};

}  // namespace bytewalk::ser::test

namespace bytewalk::ser {

template <>
struct Describe<test::Legacy> {
    static auto fields() {
        return std::make_tuple(field("Code", &test::Legacy::code),  //
                               field("Label", &test::Legacy::label));
    }
};

}  // namespace bytewalk::ser
