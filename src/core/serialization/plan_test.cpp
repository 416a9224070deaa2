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

#include <cmath>
#include <limits>

#include <catch2/catch.hpp>

#include <core/serialization/plan.hpp>
#include <core/serialization/records_test.hpp>

namespace bytewalk::ser {

using namespace test;

namespace {

    //! \brief Runs a plan over a fresh context and returns the produced bytes and lengths
    template <class T>
    std::pair<Bytes, LengthQueue> run_write(const Plan<T>& plan, const T& value) {
        ByteStream stream;
        LengthQueue lengths;
        Settings settings;
        Trail trail;
        Context ctx(stream, lengths, settings, trail);
        REQUIRE_FALSE(plan.write(ctx, value).has_error());
        return {stream.release(), std::move(lengths)};
    }

    template <class T>
    outcome::result<T> run_read(const Plan<T>& plan, ByteView data, LengthQueue lengths, Trail& trail) {
        ByteStream stream(data);
        Settings settings;
        Context ctx(stream, lengths, settings, trail);
        return plan.read(ctx);
    }

    template <class T>
    T round_trip(const T& value) {
        const auto plan{compile<T>()};
        REQUIRE(plan);
        const auto [data, lengths]{run_write(*plan.value(), value)};
        Trail trail;
        auto ret{run_read(*plan.value(), data, lengths, trail)};
        REQUIRE(ret);
        return std::move(ret.value());
    }

}  // namespace

TEST_CASE("Plan scenarios", "[serialization][plan]") {
    SECTION("Flat record") {
        const auto plan{compile<SubLog>()};
        REQUIRE(plan);
        CHECK(plan.value()->signature() == "{SubId:int32,Secret:float64}");
        const auto [data, lengths]{run_write(*plan.value(), SubLog{7, 3.5})};
        CHECK(data.size() == 12);
        CHECK(lengths.empty());
        Trail trail;
        const auto decoded{run_read(*plan.value(), data, lengths, trail)};
        REQUIRE(decoded);
        CHECK(decoded.value().sub_id == 7);
        CHECK(decoded.value().secret == 3.5);
    }

    SECTION("Sequence of scalars") {
        const auto plan{compile<std::vector<int32_t>>()};
        REQUIRE(plan);
        const auto [data, lengths]{run_write(*plan.value(), std::vector<int32_t>{1, 2, 3})};
        CHECK(data.size() == 12);
        CHECK(lengths == LengthQueue{3});
        CHECK(data == Bytes{1, 0, 0, 0, 2, 0, 0, 0, 3, 0, 0, 0});
    }

    SECTION("Empty sequence of records") {
        const auto plan{compile<std::vector<SubLog>>()};
        REQUIRE(plan);
        const auto [data, lengths]{run_write(*plan.value(), std::vector<SubLog>{})};
        CHECK(data.empty());
        CHECK(lengths == LengthQueue{0});
        Trail trail;
        const auto decoded{run_read(*plan.value(), data, lengths, trail)};
        REQUIRE(decoded);
        CHECK(decoded.value().empty());
    }
}

TEST_CASE("Plan round trips", "[serialization][plan]") {
    SECTION("Boundary scalars") {
        Scalars max_values{true,
                           std::numeric_limits<char>::max(),
                           std::numeric_limits<char16_t>::max(),
                           std::numeric_limits<int8_t>::max(),
                           std::numeric_limits<uint8_t>::max(),
                           std::numeric_limits<int16_t>::max(),
                           std::numeric_limits<uint16_t>::max(),
                           std::numeric_limits<int32_t>::max(),
                           std::numeric_limits<uint32_t>::max(),
                           std::numeric_limits<int64_t>::max(),
                           std::numeric_limits<uint64_t>::max(),
                           std::numeric_limits<float>::infinity(),
                           std::numeric_limits<double>::max()};
        CHECK(round_trip(max_values) == max_values);

        Scalars min_values{false,
                           std::numeric_limits<char>::min(),
                           std::numeric_limits<char16_t>::min(),
                           std::numeric_limits<int8_t>::min(),
                           std::numeric_limits<uint8_t>::min(),
                           std::numeric_limits<int16_t>::min(),
                           std::numeric_limits<uint16_t>::min(),
                           std::numeric_limits<int32_t>::min(),
                           std::numeric_limits<uint32_t>::min(),
                           std::numeric_limits<int64_t>::min(),
                           std::numeric_limits<uint64_t>::min(),
                           std::numeric_limits<float>::lowest(),
                           -std::numeric_limits<double>::infinity()};
        CHECK(round_trip(min_values) == min_values);
    }

    SECTION("Not a number") {
        Scalars value{};
        value.f32 = std::numeric_limits<float>::quiet_NaN();
        value.f64 = std::numeric_limits<double>::quiet_NaN();
        const auto decoded{round_trip(value)};
        CHECK(std::isnan(decoded.f32));
        CHECK(std::isnan(decoded.f64));
    }

    SECTION("Nested sequences, arrays, lists and enums") {
        Grid grid{{{{1, 2}, {}}, {}, {{-3}}}, {0x10, 0x20, 0x30}, {"a", "", "ccc"}, Priority::kLow};
        CHECK(round_trip(grid) == grid);
    }

    SECTION("Nested records and sequences of records") {
        Archive archive;
        archive.name = "archive";
        archive.head = Log{1, "head", {{1, 1.5}}, Color::kBlue};
        archive.history = {Log{2, "", {}, Color::kGreen}, Log{3, "third", {{2, 2.5}, {3, -3.5}}, Color::kRed}};
        archive.pinned = {SubLog{9, 0.25}, SubLog{10, 1e300}};
        CHECK(round_trip(archive) == archive);
    }

    SECTION("Non-intrusive records") {
        const Legacy legacy{0xbeef, "legacy"};
        CHECK(round_trip(legacy) == legacy);
    }

    SECTION("Ignored fields keep their default") {
        const Cached cached{42, "not persisted"};
        const auto decoded{round_trip(cached)};
        CHECK(decoded.value == 42);
        CHECK(decoded.cache.empty());
    }
}

TEST_CASE("Plan failures", "[serialization][plan]") {
    SECTION("Compile failures carry the field path") {
        Trail trail;
        const auto plan{compile<WithAny>(trail)};
        REQUIRE(plan.has_error());
        CHECK(plan.error() == Error::kDynamicElementType);
        CHECK(trail.path() == "Items[]");

        CHECK(compile<NoFields>().error() == Error::kNoSerializableFields);
        CHECK(compile<WithPointer>().error() == Error::kUnsupportedType);
        CHECK(compile<std::vector<OnlyIgnored>>().error() == Error::kNoSerializableFields);
    }

    SECTION("Truncated data") {
        const auto plan{compile<Log>()};
        REQUIRE(plan);
        const Log log{5, "message", {{1, 1.0}, {2, 2.0}}, Color::kGreen};
        auto [data, lengths]{run_write(*plan.value(), log)};
        data.resize(data.size() - 5);  // Mid Secret of SubLogs[1]
        Trail trail;
        const auto decoded{run_read(*plan.value(), data, lengths, trail)};
        REQUIRE(decoded.has_error());
        CHECK(decoded.error() == Error::kReadOverflow);
        CHECK(trail.path() == "SubLogs[1].Secret");
    }

    SECTION("Missing relayed length") {
        const auto plan{compile<Log>()};
        REQUIRE(plan);
        const auto [data, lengths]{run_write(*plan.value(), Log{1, "x", {}, Color::kRed})};
        Trail trail;
        const auto decoded{run_read(*plan.value(), data, LengthQueue{}, trail)};
        REQUIRE(decoded.has_error());
        CHECK(decoded.error() == Error::kLengthQueueEmpty);
        CHECK(trail.path() == "SubLogs");
    }

    SECTION("Relayed count not matching a fixed extent") {
        const auto plan{compile<std::array<int32_t, 2>>()};
        REQUIRE(plan);
        Trail trail;
        const Bytes data{1, 0, 0, 0, 2, 0, 0, 0, 3, 0, 0, 0};
        const auto decoded{run_read(*plan.value(), data, LengthQueue{3}, trail)};
        CHECK(decoded.error() == Error::kExtentMismatch);
    }

    SECTION("Too long text is reported where it sits") {
        const auto plan{compile<std::vector<Log>>()};
        REQUIRE(plan);
        std::vector<Log> logs(2);
        logs[1].message.assign(kMaxTextSize + 1, 'x');
        ByteStream stream;
        LengthQueue lengths;
        Settings settings;
        Trail trail;
        Context ctx(stream, lengths, settings, trail);
        const auto result{plan.value()->write(ctx, logs)};
        REQUIRE(result.has_error());
        CHECK(result.error() == Error::kTextTooLong);
        CHECK(trail.path() == "[1].Message");
    }
}

TEST_CASE("Plan compilation is repeatable", "[serialization][plan]") {
    const auto first{compile<Archive>()};
    const auto second{compile<Archive>()};
    REQUIRE(first);
    REQUIRE(second);
    CHECK(first.value() != second.value());
    CHECK(first.value()->signature() == second.value()->signature());

    Archive archive;
    archive.name = "same";
    archive.history.resize(3);
    CHECK(run_write(*first.value(), archive) == run_write(*second.value(), archive));
}

}  // namespace bytewalk::ser
