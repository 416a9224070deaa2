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

#include <catch2/catch.hpp>

#include <core/common/endian.hpp>

namespace bytewalk::endian {

TEST_CASE("16 bit", "[endianness]") {
    uint8_t bytes[2];
    uint16_t value{0x1234};

    store_little_u16(bytes, value);
    CHECK(bytes[0] == 0x34);
    CHECK(bytes[1] == 0x12);
    CHECK(load_little_u16(bytes) == value);
}

TEST_CASE("32 bit", "[endianness]") {
    uint8_t bytes[4];
    uint32_t value{0x12345678};

    store_little_u32(bytes, value);
    CHECK(bytes[0] == 0x78);
    CHECK(bytes[1] == 0x56);
    CHECK(bytes[2] == 0x34);
    CHECK(bytes[3] == 0x12);
    CHECK(load_little_u32(bytes) == value);
}

TEST_CASE("64 bit", "[endianness]") {
    uint8_t bytes[8];
    uint64_t value{0x123456789abcdef0};

    store_little_u64(bytes, value);
    CHECK(bytes[0] == 0xf0);
    CHECK(bytes[1] == 0xde);
    CHECK(bytes[2] == 0xbc);
    CHECK(bytes[3] == 0x9a);
    CHECK(bytes[4] == 0x78);
    CHECK(bytes[5] == 0x56);
    CHECK(bytes[6] == 0x34);
    CHECK(bytes[7] == 0x12);
    CHECK(load_little_u64(bytes) == value);
}

}  // namespace bytewalk::endian
