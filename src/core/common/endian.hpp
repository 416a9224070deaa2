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
#include <cstdint>

#include <boost/endian/conversion.hpp>

namespace bytewalk::endian {

// Every scalar on the wire is little endian regardless of the host

const auto load_little_u16 = boost::endian::load_little_u16;
const auto load_little_u32 = boost::endian::load_little_u32;
const auto load_little_u64 = boost::endian::load_little_u64;

const auto store_little_u16 = boost::endian::store_little_u16;
const auto store_little_u32 = boost::endian::store_little_u32;
const auto store_little_u64 = boost::endian::store_little_u64;

}  // namespace bytewalk::endian
