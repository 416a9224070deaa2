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

#include <stdexcept>
#include <string>
#include <string_view>

#include <absl/strings/str_cat.h>
#include <boost/system/error_code.hpp>
#include <magic_enum.hpp>

#include <core/serialization/errors.hpp>

namespace bytewalk::ser {

//! \brief Raised by the throwing codec facade
//! \details Carries the error code, the demangled name of the top-level type handed to the codec and the
//! path to the field where the failure has been detected (empty when the failure is about the value as a whole)
class Exception : public std::runtime_error {
  public:
    Exception(boost::system::error_code error, std::string type_name, std::string field_path)
        : std::runtime_error(build_message(error, type_name, field_path)),
          error_{error},
          type_name_{std::move(type_name)},
          field_path_{std::move(field_path)} {}

    [[nodiscard]] const boost::system::error_code& error() const noexcept { return error_; }

    //! \brief Returns the serialization error code or kUnexpectedError for codes of foreign categories
    [[nodiscard]] Error code() const noexcept {
        if (error_.category() != make_error_code(Error::kSuccess).category()) return Error::kUnexpectedError;
        return static_cast<Error>(error_.value());
    }

    [[nodiscard]] ErrorKind kind() const noexcept { return error_kind_of(error_); }
    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    [[nodiscard]] const std::string& field_path() const noexcept { return field_path_; }

  private:
    static std::string build_message(const boost::system::error_code& error, std::string_view type_name,
                                     std::string_view field_path) {
        const auto kind_name{magic_enum::enum_name(error_kind_of(error)).substr(1)};  // Without the k prefix
        std::string ret{absl::StrCat(error.message(), " (", kind_name, ")")};
        if (not type_name.empty()) absl::StrAppend(&ret, " type ", type_name);
        if (not field_path.empty()) absl::StrAppend(&ret, " at ", field_path);
        return ret;
    }

    static ErrorKind error_kind_of(const boost::system::error_code& error) noexcept {
        if (error.category() != make_error_code(Error::kSuccess).category()) return ErrorKind::kInternal;
        return error_kind(static_cast<Error>(error.value()));
    }

    boost::system::error_code error_;
    std::string type_name_;
    std::string field_path_;
};

}  // namespace bytewalk::ser
