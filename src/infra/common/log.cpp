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

#include "log.hpp"

#include <iostream>
#include <mutex>
#include <regex>
#include <thread>
#include <utility>

#include <absl/strings/escaping.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace bytewalk::log {

namespace {

    constexpr const char* kColorReset{"\x1b[0m"};
    constexpr const char* kColorCoal{"\x1b[38;5;240m"};
    constexpr const char* kColorCyan{"\x1b[36m"};
    constexpr const char* kColorGreen{"\x1b[32m"};
    constexpr const char* kColorOrange{"\x1b[38;5;214m"};
    constexpr const char* kColorRed{"\x1b[31m"};
    constexpr const char* kBackgroundPurple{"\x1b[45m"};

    Settings settings_{};
    std::mutex out_mtx{};
    thread_local std::string thread_name_{};

    //! \brief Returns the fixed width label and the color of a level
    std::pair<const char*, const char*> label_of(Level level) {
        switch (level) {
            using enum Level;
            case kTrace:
                return {"TRACE", kColorCoal};
            case kDebug:
                return {"DEBUG", kBackgroundPurple};
            case kInfo:
                return {" INFO", kColorGreen};
            case kWarning:
                return {" WARN", kColorOrange};
            case kError:
                return {"ERROR", kColorRed};
            default:
                return {"     ", kColorReset};
        }
    }

    bool needs_quotes(std::string_view value) {
        return value.empty() or value.find_first_of(" \t\"\\") != std::string_view::npos;
    }

    std::string strip_colors(const std::string& line) {
        static const std::regex color_pattern(R"(\x1b\[[0-9;]+m)");
        return std::regex_replace(line, color_pattern, "");
    }

}  // namespace

void init(const Settings& settings) { settings_ = settings; }

Settings& get_settings() noexcept { return settings_; }

Level get_verbosity() noexcept { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

void set_thread_name(std::string_view name) { thread_name_.assign(name); }

std::string get_thread_name() {
    if (thread_name_.empty()) {
        std::stringstream sstream;
        sstream << std::this_thread::get_id();
        thread_name_.assign(sstream.str());
    }
    return thread_name_;
}

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (not should_print_) return;

    const auto [label, color] = label_of(level);
    sstream_ << color << label << kColorReset << " ";
    // Timestamps are always UTC so that lines of different hosts can be merged
    sstream_ << kColorCyan << absl::FormatTime("[%m-%d|%H:%M:%E3S] ", absl::Now(), absl::UTCTimeZone())
             << kColorReset;
    if (settings_.log_threads) {
        sstream_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase& BufferBase::operator<<(const Tag& tag) {
    if (not should_print_) return *this;
    sstream_ << " " << kColorCyan << tag.key << kColorReset << "=";
    if (needs_quotes(tag.value)) {
        sstream_ << '"' << absl::CEscape(absl::string_view{tag.value.data(), tag.value.size()}) << '"';
    } else {
        sstream_ << tag.value;
    }
    return *this;
}

void BufferBase::flush() const {
    if (not should_print_) return;
    const std::string line{settings_.log_nocolor ? strip_colors(sstream_.str()) : sstream_.str()};
    const std::unique_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << std::endl;
}

}  // namespace bytewalk::log
