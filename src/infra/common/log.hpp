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
#include <sstream>
#include <string>
#include <string_view>

namespace bytewalk::log {

//! \brief Available severity levels
enum class Level {
    kNone,     // Line with no severity which gets always printed
    kError,    // A failure nobody else is going to report
    kWarning,  // Something the user might want to amend
    kInfo,     // Regular operations
    kDebug,    // Failed codec calls with the path to the offending field
    kTrace,    // Plan compilation and plan cache activity
};

//! \brief Holds logging configuration
struct Settings {
    bool log_std_out{false};            // Whether lines go to std::cout or std::cerr (default)
    bool log_nocolor{false};            // Whether to strip ANSI colors from lines
    bool log_threads{false};            // Whether to print thread names in lines
    Level log_verbosity{Level::kInfo};  // Nothing the codec logs gets printed at this level
};

//! \brief Initializes logging facilities
//! \note Not thread safe: meant to be called once at start of process
void init(const Settings& settings);

//! \brief Returns the current logging settings
Settings& get_settings() noexcept;

Level get_verbosity() noexcept;

//! \note Not thread safe: meant to be called once at start of process
void set_verbosity(Level level);

//! \brief Checks whether lines of the provided level get printed
//! \remarks The LOG_* macros test the level before composing the line so that disabled lines cost nothing
bool test_verbosity(Level level);

//! \brief Sets the name printed for this thread when settings request thread names
void set_thread_name(std::string_view name);

//! \brief Returns the name set for this thread or, if none, its id
std::string get_thread_name();

//! \brief A key=value pair appended to a log line
//! \details Values holding blanks, quotes or nothing at all are rendered quoted and C-escaped, so that a line
//! splits on blanks into its message words and its tags (e.g. type="std::vector<int, std::allocator<int> >")
struct Tag {
    std::string_view key;
    std::string_view value;
};

class BufferBase {
  public:
    explicit BufferBase(Level level);
    ~BufferBase() { flush(); }

    template <class T>
    BufferBase& operator<<(T const& obj) {
        if (should_print_) sstream_ << obj;
        return *this;
    }

    BufferBase& operator<<(const Tag& tag);

  protected:
    void flush() const;
    const bool should_print_;
    std::stringstream sstream_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
};

}  // namespace bytewalk::log

#define LOG_BUFFER(level_)                        \
    if (!bytewalk::log::test_verbosity(level_)) { \
    } else                                        \
        bytewalk::log::LogBuffer<level_>()

#define LOG_TRACE LOG_BUFFER(bytewalk::log::Level::kTrace)
#define LOG_DEBUG LOG_BUFFER(bytewalk::log::Level::kDebug)
