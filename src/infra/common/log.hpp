/*
   Copyright 2026 The Addrcodec Authors

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
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <core/common/base.hpp>

namespace addrcodec::log {

// ANSI escape sequences used to colorize log lines
inline constexpr const char* kColorReset{"\x1b[0m"};
inline constexpr const char* kColorCoal{"\x1b[90m"};
inline constexpr const char* kColorGray{"\x1b[37m"};
inline constexpr const char* kColorRed{"\x1b[31m"};
inline constexpr const char* kColorGreen{"\x1b[32m"};
inline constexpr const char* kColorCyan{"\x1b[36m"};
inline constexpr const char* kColorOrangeHigh{"\x1b[93m"};
inline constexpr const char* kColorWhiteHigh{"\x1b[97m"};
inline constexpr const char* kBackgroundRed{"\x1b[41m"};
inline constexpr const char* kBackgroundPurple{"\x1b[45m"};

//! \brief Available severity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace,     // Trace calls to functions
    kTrace1,    // Trace calls to functions - but more verbose
    kTrace2,    // Trace calls to functions - but more more verbose
    kTrace3,    // Trace calls to functions - but more more more verbose
};

//! \brief Holds logging configuration
struct Settings {
    bool log_std_out{false};            // Whether console logging goes to std::cout or std::cerr (default)
    std::string log_timezone{"UTC"};    // UTC or a valid IANA time zone (e.g. Europe/Rome)
    bool log_nocolor{false};            // Whether to disable colorized output
    bool log_threads{false};            // Whether to print thread ids in log lines
    Level log_verbosity{Level::kInfo};  // Log verbosity level
    std::string log_file;               // Tee log lines to this file (colors stripped)
    char log_thousands_sep{'\''};       // Thousands separator
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings);

//! \brief Get the current logging verbosity
Level get_verbosity() noexcept;

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void set_verbosity(Level level);

//! \brief Returns the lowercase label of a level without the `k` prefix (e.g. "warning")
std::string level_label(Level level);

//! \brief Parses a level label (case insensitive)
std::optional<Level> level_from_label(std::string_view label) noexcept;

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(std::string_view name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
//! \remarks Some logging operations may implement computations which would be completely wasted if the outcome is not
//! printed
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
//! \return Whether the file could be opened
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
bool tee_file(const std::filesystem::path& path);

class BufferBase {
  public:
    explicit BufferBase(Level level);

    //! \brief Builds a line made of a message followed by key=value pairs
    //! \param args A flat list alternating keys and values
    explicit BufferBase(Level level, std::string_view msg, const std::vector<std::string>& args);
    ~BufferBase() { flush(); }

    // Accumulators
    template <class T>
    inline void append(T const& obj) {
        if (should_print_) sstream_ << obj;
    }
    template <class T>
    BufferBase& operator<<(T const& obj) {
        append(obj);
        return *this;
    }

  protected:
    void flush() const;
    const bool should_print_;
    std::stringstream sstream_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, std::vector<std::string> args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace addrcodec::log

#define LOG_BUFFER(level_)                           \
    if (!::addrcodec::log::test_verbosity(level_)) { \
    } else                                           \
        ::addrcodec::log::LogBuffer<level_>()

#define LOGF_BUFFER(level_)                          \
    if (!::addrcodec::log::test_verbosity(level_)) { \
    } else                                           \
        ::addrcodec::log::LogBuffer<level_>() << __func__ << " (" << __LINE__ << ") "

#define LOG_TRACE LOG_BUFFER(::addrcodec::log::Level::kTrace)
#define LOG_TRACE1 LOG_BUFFER(::addrcodec::log::Level::kTrace1)
#define LOG_TRACE2 LOG_BUFFER(::addrcodec::log::Level::kTrace2)
#define LOG_TRACE3 LOG_BUFFER(::addrcodec::log::Level::kTrace3)
#define LOG_DEBUG LOG_BUFFER(::addrcodec::log::Level::kDebug)
#define LOG_INFO LOG_BUFFER(::addrcodec::log::Level::kInfo)
#define LOG_WARNING LOG_BUFFER(::addrcodec::log::Level::kWarning)
#define LOG_ERROR LOG_BUFFER(::addrcodec::log::Level::kError)
#define LOG_CRITICAL LOG_BUFFER(::addrcodec::log::Level::kCritical)
#define LOG_MESSAGE LOG_BUFFER(::addrcodec::log::Level::kNone)

#define LOGF_TRACE LOGF_BUFFER(::addrcodec::log::Level::kTrace)
#define LOGF_TRACE1 LOGF_BUFFER(::addrcodec::log::Level::kTrace1)
#define LOGF_TRACE2 LOGF_BUFFER(::addrcodec::log::Level::kTrace2)
#define LOGF_TRACE3 LOGF_BUFFER(::addrcodec::log::Level::kTrace3)
#define LOGF_DEBUG LOGF_BUFFER(::addrcodec::log::Level::kDebug)
#define LOGF_INFO LOGF_BUFFER(::addrcodec::log::Level::kInfo)
#define LOGF_WARNING LOGF_BUFFER(::addrcodec::log::Level::kWarning)
#define LOGF_ERROR LOGF_BUFFER(::addrcodec::log::Level::kError)
#define LOGF_CRITICAL LOGF_BUFFER(::addrcodec::log::Level::kCritical)
#define LOGF_MESSAGE LOGF_BUFFER(::addrcodec::log::Level::kNone)
