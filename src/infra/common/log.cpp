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

#if defined(_WIN32)
#include <windows.h>
#if !defined(ENABLE_VIRTUAL_TERMINAL_PROCESSING)
#define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
#endif
#endif

#include "log.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <regex>
#include <thread>
#include <tuple>

#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <magic_enum.hpp>

namespace addrcodec::log {

namespace {
    Settings settings_{};
    std::mutex out_mtx{};
    std::unique_ptr<std::fstream> file_{nullptr};
    thread_local std::string thread_name_{};

    std::pair<const char*, const char*> get_level_settings(Level level) {
        switch (level) {
            using enum Level;
            case kTrace:
                return {"TRACE", kColorCoal};
            case kTrace1:
                return {" TRC1", kColorGray};
            case kTrace2:
                return {" TRC2", kColorGray};
            case kTrace3:
                return {" TRC3", kColorGray};
            case kDebug:
                return {"DEBUG", kBackgroundPurple};
            case kInfo:
                return {" INFO", kColorGreen};
            case kWarning:
                return {" WARN", kColorOrangeHigh};
            case kError:
                return {"ERROR", kColorRed};
            case kCritical:
                return {" CRIT", kBackgroundRed};
            default:
                return {"     ", kColorReset};
        }
    }

    absl::TimeZone get_time_zone() {
        if (settings_.log_timezone.empty() or boost::iequals(settings_.log_timezone, "UTC")) {
            return absl::UTCTimeZone();
        }
        absl::TimeZone ret;
        if (not absl::LoadTimeZone(settings_.log_timezone, &ret)) {
            std::cerr << "Could not load time zone [" << settings_.log_timezone << "] defaulting to UTC" << std::endl;
            ret = absl::UTCTimeZone();
        }
        return ret;
    }

    //! \brief Lets a Windows console render the escape sequences of colorized lines
    void enable_console_colors() {
#if defined(_WIN32)
        HANDLE output_handle = GetStdHandle(settings_.log_std_out ? STD_OUTPUT_HANDLE : STD_ERROR_HANDLE);
        if (output_handle == INVALID_HANDLE_VALUE) return;
        DWORD mode = 0;
        if (GetConsoleMode(output_handle, &mode) not_eq 0) {
            SetConsoleMode(output_handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
        }
#endif
    }

    struct separate_thousands : std::numpunct<char> {
        char separator;
        explicit separate_thousands(char sep) : separator(sep) {}
        [[nodiscard]] char do_thousands_sep() const override { return separator; }
        [[nodiscard]] string_type do_grouping() const override { return "\3"; }  // groups of 3 digit
    };

}  // namespace

void init(const Settings& settings) {
    settings_ = settings;
    file_.reset();
    if (not settings_.log_file.empty()) {
        std::ignore = tee_file(std::filesystem::path(settings.log_file));
    }
    if (not settings_.log_nocolor) enable_console_colors();
}

bool tee_file(const std::filesystem::path& path) {
    file_ = std::make_unique<std::fstream>(path.string(), std::ios::out bitor std::ios::app);
    if (not file_->is_open()) {
        file_.reset();
        std::cerr << "Could not open log file " << path.string() << std::endl;
        return false;
    }
    return true;
}

Level get_verbosity() noexcept { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

std::string level_label(Level level) {
    std::string ret{magic_enum::enum_name(level)};
    ret.erase(0, 1);  // Remove the constant `k` prefix
    boost::algorithm::to_lower(ret);
    return ret;
}

std::optional<Level> level_from_label(std::string_view label) noexcept {
    const auto values{magic_enum::enum_values<Level>()};
    const auto it{std::ranges::find_if(
        values, [&label](const Level level) { return boost::iequals(level_label(level), label); })};
    if (it == values.end()) return std::nullopt;
    return *it;
}

void set_thread_name(std::string_view name) { thread_name_ = std::string(name); }

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

    if (settings_.log_thousands_sep not_eq 0) {
        sstream_.imbue(std::locale(sstream_.getloc(), new separate_thousands(settings_.log_thousands_sep)));
    }

    const auto [prefix, color] = get_level_settings(level);

    // Prefix
    sstream_ << kColorReset << " " << color << prefix << kColorReset << " ";

    // TimeStamp
    static const absl::TimeZone time_zone{get_time_zone()};
    const absl::Time now{absl::Now()};
    sstream_ << kColorCyan << absl::FormatTime("[%m-%d|%H:%M:%E3S] ", now, time_zone) << kColorReset;

    // ThreadId
    if (settings_.log_threads) {
        sstream_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const std::vector<std::string>& args) : BufferBase(level) {
    if (not should_print_) return;
    sstream_ << std::left << std::setw(25) << std::setfill(' ') << msg;
    bool left{true};
    for (const auto& arg : args) {
        sstream_ << (left ? kColorGreen : kColorWhiteHigh) << arg << kColorReset << (left ? "=" : " ");
        left = !left;
    }
}

void BufferBase::flush() const {
    if (!should_print_) return;

    // Pattern to identify colorization
    static const std::regex color_pattern(R"(\x1b\[[0-9;]{1,}m)");

    bool colorized{true};
    std::string line{sstream_.str()};
    if (settings_.log_nocolor) {
        line = std::regex_replace(line, color_pattern, "");
        colorized = false;
    }
    const std::unique_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << std::endl;
    if (file_ and file_->is_open()) {
        *file_ << (colorized ? std::regex_replace(line, color_pattern, "") : line) << std::endl;
    }
}
}  // namespace addrcodec::log
