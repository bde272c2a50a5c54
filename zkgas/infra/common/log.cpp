// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <zkgas/infra/common/terminal.hpp>

namespace zkgas::log {

//! Thread names are padded or truncated to this width to keep columns aligned
static constexpr size_t kThreadNameWidth{11};

//! Log messages are padded to this width before the key=value arguments
static constexpr int kMessageWidth{32};

struct LevelTag {
    std::string_view name;
    std::string_view color;
};

// Indexed by Level
static constexpr std::array<LevelTag, 7> kLevelTags{{
    {"     ", kColorReset},
    {" CRIT", kBackgroundRed},
    {"ERROR", kColorRed},
    {" WARN", kColorOrangeHigh},
    {" INFO", kColorGreen},
    {"DEBUG", kBackgroundPurple},
    {"TRACE", kColorCoal},
}};

static Settings settings_{};
static std::mutex out_mtx{};
static std::unique_ptr<std::ofstream> file_{nullptr};
thread_local std::string thread_name_{};

void init(const Settings& settings) {
    settings_ = settings;
    if (!settings_.log_file.empty()) {
        tee_file(settings_.log_file);
    }
    const bool is_terminal{settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr()};
    // Escape sequences must never end up in the tee file
    settings_.log_nocolor = settings_.log_nocolor || !is_terminal || file_ != nullptr;
}

void tee_file(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!file->is_open()) {
        throw std::runtime_error("Could not open log file " + path.string());
    }
    file_ = std::move(file);
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name_ = name;
    thread_name_.resize(kThreadNameWidth, ' ');
}

std::string get_thread_name() {
    if (thread_name_.empty()) {
        std::stringstream ss;
        ss << std::this_thread::get_id();
        thread_name_ = ss.str();
    }
    return thread_name_;
}

static bool colors_enabled() { return !settings_.log_nocolor; }

BufferBase::BufferBase(Level level) : should_print_(test_verbosity(level)) {
    if (!should_print_) return;

    const auto& tag{kLevelTags[static_cast<size_t>(level)]};
    const absl::TimeZone tz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    const std::string timestamp{absl::StrCat("[", absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), tz), "]")};

    ss_ << " " << colorize(tag.name, tag.color, colors_enabled()) << " "
        << colorize(timestamp, kColorWhite, colors_enabled()) << " ";
    if (settings_.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append_args(msg, args);
}

void BufferBase::append_args(std::string_view msg, const Args& args) {
    if (!should_print_) return;
    ss_ << std::left << std::setw(kMessageWidth) << std::setfill(' ') << msg;
    for (size_t i{0}; i < args.size(); ++i) {
        const bool is_key{i % 2 == 0};
        ss_ << colorize(args[i], is_key ? kColorGreen : kColorWhite, colors_enabled()) << (is_key ? "=" : " ");
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    std::scoped_lock out_lock{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
    if (file_) {
        *file_ << line << '\n';
    }
}

}  // namespace zkgas::log
