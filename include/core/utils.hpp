#pragma once

#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace traceid::utils {

// ============================================================================
// Numeric Parsing (std::from_chars — no exceptions, no locale, no allocations)
// ============================================================================

// Parse the whole of sv as an unsigned integer in the given base.
// Rejects empty input, signs, trailing garbage and overflow.
template<typename T>
    requires std::is_unsigned_v<T>
[[nodiscard]] inline std::optional<T> try_parse_uint(std::string_view sv, int base = 10) {
    if (sv.empty()) return std::nullopt;
    T result{};
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(sv.data(), end, result, base);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

[[nodiscard]] inline std::string_view trim(std::string_view str) {
    const auto start = str.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = str.find_last_not_of(kWhitespace);
    return str.substr(start, end - start + 1);
}

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<int>& min_level() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(static_cast<int>(level), std::memory_order_relaxed);
}

[[nodiscard]] inline Level level() {
    return static_cast<Level>(detail::min_level().load(std::memory_order_relaxed));
}

// "info" | "warn" | "error" (case-insensitive)
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace traceid::utils
