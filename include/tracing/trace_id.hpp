#pragma once

#include "core/error.hpp"

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace traceid {

class IRandomSource;

/**
 * @brief 96-bit unsigned value split into its high 32 and low 64 bits
 */
struct Random96 {
    uint32_t high = 0;
    uint64_t low = 0;

    bool operator==(const Random96&) const = default;
    auto operator<=>(const Random96&) const = default;
};

/**
 * @brief Distributed trace identifier
 *
 * Immutable value naming a trace across process and service boundaries.
 *
 * Format: "1-{timestamp}-{random}"
 *   version:   '1'
 *   timestamp: 8 hex chars, low 32 bits of epoch seconds at trace start
 *   random:    24 hex chars (96-bit)
 *
 * Example: "1-5759e988-bd862e3fe1be46a994272793"
 *
 * Parsing never fails: malformed input yields a freshly created id, so a
 * bad inbound header starts a new trace instead of rejecting the request.
 */
class TraceId {
public:
    static constexpr size_t kLength = 35;
    static constexpr char kVersion = '1';
    static constexpr char kDelimiter = '-';
    static constexpr size_t kDelimiterIndex1 = 1;
    static constexpr size_t kDelimiterIndex2 = 10;
    static constexpr size_t kTimestampDigits = 8;
    static constexpr size_t kRandomDigits = 24;

    /// New id: current wall-clock seconds + 96 bits from default_random_source()
    [[nodiscard]] static TraceId create();

    /// New id from explicit collaborators
    [[nodiscard]] static TraceId create(IRandomSource& random,
                                        std::chrono::system_clock::time_point now);

    /// Parse text (surrounding whitespace ignored); falls back to create()
    [[nodiscard]] static TraceId parse(std::string_view text);

    /// Parse text; fallback ids draw from the given source
    [[nodiscard]] static TraceId parse(std::string_view text, IRandomSource& random);

    /// Parse without fallback; the error message names what was malformed
    [[nodiscard]] static Result<TraceId> try_parse(std::string_view text);

    /// Shared "no trace" sentinel (zero timestamp, zero random value)
    [[nodiscard]] static const TraceId& invalid();

    [[nodiscard]] static constexpr TraceId from_parts(int64_t epoch_seconds, Random96 random) {
        return TraceId(epoch_seconds, random);
    }

    [[nodiscard]] int64_t epoch_seconds() const { return epoch_seconds_; }
    [[nodiscard]] const Random96& random() const { return random_; }

    [[nodiscard]] std::chrono::system_clock::time_point start_time() const {
        return std::chrono::system_clock::time_point(std::chrono::seconds(epoch_seconds_));
    }

    [[nodiscard]] bool is_invalid() const { return *this == invalid(); }

    /// Canonical 35-char lowercase wire form
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] size_t hash() const noexcept;

    bool operator==(const TraceId&) const = default;

private:
    constexpr TraceId(int64_t epoch_seconds, Random96 random)
        : epoch_seconds_(epoch_seconds), random_(random) {}

    int64_t epoch_seconds_;
    Random96 random_;
};

/// Log a WARN with the reason whenever parse() falls back (off by default)
void set_parse_fallback_logging(bool enabled);
[[nodiscard]] bool parse_fallback_logging();

inline std::ostream& operator<<(std::ostream& os, const TraceId& id) {
    return os << id.to_string();
}

} // namespace traceid

template<>
struct std::hash<traceid::TraceId> {
    size_t operator()(const traceid::TraceId& id) const noexcept {
        return id.hash();
    }
};

template<>
struct std::formatter<traceid::TraceId> : std::formatter<std::string_view> {
    auto format(const traceid::TraceId& id, std::format_context& ctx) const {
        return std::formatter<std::string_view>::format(id.to_string(), ctx);
    }
};
