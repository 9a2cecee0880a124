#include "tracing/trace_id.hpp"
#include "tracing/random_source.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <format>

namespace traceid {

namespace {

std::atomic<bool> g_log_fallbacks{false};

constexpr size_t kTimestampBegin = TraceId::kDelimiterIndex1 + 1;
constexpr size_t kRandomBegin = TraceId::kDelimiterIndex2 + 1;
constexpr size_t kRandomHighDigits = 8;
constexpr size_t kRandomLowDigits = TraceId::kRandomDigits - kRandomHighDigits;

static_assert(kRandomBegin + TraceId::kRandomDigits == TraceId::kLength);
static_assert(kTimestampBegin + TraceId::kTimestampDigits == TraceId::kDelimiterIndex2);

Result<TraceId> parse_error(std::string message) {
    return Result<TraceId>::error(ErrorCategory::PARSE_ERROR, std::move(message));
}

} // anonymous namespace

TraceId TraceId::create() {
    return create(*default_random_source(), std::chrono::system_clock::now());
}

TraceId TraceId::create(IRandomSource& random, std::chrono::system_clock::time_point now) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();

    Random96 value;
    value.high = static_cast<uint32_t>(random.next_u64() >> 32);
    value.low = random.next_u64();

    return TraceId(static_cast<int64_t>(seconds), value);
}

Result<TraceId> TraceId::try_parse(std::string_view text) {
    const auto id = utils::trim(text);

    if (id.size() != kLength) {
        return parse_error(std::format("expected {} characters, got {}", kLength, id.size()));
    }
    if (id[0] != kVersion) {
        return parse_error(std::format("unsupported version '{}'", id[0]));
    }
    if (id[kDelimiterIndex1] != kDelimiter || id[kDelimiterIndex2] != kDelimiter) {
        return parse_error(std::format("expected '{}' at positions {} and {}",
                                       kDelimiter, kDelimiterIndex1, kDelimiterIndex2));
    }

    const auto timestamp = utils::try_parse_uint<uint32_t>(
        id.substr(kTimestampBegin, kTimestampDigits), 16);
    if (!timestamp) {
        return parse_error("timestamp is not hexadecimal");
    }

    const auto high = utils::try_parse_uint<uint32_t>(
        id.substr(kRandomBegin, kRandomHighDigits), 16);
    const auto low = utils::try_parse_uint<uint64_t>(
        id.substr(kRandomBegin + kRandomHighDigits, kRandomLowDigits), 16);
    if (!high || !low) {
        return parse_error("random value is not hexadecimal");
    }

    return Result<TraceId>::ok(TraceId(static_cast<int64_t>(*timestamp), Random96{*high, *low}));
}

TraceId TraceId::parse(std::string_view text) {
    return parse(text, *default_random_source());
}

TraceId TraceId::parse(std::string_view text, IRandomSource& random) {
    auto result = try_parse(text);
    if (result.is_ok()) {
        return result.value();
    }

    auto fresh = create(random, std::chrono::system_clock::now());
    if (g_log_fallbacks.load(std::memory_order_relaxed)) {
        utils::log::warn(std::format("Malformed trace id ({}), started new trace {}",
                                     result.error_message(), fresh.to_string()));
    }
    return fresh;
}

const TraceId& TraceId::invalid() {
    static const TraceId sentinel(0, Random96{});
    return sentinel;
}

std::string TraceId::to_string() const {
    // Only the low 32 bits of the timestamp fit the wire format
    return std::format("{}{}{:08x}{}{:08x}{:016x}",
                       kVersion, kDelimiter,
                       static_cast<uint32_t>(epoch_seconds_),
                       kDelimiter,
                       random_.high, random_.low);
}

size_t TraceId::hash() const noexcept {
    size_t result = 1;
    result = 31 * result + std::hash<uint64_t>{}(random_.low);
    result = 31 * result + std::hash<uint32_t>{}(random_.high);
    result = 31 * result + std::hash<int64_t>{}(epoch_seconds_);
    return result;
}

void set_parse_fallback_logging(bool enabled) {
    g_log_fallbacks.store(enabled, std::memory_order_relaxed);
}

bool parse_fallback_logging() {
    return g_log_fallbacks.load(std::memory_order_relaxed);
}

} // namespace traceid
