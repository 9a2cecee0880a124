#include <catch2/catch_test_macros.hpp>
#include "tracing/trace_id.hpp"
#include "tracing/random_source.hpp"

#include <cctype>
#include <chrono>
#include <format>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace traceid;

namespace {

constexpr const char* kSample = "1-5759e988-bd862e3fe1be46a994272793";

// Grammar: "1-" 8 lowercase hex "-" 24 lowercase hex
bool is_well_formed(const std::string& s) {
    if (s.size() != 35 || s[0] != '1' || s[1] != '-' || s[10] != '-') return false;
    for (size_t i = 2; i < s.size(); ++i) {
        if (i == 10) continue;
        const char c = s[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

// Fallback result: a usable fresh id, never the sentinel
void require_fresh(const TraceId& id) {
    REQUIRE_FALSE(id.is_invalid());
    REQUIRE(is_well_formed(id.to_string()));
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("TraceId: parse well-formed id", "[tracing]") {
    auto id = TraceId::parse(kSample);

    REQUIRE(id.epoch_seconds() == 0x5759e988);
    REQUIRE(id.random().high == 0xbd862e3fu);
    REQUIRE(id.random().low == 0xe1be46a994272793ull);
    REQUIRE(id.to_string() == kSample);
    REQUIRE_FALSE(id.is_invalid());
}

TEST_CASE("TraceId: parse normalizes uppercase hex", "[tracing]") {
    auto id = TraceId::parse("1-5759E988-BD862E3FE1BE46A994272793");
    REQUIRE(id.to_string() == kSample);
}

TEST_CASE("TraceId: parse ignores surrounding whitespace", "[tracing]") {
    auto id = TraceId::parse("  \t1-5759e988-bd862e3fe1be46a994272793\r\n");
    REQUIRE(id.to_string() == kSample);
}

TEST_CASE("TraceId: parse keeps leading zeros", "[tracing]") {
    auto id = TraceId::parse("1-0000000a-000000000000000000000001");
    REQUIRE(id.epoch_seconds() == 10);
    REQUIRE(id.random() == Random96{0, 1});
    REQUIRE(id.to_string() == "1-0000000a-000000000000000000000001");
}

TEST_CASE("TraceId: parse of sentinel text yields sentinel", "[tracing]") {
    auto id = TraceId::parse("1-00000000-000000000000000000000000");
    REQUIRE(id == TraceId::invalid());
}

TEST_CASE("TraceId: wrong length falls back to fresh id", "[tracing]") {
    require_fresh(TraceId::parse("garbage"));
    require_fresh(TraceId::parse(""));
    require_fresh(TraceId::parse("   "));
    require_fresh(TraceId::parse("1-5759e988-bd862e3fe1be46a99427279"));   // 34
    require_fresh(TraceId::parse("1-5759e988-bd862e3fe1be46a9942727930")); // 36
}

TEST_CASE("TraceId: wrong version falls back to fresh id", "[tracing]") {
    auto id = TraceId::parse("2-5759e988-bd862e3fe1be46a994272793");
    require_fresh(id);
    REQUIRE(id.to_string() != "2-5759e988-bd862e3fe1be46a994272793");
}

TEST_CASE("TraceId: misplaced delimiters fall back to fresh id", "[tracing]") {
    require_fresh(TraceId::parse("1_5759e988-bd862e3fe1be46a994272793"));
    require_fresh(TraceId::parse("1-5759e988_bd862e3fe1be46a994272793"));
    require_fresh(TraceId::parse("1-5759e98-8bd862e3fe1be46a994272793"));
}

TEST_CASE("TraceId: non-hex fields fall back to fresh id", "[tracing]") {
    require_fresh(TraceId::parse("1-5759g988-bd862e3fe1be46a994272793"));
    require_fresh(TraceId::parse("1-5759e988-bd862e3fe1be46a99427279z"));
    require_fresh(TraceId::parse("1-5759e988-bd862e3f-1be46a994272793"));
    require_fresh(TraceId::parse("1- 759e988-bd862e3fe1be46a994272793"));
}

TEST_CASE("TraceId: signed fields fall back to fresh id", "[tracing]") {
    require_fresh(TraceId::parse("1-+759e988-bd862e3fe1be46a994272793"));
    require_fresh(TraceId::parse("1--759e988-bd862e3fe1be46a994272793"));
    require_fresh(TraceId::parse("1-5759e988-+d862e3fe1be46a994272793"));
}

TEST_CASE("TraceId: try_parse reports the malformed part", "[tracing]") {
    auto ok = TraceId::try_parse(kSample);
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().to_string() == kSample);

    auto too_short = TraceId::try_parse("garbage");
    REQUIRE(too_short.is_error());
    REQUIRE(too_short.error_category() == ErrorCategory::PARSE_ERROR);
    REQUIRE(too_short.error_message() == "expected 35 characters, got 7");

    auto version = TraceId::try_parse("2-5759e988-bd862e3fe1be46a994272793");
    REQUIRE(version.is_error());
    REQUIRE(version.error_message() == "unsupported version '2'");

    auto timestamp = TraceId::try_parse("1-5759x988-bd862e3fe1be46a994272793");
    REQUIRE(timestamp.is_error());
    REQUIRE(timestamp.error_message() == "timestamp is not hexadecimal");

    auto random = TraceId::try_parse("1-5759e988-bd862e3fe1be46a99427279x");
    REQUIRE(random.is_error());
    REQUIRE(random.error_message() == "random value is not hexadecimal");
}

TEST_CASE("TraceId: fallback draws from supplied source", "[tracing]") {
    SeededRandomSource a(7);
    SeededRandomSource b(7);

    auto from_a = TraceId::parse("garbage", a);
    auto from_b = TraceId::parse("not a trace id", b);

    REQUIRE(from_a.random() == from_b.random());
    require_fresh(from_a);
}

// ============================================================================
// Generation and formatting
// ============================================================================

TEST_CASE("TraceId: create round-trips through parse", "[tracing]") {
    for (int i = 0; i < 100; ++i) {
        auto id = TraceId::create();
        auto text = id.to_string();
        REQUIRE(is_well_formed(text));
        REQUIRE(TraceId::parse(text) == id);
    }
}

TEST_CASE("TraceId: create stamps wall-clock seconds", "[tracing]") {
    const auto before = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto id = TraceId::create();
    const auto after = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    REQUIRE(id.epoch_seconds() >= before);
    REQUIRE(id.epoch_seconds() <= after);
}

TEST_CASE("TraceId: create with explicit source and clock", "[tracing]") {
    const auto now = std::chrono::system_clock::time_point(std::chrono::seconds(0x5759e988));
    SeededRandomSource a(42);
    SeededRandomSource b(42);

    auto id_a = TraceId::create(a, now);
    auto id_b = TraceId::create(b, now);

    REQUIRE(id_a == id_b);
    REQUIRE(id_a.epoch_seconds() == 0x5759e988);
    REQUIRE(id_a.start_time() == now);
    REQUIRE(id_a.to_string().substr(0, 11) == "1-5759e988-");
}

TEST_CASE("TraceId: create generates unique ids", "[tracing]") {
    std::unordered_set<TraceId> seen;
    for (int i = 0; i < 1000; ++i) {
        REQUIRE(seen.insert(TraceId::create()).second);
    }
}

TEST_CASE("TraceId: format keeps low 32 bits of timestamp", "[tracing]") {
    auto id = TraceId::from_parts(0x1'0000'002aLL, Random96{0, 0xff});
    REQUIRE(id.to_string() == "1-0000002a-0000000000000000000000ff");
}

TEST_CASE("TraceId: std::format and stream output", "[tracing]") {
    auto id = TraceId::parse(kSample);
    REQUIRE(std::format("{}", id) == kSample);

    std::ostringstream os;
    os << id;
    REQUIRE(os.str() == kSample);
}

// ============================================================================
// Sentinel
// ============================================================================

TEST_CASE("TraceId: invalid sentinel", "[tracing]") {
    const auto& a = TraceId::invalid();
    const auto& b = TraceId::invalid();

    REQUIRE(&a == &b);
    REQUIRE(a == b);
    REQUIRE(a.epoch_seconds() == 0);
    REQUIRE(a.random() == Random96{});
    REQUIRE(a.is_invalid());
    REQUIRE(a.to_string() == "1-00000000-000000000000000000000000");
}

TEST_CASE("TraceId: invalid sentinel shared across threads", "[tracing]") {
    std::vector<const TraceId*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < seen.size(); ++t) {
        threads.emplace_back([&seen, t] { seen[t] = &TraceId::invalid(); });
    }
    for (auto& th : threads) th.join();

    for (const auto* p : seen) {
        REQUIRE(p == &TraceId::invalid());
    }
}

// ============================================================================
// Equality and hashing
// ============================================================================

TEST_CASE("TraceId: structural equality and hash", "[tracing]") {
    auto a = TraceId::from_parts(100, Random96{1, 2});
    auto b = TraceId::from_parts(100, Random96{1, 2});
    auto other_low = TraceId::from_parts(100, Random96{1, 3});
    auto other_high = TraceId::from_parts(100, Random96{2, 2});
    auto other_time = TraceId::from_parts(101, Random96{1, 2});

    REQUIRE(a == b);
    REQUIRE(std::hash<TraceId>{}(a) == std::hash<TraceId>{}(b));
    REQUIRE(a != other_low);
    REQUIRE(a != other_high);
    REQUIRE(a != other_time);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("TraceId: concurrent create yields distinct well-formed ids", "[tracing][concurrency]") {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;

    std::mutex mutex;
    std::unordered_set<TraceId> all;
    bool all_well_formed = true;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            std::vector<TraceId> local;
            local.reserve(kPerThread);
            for (int i = 0; i < kPerThread; ++i) {
                local.push_back(TraceId::create());
            }
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& id : local) {
                all_well_formed = all_well_formed && is_well_formed(id.to_string());
                all.insert(id);
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(all_well_formed);
    REQUIRE(all.size() == static_cast<size_t>(kThreads * kPerThread));
}
