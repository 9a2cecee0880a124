#pragma once

#include "core/utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace traceid {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    utils::log::Level level = utils::log::Level::INFO;
};

enum class RandomSourceType {
    SECURE,   // OpenSSL RAND_bytes
    SEEDED    // Deterministic mt19937_64
};

struct RandomSourceConfig {
    RandomSourceType type = RandomSourceType::SECURE;
    std::optional<uint64_t> seed;  // Required for SEEDED
};

struct ParseConfig {
    bool log_fallbacks = false;    // WARN on every malformed inbound id
};

// ============================================================================
// TraceIdConfig - Complete parsed configuration
// ============================================================================

struct TraceIdConfig {
    LoggingConfig logging;
    RandomSourceConfig random;
    ParseConfig parse;
};

} // namespace traceid
