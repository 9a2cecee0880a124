#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace traceid {

struct RandomSourceConfig;

/**
 * @brief Source of random bits for trace id generation
 *
 * Implementations must be safe to call concurrently from any number of
 * threads: a single instance is shared by every request worker.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// 64 uniformly distributed random bits
    [[nodiscard]] virtual uint64_t next_u64() = 0;
};

/**
 * @brief Cryptographically secure source backed by OpenSSL RAND_bytes
 *
 * RAND_bytes is thread-safe and needs no per-thread state. Should it ever
 * report failure, draws come from a thread-local mt19937_64 seeded by
 * std::random_device instead (a warning is logged once per process), so
 * next_u64() itself never fails.
 */
class SecureRandomSource : public IRandomSource {
public:
    [[nodiscard]] uint64_t next_u64() override;
};

/**
 * @brief Deterministic mt19937_64 source for tests and reproducible tooling
 */
class SeededRandomSource : public IRandomSource {
public:
    explicit SeededRandomSource(uint64_t seed);

    [[nodiscard]] uint64_t next_u64() override;

private:
    std::mutex mutex_;
    std::mt19937_64 gen_;
};

/// Process-wide source used by TraceId::create() and parse fallbacks.
/// A SecureRandomSource until replaced.
[[nodiscard]] std::shared_ptr<IRandomSource> default_random_source();

/// Install the process-wide source; nullptr restores the secure default.
void set_default_random_source(std::shared_ptr<IRandomSource> source);

/// Build a source from the [random] config section
[[nodiscard]] std::shared_ptr<IRandomSource> make_random_source(const RandomSourceConfig& config);

} // namespace traceid
