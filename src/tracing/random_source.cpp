#include "tracing/random_source.hpp"
#include "config/config_types.hpp"
#include "core/utils.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <atomic>
#include <cstring>
#include <format>
#include <shared_mutex>

namespace traceid {

namespace {

uint64_t fallback_u64() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(
        (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd()));
    return gen();
}

void warn_rand_failure_once() {
    static std::atomic<bool> warned{false};
    if (warned.exchange(true)) return;

    char err_buf[256] = {};
    ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
    utils::log::warn(std::format(
        "RAND_bytes failed ({}), using std::mt19937_64 for trace ids", err_buf));
}

struct DefaultSourceSlot {
    std::shared_mutex mutex;
    std::shared_ptr<IRandomSource> source = std::make_shared<SecureRandomSource>();
};

DefaultSourceSlot& default_slot() {
    static DefaultSourceSlot slot;
    return slot;
}

} // anonymous namespace

uint64_t SecureRandomSource::next_u64() {
    unsigned char bytes[sizeof(uint64_t)];
    if (RAND_bytes(bytes, static_cast<int>(sizeof(bytes))) != 1) {
        warn_rand_failure_once();
        return fallback_u64();
    }
    uint64_t value = 0;
    std::memcpy(&value, bytes, sizeof(value));
    return value;
}

SeededRandomSource::SeededRandomSource(uint64_t seed)
    : gen_(seed) {}

uint64_t SeededRandomSource::next_u64() {
    std::lock_guard<std::mutex> lock(mutex_);
    return gen_();
}

std::shared_ptr<IRandomSource> default_random_source() {
    auto& slot = default_slot();
    std::shared_lock<std::shared_mutex> lock(slot.mutex);
    return slot.source;
}

void set_default_random_source(std::shared_ptr<IRandomSource> source) {
    if (!source) {
        source = std::make_shared<SecureRandomSource>();
    }
    auto& slot = default_slot();
    std::unique_lock<std::shared_mutex> lock(slot.mutex);
    slot.source = std::move(source);
}

std::shared_ptr<IRandomSource> make_random_source(const RandomSourceConfig& config) {
    switch (config.type) {
        case RandomSourceType::SEEDED:
            return std::make_shared<SeededRandomSource>(config.seed.value_or(0));
        case RandomSourceType::SECURE:
            break;
    }
    return std::make_shared<SecureRandomSource>();
}

} // namespace traceid
