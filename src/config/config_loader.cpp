#include "config/config_loader.hpp"
#include "tracing/random_source.hpp"
#include "tracing/trace_id.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace traceid {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    const std::string level = (*logging)["level"].value_or("info"s);
    const auto parsed = utils::log::parse_level(level);
    if (!parsed) {
        throw std::runtime_error(std::format("logging.level: unknown level '{}'", level));
    }
    cfg.level = *parsed;
    return cfg;
}

RandomSourceConfig ConfigLoader::extract_random(const toml::table& root) {
    RandomSourceConfig cfg;
    const auto* random = root["random"].as_table();
    if (!random) return cfg;
    const auto& r = *random;

    const std::string source = utils::to_lower(r["source"].value_or("secure"s));
    if (source == "secure") {
        cfg.type = RandomSourceType::SECURE;
    } else if (source == "seeded") {
        cfg.type = RandomSourceType::SEEDED;
    } else {
        throw std::runtime_error(std::format("random.source: unknown source '{}'", source));
    }

    if (const auto seed = r["seed"].value<int64_t>()) {
        if (*seed < 0) {
            throw std::runtime_error(std::format("random.seed must be >= 0, got {}", *seed));
        }
        cfg.seed = static_cast<uint64_t>(*seed);
    }
    return cfg;
}

ParseConfig ConfigLoader::extract_parse(const toml::table& root) {
    ParseConfig cfg;
    const auto* parse = root["parse"].as_table();
    if (!parse) return cfg;

    cfg.log_fallbacks = (*parse)["log_fallbacks"].value_or(false);
    return cfg;
}

TraceIdConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    TraceIdConfig config;
    config.logging = extract_logging(root);
    config.random = extract_random(root);
    config.parse = extract_parse(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(TraceIdConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

void ConfigLoader::apply(const TraceIdConfig& config) {
    utils::log::set_level(config.logging.level);
    set_default_random_source(make_random_source(config.random));
    set_parse_fallback_logging(config.parse.log_fallbacks);

    if (config.random.type == RandomSourceType::SEEDED) {
        utils::log::warn(std::format(
            "Trace ids drawn from deterministic seed {}; not for production use",
            config.random.seed.value_or(0)));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const TraceIdConfig& config) {
    std::vector<std::string> errors;

    if (config.random.type == RandomSourceType::SEEDED && !config.random.seed) {
        errors.push_back("random.seed required when random.source is \"seeded\"");
    }

    return errors;
}

} // namespace traceid
