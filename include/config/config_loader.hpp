#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace traceid {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        TraceIdConfig config;

        static LoadResult ok(TraceIdConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to traceid.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Install config process-wide: log level, default random source,
     * parse fallback logging
     */
    static void apply(const TraceIdConfig& config);

    [[nodiscard]] static std::vector<std::string> validate_config(const TraceIdConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static RandomSourceConfig extract_random(const toml::table& root);
    static ParseConfig extract_parse(const toml::table& root);
    static TraceIdConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(TraceIdConfig config);
};

} // namespace traceid
