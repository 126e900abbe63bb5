#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace reviewgate {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to the empty string. A top-level `include` (string or
 * array) merges other files underneath the including one.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
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
     * @param config_path Path to reviewgate.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, empty when the config is usable.
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static AppConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AppConfig config);

    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static HttpInterpreterClient::Config extract_interpreter(const toml::table& root);
    static IntentRouter::Config extract_router(const toml::table& root);
    static Validator::Config extract_validator(const toml::table& root);
    static FallbackPolicy::Config extract_fallback(const toml::table& root);
    static ToolExecutor::Config extract_metrics(const toml::table& root);
    static AccessCache::Config extract_cache(const toml::table& root);
    static TraceConfig extract_trace(const toml::table& root);
    static DataConfig extract_data(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static std::vector<UserRecord> extract_users(const toml::table& root);
    static ToolRegistry::Config extract_tools(const toml::table& root);
};

} // namespace reviewgate
