#pragma once

#include "config/config_types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace lmgate {

// ============================================================================
// ConfigLoader - TOML file, ${VAR} expansion, LMSERVER_* overrides
// ============================================================================

/**
 * Precedence, lowest first: built-in defaults, TOML keys, LMSERVER_*
 * entries in the dotenv file, LMSERVER_* process environment variables.
 * The result is validated as a whole; every problem found is reported
 * in one message.
 */
class ConfigLoader {
public:
    static constexpr const char* kDefaultEnvFile = ".env";

    struct LoadResult {
        bool success;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
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
     * @param config_path Path to gateway.toml
     * @param env_file Dotenv file consulted for LMSERVER_* keys; may be absent
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path,
                                                   const std::string& env_file = kDefaultEnvFile);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content,
                                                     const std::string& env_file = kDefaultEnvFile);

    /**
     * @brief Built-in defaults plus environment overrides (no config file)
     */
    [[nodiscard]] static LoadResult load_defaults(const std::string& env_file = kDefaultEnvFile);

    /**
     * @brief KEY=VALUE pairs from a dotenv file
     *
     * Blank lines, `#` comments and an `export ` prefix are skipped;
     * one pair of matching quotes around a value is removed. A missing
     * file yields an empty map.
     */
    [[nodiscard]] static std::unordered_map<std::string, std::string>
    read_env_file(const std::string& path);

    /**
     * @brief Semantic checks on a fully assembled config
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);
};

} // namespace lmgate
