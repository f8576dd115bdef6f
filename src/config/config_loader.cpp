#include "config/config_loader.hpp"
#include "core/url.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cmath>
#include <cstdlib>
#include <format>
#include <fstream>
#include <functional>
#include <optional>
#include <stdexcept>

using namespace std::string_literals;

namespace lmgate {

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

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = static_cast<int>(s["port"].value_or(int64_t{cfg.port}));
    cfg.threads = static_cast<int>(s["threads"].value_or(int64_t{cfg.threads}));
    cfg.shutdown_timeout = std::chrono::milliseconds(
        s["shutdown_timeout_ms"].value_or(int64_t{cfg.shutdown_timeout.count()}));
    return cfg;
}

BackendConfig extract_backend(const toml::table& root) {
    BackendConfig cfg;
    const auto* backend = root["backend"].as_table();
    if (!backend) return cfg;
    const auto& b = *backend;

    cfg.url = b["url"].value_or(cfg.url);
    if (const auto secs = b["request_timeout_seconds"].value<double>()) {
        cfg.request_timeout = seconds_to_ms(*secs);
    }
    cfg.probe_timeout = std::chrono::milliseconds(
        b["probe_timeout_ms"].value_or(int64_t{cfg.probe_timeout.count()}));
    const auto buffered = b["max_buffered_bytes"].value_or(static_cast<int64_t>(cfg.max_buffered_bytes));
    cfg.max_buffered_bytes = buffered > 0 ? static_cast<size_t>(buffered) : 0;
    return cfg;
}

AdmissionConfig extract_admission(const toml::table& root) {
    AdmissionConfig cfg;
    const auto* admission = root["admission"].as_table();
    if (!admission) return cfg;
    const auto& a = *admission;

    const auto max_concurrent = a["max_concurrent"].value_or(int64_t{cfg.max_concurrent});
    cfg.max_concurrent = max_concurrent > 0 ? static_cast<uint32_t>(max_concurrent) : 0;
    cfg.disconnect_poll = std::chrono::milliseconds(
        a["disconnect_poll_ms"].value_or(int64_t{cfg.disconnect_poll.count()}));
    return cfg;
}

ModelsConfig extract_models(const toml::table& root) {
    ModelsConfig cfg;
    if (const auto* models = root["models"].as_table()) {
        cfg.default_model = (*models)["default_model"].value_or(cfg.default_model);
    }
    return cfg;
}

DnsConfig extract_dns(const toml::table& root) {
    DnsConfig cfg;
    const auto* dns = root["dns"].as_table();
    if (!dns) return cfg;
    const auto& d = *dns;

    cfg.register_on_startup = d["register_on_startup"].value_or(cfg.register_on_startup);
    cfg.api_url = d["api_url"].value_or(cfg.api_url);
    cfg.domain_base = d["domain_base"].value_or(cfg.domain_base);
    cfg.service_name = d["service_name"].value_or(cfg.service_name);
    cfg.target_device = d["target_device"].value_or(cfg.target_device);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or(cfg.level);
    }
    return cfg;
}

GatewayConfig extract_all_sections(const toml::table& root) {
    GatewayConfig config;
    config.server = extract_server(root);
    config.backend = extract_backend(root);
    config.admission = extract_admission(root);
    config.models = extract_models(root);
    config.dns = extract_dns(root);
    config.logging = extract_logging(root);
    return config;
}

// ---- Environment overrides -------------------------------------------------

struct EnvOverride {
    const char* name;
    // Applies the raw value; returns false when it does not parse
    std::function<bool(GatewayConfig&, const std::string&)> apply;
};

template <typename T>
bool assign_int(T& target, const std::string& raw) {
    const auto parsed = utils::parse_int<T>(utils::trim(raw));
    if (!parsed) return false;
    target = *parsed;
    return true;
}

const std::vector<EnvOverride>& env_overrides() {
    static const std::vector<EnvOverride> table = {
        {"LMSERVER_HOST", [](GatewayConfig& c, const std::string& v) {
            c.server.host = v; return true; }},
        {"LMSERVER_PORT", [](GatewayConfig& c, const std::string& v) {
            return assign_int(c.server.port, v); }},
        {"LMSERVER_THREADS", [](GatewayConfig& c, const std::string& v) {
            return assign_int(c.server.threads, v); }},
        {"LMSERVER_LLAMA_SERVER_URL", [](GatewayConfig& c, const std::string& v) {
            c.backend.url = v; return true; }},
        {"LMSERVER_REQUEST_TIMEOUT", [](GatewayConfig& c, const std::string& v) {
            const auto secs = utils::parse_double(utils::trim(v));
            if (!secs) return false;
            c.backend.request_timeout = seconds_to_ms(*secs);
            return true; }},
        {"LMSERVER_MAX_CONCURRENT_REQUESTS", [](GatewayConfig& c, const std::string& v) {
            return assign_int(c.admission.max_concurrent, v); }},
        {"LMSERVER_DEFAULT_MODEL", [](GatewayConfig& c, const std::string& v) {
            c.models.default_model = v; return true; }},
        {"LMSERVER_DNS_REGISTER_ON_STARTUP", [](GatewayConfig& c, const std::string& v) {
            const auto flag = utils::parse_bool(v);
            if (!flag) return false;
            c.dns.register_on_startup = *flag;
            return true; }},
        {"LMSERVER_DNS_API_URL", [](GatewayConfig& c, const std::string& v) {
            c.dns.api_url = v; return true; }},
        {"LMSERVER_DNS_DOMAIN_BASE", [](GatewayConfig& c, const std::string& v) {
            c.dns.domain_base = v; return true; }},
        {"LMSERVER_DNS_SERVICE_NAME", [](GatewayConfig& c, const std::string& v) {
            c.dns.service_name = v; return true; }},
        {"LMSERVER_DNS_TARGET_DEVICE", [](GatewayConfig& c, const std::string& v) {
            c.dns.target_device = v; return true; }},
        {"LMSERVER_LOG_LEVEL", [](GatewayConfig& c, const std::string& v) {
            c.logging.level = v; return true; }},
    };
    return table;
}

using EnvFile = std::unordered_map<std::string, std::string>;

// Process environment first, then the dotenv file
std::optional<std::string> lookup_env(const char* name, const EnvFile& env_file) {
    if (const char* raw = std::getenv(name)) {
        return std::string(raw);
    }
    if (const auto it = env_file.find(name); it != env_file.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<std::string> apply_env_overrides(GatewayConfig& config, const EnvFile& env_file) {
    std::vector<std::string> errors;
    for (const auto& entry : env_overrides()) {
        const auto raw = lookup_env(entry.name, env_file);
        if (!raw) continue;
        if (!entry.apply(config, *raw)) {
            errors.push_back(std::format("{}: cannot parse '{}'", entry.name, *raw));
        }
    }
    return errors;
}

ConfigLoader::LoadResult finalize(GatewayConfig config, const std::string& env_file) {
    auto errors = apply_env_overrides(config, ConfigLoader::read_env_file(env_file));
    auto semantic = ConfigLoader::validate_config(config);
    errors.insert(errors.end(), semantic.begin(), semantic.end());

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path,
                                                      const std::string& env_file) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return finalize(extract_all_sections(tbl), env_file);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content,
                                                        const std::string& env_file) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return finalize(extract_all_sections(tbl), env_file);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_defaults(const std::string& env_file) {
    try {
        return finalize(GatewayConfig{}, env_file);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

std::unordered_map<std::string, std::string> ConfigLoader::read_env_file(const std::string& path) {
    std::unordered_map<std::string, std::string> entries;
    if (path.empty()) return entries;

    std::ifstream in(path);
    if (!in) return entries;

    std::string line;
    while (std::getline(in, line)) {
        std::string text = utils::trim(line);
        if (text.empty() || text.front() == '#') continue;
        if (text.starts_with("export ")) {
            text = utils::trim(text.substr(7));
        }

        const size_t eq = text.find('=');
        if (eq == std::string::npos || eq == 0) continue;

        std::string key = utils::trim(text.substr(0, eq));
        std::string value = utils::trim(text.substr(eq + 1));
        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        entries[std::move(key)] = std::move(value);
    }
    return entries;
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.threads < 1) {
        errors.push_back(std::format("server.threads must be >= 1, got {}", config.server.threads));
    }
    if (config.server.shutdown_timeout.count() < 0) {
        errors.push_back("server.shutdown_timeout_ms must not be negative");
    }

    if (!parse_base_url(config.backend.url)) {
        errors.push_back(std::format(
            "backend.url must be http://host[:port] or https://host[:port], got '{}'",
            config.backend.url));
    }
    if (config.backend.request_timeout.count() <= 0) {
        errors.push_back("backend.request_timeout_seconds must be > 0");
    }
    if (config.backend.probe_timeout.count() <= 0) {
        errors.push_back("backend.probe_timeout_ms must be > 0");
    }
    if (config.backend.max_buffered_bytes == 0) {
        errors.push_back("backend.max_buffered_bytes must be > 0");
    }

    if (config.admission.max_concurrent < 1) {
        errors.push_back("admission.max_concurrent must be >= 1");
    }
    if (config.admission.disconnect_poll.count() <= 0) {
        errors.push_back("admission.disconnect_poll_ms must be > 0");
    }

    if (config.models.default_model.empty()) {
        errors.push_back("models.default_model must not be empty");
    }

    if (config.dns.register_on_startup) {
        if (!parse_base_url(config.dns.api_url)) {
            errors.push_back(std::format("dns.api_url is not a valid URL: '{}'", config.dns.api_url));
        }
        if (config.dns.service_name.empty()) {
            errors.push_back("dns.service_name required when register_on_startup is true");
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'", config.logging.level));
    }

    return errors;
}

} // namespace lmgate
