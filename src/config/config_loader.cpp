#include "config/config_loader.hpp"
#include "recorder/udp_emitter.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace xrayot {

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
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl);

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* t = node.as_table()) {
        expand_env_vars_recursive(*t);
    } else if (auto* a = node.as_array()) {
        for (auto& elem : *a) {
            expand_env_vars_in_node(elem);
        }
    }
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

// ---- Section extraction ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* l = root["logging"].as_table()) {
        cfg.level = (*l)["level"].value_or(cfg.level);
    }
    return cfg;
}

RecorderConfig extract_recorder(const toml::table& root) {
    RecorderConfig cfg;
    if (const auto* r = root["recorder"].as_table()) {
        cfg.host_managed = (*r)["host_managed"].value_or(cfg.host_managed);
    }
    return cfg;
}

EmitterConfig extract_emitter(const toml::table& root) {
    EmitterConfig cfg;
    if (const auto* e = root["emitter"].as_table()) {
        cfg.enabled = (*e)["enabled"].value_or(cfg.enabled);
        cfg.daemon_address = (*e)["daemon_address"].value_or(cfg.daemon_address);
    }
    return cfg;
}

ServiceConfig extract_service(const toml::table& root) {
    ServiceConfig cfg;
    if (const auto* s = root["service"].as_table()) {
        cfg.name = (*s)["name"].value_or(cfg.name);
        cfg.version = (*s)["version"].value_or(""s);
    }
    return cfg;
}

TracerConfig extract_all_sections(const toml::table& root) {
    TracerConfig config;
    config.logging = extract_logging(root);
    config.recorder = extract_recorder(root);
    config.emitter = extract_emitter(root);
    config.service = extract_service(root);
    return config;
}

} // anonymous namespace

// ---- Public API ------------------------------------------------------------

Result<TracerConfig> ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return finish_loading(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return Result<TracerConfig>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to load config: {}", e.what()));
    }
}

Result<TracerConfig> ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return finish_loading(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return Result<TracerConfig>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to parse config: {}", e.what()));
    }
}

Result<TracerConfig> ConfigLoader::load_defaults() {
    return finish_loading(TracerConfig{});
}

Result<TracerConfig> ConfigLoader::finish_loading(TracerConfig config) {
    if (const char* address = std::getenv(kDaemonAddressEnv); address && *address) {
        config.emitter.daemon_address = address;
    }

    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return Result<TracerConfig>::error(ErrorCategory::VALIDATION_ERROR, std::move(combined));
    }
    return Result<TracerConfig>::ok(std::move(config));
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const TracerConfig& config) {
    std::vector<std::string> errors;

    const auto level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" &&
        level != "warning" && level != "error") {
        errors.push_back(std::format(
            "logging.level must be one of debug|info|warn|error, got '{}'", config.logging.level));
    }

    std::string host;
    uint16_t port = 0;
    if (!UdpEmitter::parse_address(config.emitter.daemon_address, host, port)) {
        errors.push_back(std::format(
            "emitter.daemon_address must be host:port with port 1-65535, got '{}'",
            config.emitter.daemon_address));
    }

    if (config.service.name.empty()) {
        errors.push_back("service.name must not be empty");
    }

    return errors;
}

} // namespace xrayot
