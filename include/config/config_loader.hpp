#pragma once

#include "core/error.hpp"

#include <string>
#include <vector>

namespace xrayot {

// ============================================================================
// Tracer Config (mirrors TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct RecorderConfig {
    /// Treat every thread as running inside a host-supplied top-level segment
    bool host_managed = false;
};

struct EmitterConfig {
    bool enabled = true;
    std::string daemon_address = "127.0.0.1:2000";
};

struct ServiceConfig {
    std::string name = "xrayot";
    std::string version;
};

struct TracerConfig {
    LoggingConfig logging;
    RecorderConfig recorder;
    EmitterConfig emitter;
    ServiceConfig service;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads TracerConfig from TOML
 *
 * String values may reference environment variables as ${VAR}. When
 * AWS_XRAY_DAEMON_ADDRESS is set it replaces emitter.daemon_address.
 */
class ConfigLoader {
public:
    static constexpr const char* kDaemonAddressEnv = "AWS_XRAY_DAEMON_ADDRESS";

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to xrayot.toml
     * @return parsed config, or CONFIG_ERROR / VALIDATION_ERROR
     */
    [[nodiscard]] static Result<TracerConfig> load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     */
    [[nodiscard]] static Result<TracerConfig> load_from_string(const std::string& toml_content);

    /// Defaults plus environment overrides, for running without a file
    [[nodiscard]] static Result<TracerConfig> load_defaults();

    /// @return one message per invalid field, empty if valid
    [[nodiscard]] static std::vector<std::string> validate_config(const TracerConfig& config);

private:
    static Result<TracerConfig> finish_loading(TracerConfig config);
};

} // namespace xrayot
