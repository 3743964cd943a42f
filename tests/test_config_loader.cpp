#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace xrayot;

namespace {

/// Clears the daemon address override for the lifetime of a test
struct DaemonEnvGuard {
    DaemonEnvGuard() { ::unsetenv(ConfigLoader::kDaemonAddressEnv); }
    ~DaemonEnvGuard() { ::unsetenv(ConfigLoader::kDaemonAddressEnv); }
};

} // anonymous namespace

TEST_CASE("ConfigLoader: defaults", "[config]") {
    DaemonEnvGuard guard;

    auto result = ConfigLoader::load_defaults();
    REQUIRE(result.is_ok());
    const auto& config = result.value();
    CHECK(config.logging.level == "info");
    CHECK_FALSE(config.recorder.host_managed);
    CHECK(config.emitter.enabled);
    CHECK(config.emitter.daemon_address == "127.0.0.1:2000");
    CHECK(config.service.name == "xrayot");
    CHECK(config.service.version.empty());
}

TEST_CASE("ConfigLoader: all sections", "[config]") {
    DaemonEnvGuard guard;

    const std::string toml = R"(
[logging]
level = "debug"

[recorder]
host_managed = true

[emitter]
enabled = false
daemon_address = "10.0.0.5:3000"

[service]
name = "orders"
version = "1.4.2"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.is_ok());
    const auto& config = result.value();
    CHECK(config.logging.level == "debug");
    CHECK(config.recorder.host_managed);
    CHECK_FALSE(config.emitter.enabled);
    CHECK(config.emitter.daemon_address == "10.0.0.5:3000");
    CHECK(config.service.name == "orders");
    CHECK(config.service.version == "1.4.2");
}

TEST_CASE("ConfigLoader: missing sections keep defaults", "[config]") {
    DaemonEnvGuard guard;

    auto result = ConfigLoader::load_from_string("[service]\nname = \"billing\"\n");
    REQUIRE(result.is_ok());
    CHECK(result.value().service.name == "billing");
    CHECK(result.value().emitter.daemon_address == "127.0.0.1:2000");
    CHECK(result.value().logging.level == "info");
}

TEST_CASE("ConfigLoader: environment expansion", "[config][env]") {
    DaemonEnvGuard guard;

    SECTION("Variables are substituted") {
        ::setenv("XRAYOT_TEST_DAEMON_HOST", "xray.internal", 1);
        ::setenv("XRAYOT_TEST_DAEMON_PORT", "2100", 1);

        auto result = ConfigLoader::load_from_string(R"(
[emitter]
daemon_address = "${XRAYOT_TEST_DAEMON_HOST}:${XRAYOT_TEST_DAEMON_PORT}"
)");
        REQUIRE(result.is_ok());
        CHECK(result.value().emitter.daemon_address == "xray.internal:2100");

        ::unsetenv("XRAYOT_TEST_DAEMON_HOST");
        ::unsetenv("XRAYOT_TEST_DAEMON_PORT");
    }

    SECTION("Missing variables expand to empty") {
        ::unsetenv("XRAYOT_TEST_MISSING_VAR");
        auto result = ConfigLoader::load_from_string(R"(
[service]
name = "svc${XRAYOT_TEST_MISSING_VAR}"
)");
        REQUIRE(result.is_ok());
        CHECK(result.value().service.name == "svc");
    }

    SECTION("Unclosed substitution is a parse error") {
        auto result = ConfigLoader::load_from_string(R"(
[service]
name = "${UNCLOSED"
)");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
        CHECK(result.error_message().find("Unclosed env var") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: daemon address environment override", "[config][env]") {
    DaemonEnvGuard guard;
    ::setenv(ConfigLoader::kDaemonAddressEnv, "192.168.1.20:2500", 1);

    SECTION("Overrides the file") {
        auto result = ConfigLoader::load_from_string(R"(
[emitter]
daemon_address = "10.0.0.5:3000"
)");
        REQUIRE(result.is_ok());
        CHECK(result.value().emitter.daemon_address == "192.168.1.20:2500");
    }

    SECTION("Overrides the defaults") {
        auto result = ConfigLoader::load_defaults();
        REQUIRE(result.is_ok());
        CHECK(result.value().emitter.daemon_address == "192.168.1.20:2500");
    }

    SECTION("Invalid override fails validation") {
        ::setenv(ConfigLoader::kDaemonAddressEnv, "no-port", 1);
        auto result = ConfigLoader::load_defaults();
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
    }
}

TEST_CASE("ConfigLoader: validation", "[config][validation]") {
    DaemonEnvGuard guard;

    SECTION("Unknown log level") {
        auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"verbose\"\n");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
        CHECK(result.error_message().find("logging.level") != std::string::npos);
    }

    SECTION("Log level is case-insensitive") {
        auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"WARN\"\n");
        CHECK(result.is_ok());
    }

    SECTION("Port out of range") {
        auto result = ConfigLoader::load_from_string("[emitter]\ndaemon_address = \"127.0.0.1:70000\"\n");
        REQUIRE(result.is_error());
        CHECK(result.error_message().find("emitter.daemon_address") != std::string::npos);
    }

    SECTION("Empty service name") {
        auto result = ConfigLoader::load_from_string("[service]\nname = \"\"\n");
        REQUIRE(result.is_error());
        CHECK(result.error_message().find("service.name") != std::string::npos);
    }

    SECTION("All errors are reported together") {
        TracerConfig config;
        config.logging.level = "loud";
        config.emitter.daemon_address = ":2000";
        config.service.name.clear();
        CHECK(ConfigLoader::validate_config(config).size() == 3);
    }

    SECTION("Defaults are valid") {
        CHECK(ConfigLoader::validate_config(TracerConfig{}).empty());
    }
}

TEST_CASE("ConfigLoader: malformed input", "[config]") {
    DaemonEnvGuard guard;

    SECTION("Bad TOML") {
        auto result = ConfigLoader::load_from_string("[emitter\nenabled = ");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
        CHECK(result.error_message().find("Failed to parse config") != std::string::npos);
    }

    SECTION("Missing file") {
        auto result = ConfigLoader::load_from_file("/nonexistent/xrayot.toml");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
        CHECK(result.error_message().find("Failed to load config") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: load from file", "[config]") {
    DaemonEnvGuard guard;

    const std::string path = "xrayot_test_config.toml";
    {
        std::ofstream out(path);
        out << "[service]\nname = \"from-file\"\n\n[emitter]\nenabled = false\n";
    }

    auto result = ConfigLoader::load_from_file(path);
    std::remove(path.c_str());

    REQUIRE(result.is_ok());
    CHECK(result.value().service.name == "from-file");
    CHECK_FALSE(result.value().emitter.enabled);
}
