/*
 * Copyright 2025 tokengate Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <string>

#include "control/config.hpp"
#include "test_support.hpp"

using namespace tokengate::control;

namespace {

constexpr const char* TENANT = "11111111-1111-1111-1111-111111111111";
constexpr const char* CLIENT = "00000000-0000-0000-0000-000000000000";

bool contains(const std::vector<std::string>& messages, const std::string& needle) {
    return std::any_of(messages.begin(), messages.end(), [&](const std::string& message) {
        return message.find(needle) != std::string::npos;
    });
}

/// Clears the deployment variables for the duration of a test
struct ScopedEnvironment {
    ScopedEnvironment() { clear(); }
    ~ScopedEnvironment() { clear(); }

    static void clear() {
        unsetenv("AZURE_TENANT_ID");
        unsetenv("AZURE_CLIENT_ID");
        unsetenv("PORT");
    }
};

Config entra_config() {
    Config config;
    config.identity.tenant_id = TENANT;
    config.identity.client_id = CLIENT;
    ConfigLoader::apply_derived_defaults(config);
    return config;
}

}  // namespace

TEST_CASE("Config defaults", "[config]") {
    Config config;
    REQUIRE(config.server.listen_address == "0.0.0.0");
    REQUIRE(config.server.listen_port == 8080);
    REQUIRE(config.identity.authority == "https://login.microsoftonline.com");
    REQUIRE(config.identity.allowed_algorithms == std::vector<std::string>{"RS256"});
    REQUIRE(config.identity.clock_skew_seconds == 60);
    REQUIRE(config.jwks.cache_ttl_seconds == 3600);
    REQUIRE(config.jwks.timeout_ms == 5000);
    REQUIRE(config.logging.output == "stdout");
    REQUIRE_FALSE(config.uses_static_keys());
}

TEST_CASE("Config JSON loading", "[config][json]") {
    SECTION("Partial document keeps defaults") {
        auto config = ConfigLoader::load_from_json(R"({
            "server": {"listen_port": 9000},
            "identity": {"tenant_id": "t", "client_id": "c", "clock_skew_seconds": 30},
            "logging": {"level": "debug", "exclude_paths": ["/"]}
        })");
        REQUIRE(config.has_value());
        REQUIRE(config->server.listen_port == 9000);
        REQUIRE(config->server.listen_address == "0.0.0.0");
        REQUIRE(config->identity.tenant_id == "t");
        REQUIRE(config->identity.clock_skew_seconds == 30);
        REQUIRE(config->identity.allowed_algorithms == std::vector<std::string>{"RS256"});
        REQUIRE(config->logging.level == "debug");
        REQUIRE(config->logging.exclude_paths == std::vector<std::string>{"/"});
        REQUIRE(config->logging.rotation.max_files == 10);
    }

    SECTION("Static keys") {
        auto config = ConfigLoader::load_from_json(R"({
            "jwks": {"static_keys": [{"key_id": "k1", "public_key_path": "/etc/keys/k1.pem",
                                      "algorithm": "RS256"}]}
        })");
        REQUIRE(config.has_value());
        REQUIRE(config->uses_static_keys());
        REQUIRE(config->jwks.static_keys.size() == 1);
        REQUIRE(config->jwks.static_keys[0].algorithm == "RS256");
    }

    SECTION("Static key without path") {
        REQUIRE_FALSE(
            ConfigLoader::load_from_json(R"({"jwks": {"static_keys": [{"key_id": "k1"}]}})")
                .has_value());
    }

    SECTION("Invalid JSON") {
        REQUIRE_FALSE(ConfigLoader::load_from_json("{ invalid").has_value());
    }

    SECTION("Wrong field type") {
        REQUIRE_FALSE(
            ConfigLoader::load_from_json(R"({"server": {"listen_port": "eighty"}})").has_value());
    }

    SECTION("Serialization round trip") {
        auto original = entra_config();
        original.description = "test deployment";
        auto reloaded = ConfigLoader::load_from_json(ConfigLoader::to_json(original));
        REQUIRE(reloaded.has_value());
        REQUIRE(reloaded->identity.issuers == original.identity.issuers);
        REQUIRE(reloaded->identity.audience == original.identity.audience);
        REQUIRE(reloaded->jwks.url == original.jwks.url);
        REQUIRE(reloaded->description == "test deployment");
    }

    SECTION("Load from file") {
        auto path = tokengate::testing::temp_path("config.json");
        {
            std::ofstream file(path);
            file << R"({"identity": {"tenant_id": "from-file"}})";
        }
        auto config = ConfigLoader::load_from_file(path.string());
        REQUIRE(config.has_value());
        REQUIRE(config->identity.tenant_id == "from-file");
        std::filesystem::remove(path);

        REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/tokengate.json").has_value());
    }
}

TEST_CASE("Entra ID derived values", "[config][entra]") {
    SECTION("Issuer, audience and key set URL") {
        REQUIRE(entra_issuer_v1(TENANT) ==
                "https://sts.windows.net/11111111-1111-1111-1111-111111111111/");
        REQUIRE(entra_issuer_v2("https://login.microsoftonline.com/", TENANT) ==
                "https://login.microsoftonline.com/11111111-1111-1111-1111-111111111111/v2.0");
        REQUIRE(entra_jwks_uri("https://login.microsoftonline.com", TENANT) ==
                "https://login.microsoftonline.com/11111111-1111-1111-1111-111111111111/"
                "discovery/v2.0/keys");
        REQUIRE(application_id_uri(CLIENT) == "api://00000000-0000-0000-0000-000000000000");
    }

    SECTION("Defaults derived from tenant and client") {
        auto config = entra_config();
        REQUIRE(config.identity.issuers.size() == 2);
        REQUIRE(config.identity.issuers[0] == entra_issuer_v1(TENANT));
        REQUIRE(config.identity.issuers[1] ==
                entra_issuer_v2(config.identity.authority, TENANT));
        REQUIRE(config.identity.audience == "api://00000000-0000-0000-0000-000000000000");
        REQUIRE(config.jwks.url == entra_jwks_uri(config.identity.authority, TENANT));
    }

    SECTION("Explicit values are kept") {
        Config config;
        config.identity.tenant_id = TENANT;
        config.identity.client_id = CLIENT;
        config.identity.issuers = {"https://issuer.example"};
        config.identity.audience = "api://custom";
        config.jwks.url = "https://keys.example/jwks";
        ConfigLoader::apply_derived_defaults(config);

        REQUIRE(config.identity.issuers == std::vector<std::string>{"https://issuer.example"});
        REQUIRE(config.identity.audience == "api://custom");
        REQUIRE(config.jwks.url == "https://keys.example/jwks");
    }

    SECTION("Static keys suppress the key set URL") {
        Config config;
        config.identity.tenant_id = TENANT;
        config.jwks.static_jwks_path = "/etc/tokengate/jwks.json";
        ConfigLoader::apply_derived_defaults(config);
        REQUIRE(config.jwks.url.empty());
    }
}

TEST_CASE("Environment overrides", "[config][env]") {
    ScopedEnvironment env;

    SECTION("Tenant, client and port") {
        setenv("AZURE_TENANT_ID", TENANT, 1);
        setenv("AZURE_CLIENT_ID", CLIENT, 1);
        setenv("PORT", "5000", 1);

        Config config;
        config.identity.tenant_id = "from-file";
        ConfigLoader::apply_environment(config);

        REQUIRE(config.identity.tenant_id == TENANT);
        REQUIRE(config.identity.client_id == CLIENT);
        REQUIRE(config.server.listen_port == 5000);
    }

    SECTION("Unset and empty variables change nothing") {
        setenv("AZURE_TENANT_ID", "", 1);

        Config config;
        config.identity.tenant_id = "from-file";
        ConfigLoader::apply_environment(config);
        REQUIRE(config.identity.tenant_id == "from-file");
        REQUIRE(config.server.listen_port == 8080);
    }

    SECTION("Invalid PORT fails validation") {
        for (const char* port : {"http", "70000", "80x", "-1"}) {
            setenv("PORT", port, 1);
            Config config = entra_config();
            ConfigLoader::apply_environment(config);
            REQUIRE(config.server.listen_port == 0);
            REQUIRE(contains(ConfigLoader::validate(config).errors, "listen_port"));
        }
    }
}

TEST_CASE("Config validation", "[config][validation]") {
    SECTION("Entra configuration is valid") {
        auto result = ConfigLoader::validate(entra_config());
        REQUIRE(result.valid);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(result.warnings.empty());
    }

    SECTION("Missing tenant and client") {
        Config config;
        ConfigLoader::apply_derived_defaults(config);
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(contains(result.errors, "identity.audience"));
        REQUIRE(contains(result.errors, "identity.issuers"));
        REQUIRE(contains(result.errors, "No key source"));
    }

    SECTION("none cannot be allowed") {
        auto config = entra_config();
        config.identity.allowed_algorithms = {"RS256", "none"};
        REQUIRE(contains(ConfigLoader::validate(config).errors, "'none'"));
    }

    SECTION("Unknown and empty algorithm lists") {
        auto config = entra_config();
        config.identity.allowed_algorithms = {"HS256"};
        REQUIRE(contains(ConfigLoader::validate(config).errors, "Unknown algorithm 'HS256'"));

        config.identity.allowed_algorithms.clear();
        REQUIRE(contains(ConfigLoader::validate(config).errors, "must not be empty"));
    }

    SECTION("Clock skew bounds") {
        auto config = entra_config();
        config.identity.clock_skew_seconds = -1;
        REQUIRE(ConfigLoader::validate(config).has_errors());

        config.identity.clock_skew_seconds = 600;
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(contains(result.warnings, "clock_skew_seconds"));
    }

    SECTION("Key set URL checks") {
        auto config = entra_config();
        config.jwks.url = "http://insecure.example/keys";
        config.jwks.cache_ttl_seconds = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(contains(result.warnings, "not HTTPS"));
        REQUIRE(contains(result.warnings, "cache_ttl_seconds"));

        config.jwks.timeout_ms = 0;
        REQUIRE(contains(ConfigLoader::validate(config).errors, "timeout_ms"));
    }

    SECTION("Static key entries") {
        auto config = entra_config();
        config.jwks.url.clear();
        config.jwks.static_keys.push_back({"", "", "XS256"});
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains(result.errors, "empty key_id"));
        REQUIRE(contains(result.errors, "no public_key_path"));
        REQUIRE(contains(result.errors, "unsupported algorithm 'XS256'"));
    }

    SECTION("Logging settings") {
        auto config = entra_config();
        config.logging.level = "verbose";
        config.logging.format = "xml";
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains(result.errors, "logging level 'verbose'"));
        REQUIRE(contains(result.errors, "logging format 'xml'"));
    }

    SECTION("Server timeouts") {
        auto config = entra_config();
        config.server.read_timeout = 0;
        REQUIRE(contains(ConfigLoader::validate(config).errors, "read_timeout"));
    }
}
