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

// tokengate Configuration - Implementation

#include "config.hpp"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <fmt/format.h>

#include "../core/algorithm.hpp"

namespace tokengate::control {

namespace {

std::string_view trim_trailing_slash(std::string_view url) {
    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }
    return url;
}

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

}  // namespace

// Entra ID helpers

std::string entra_issuer_v1(std::string_view tenant_id) {
    return fmt::format("https://sts.windows.net/{}/", tenant_id);
}

std::string entra_issuer_v2(std::string_view authority, std::string_view tenant_id) {
    return fmt::format("{}/{}/v2.0", trim_trailing_slash(authority), tenant_id);
}

std::string entra_jwks_uri(std::string_view authority, std::string_view tenant_id) {
    return fmt::format("{}/{}/discovery/v2.0/keys", trim_trailing_slash(authority), tenant_id);
}

std::string application_id_uri(std::string_view client_id) {
    return fmt::format("api://{}", client_id);
}

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Logging is not up yet while the config is being read
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    return config;
}

void ConfigLoader::apply_environment(Config& config) {
    if (const char* tenant = env_or_null("AZURE_TENANT_ID")) {
        config.identity.tenant_id = tenant;
    }
    if (const char* client = env_or_null("AZURE_CLIENT_ID")) {
        config.identity.client_id = client;
    }
    if (const char* port = env_or_null("PORT")) {
        std::string_view text{port};
        unsigned int value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size() ||
            value > std::numeric_limits<uint16_t>::max()) {
            // Reported by validate() as an invalid port
            config.server.listen_port = 0;
        } else {
            config.server.listen_port = static_cast<uint16_t>(value);
        }
    }
}

void ConfigLoader::apply_derived_defaults(Config& config) {
    auto& identity = config.identity;

    // Both Entra issuer shapes are listed explicitly; the validator never guesses
    if (identity.issuers.empty() && !identity.tenant_id.empty()) {
        identity.issuers.push_back(entra_issuer_v1(identity.tenant_id));
        identity.issuers.push_back(entra_issuer_v2(identity.authority, identity.tenant_id));
    }

    if (identity.audience.empty() && !identity.client_id.empty()) {
        identity.audience = application_id_uri(identity.client_id);
    }

    if (config.jwks.url.empty() && !config.uses_static_keys() && !identity.tenant_id.empty()) {
        config.jwks.url = entra_jwks_uri(identity.authority, identity.tenant_id);
    }
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Validate server configuration
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be between 1 and 65535");
    }
    if (config.server.read_timeout == 0 || config.server.write_timeout == 0) {
        result.add_error("Server read_timeout and write_timeout must be > 0");
    }

    // Validate trust policy
    const auto& identity = config.identity;
    if (identity.audience.empty()) {
        result.add_error("identity.audience is empty (set audience or client_id)");
    }
    if (identity.issuers.empty()) {
        result.add_error("identity.issuers is empty (set issuers or tenant_id)");
    }
    for (const auto& issuer : identity.issuers) {
        if (issuer.empty()) {
            result.add_error("identity.issuers contains an empty issuer");
        }
    }

    if (identity.allowed_algorithms.empty()) {
        result.add_error("identity.allowed_algorithms must not be empty");
    }
    for (const auto& name : identity.allowed_algorithms) {
        auto alg = core::parse_algorithm(name);
        if (!alg) {
            result.add_error("Unknown algorithm '" + name + "' in identity.allowed_algorithms");
        } else if (*alg == core::JwtAlgorithm::None) {
            result.add_error("Algorithm 'none' cannot be allowed");
        }
    }

    if (identity.clock_skew_seconds < 0) {
        result.add_error("identity.clock_skew_seconds must be >= 0");
    } else if (identity.clock_skew_seconds > 300) {
        result.add_warning("identity.clock_skew_seconds above 300 widens the replay window");
    }

    // Validate key source
    const auto& jwks = config.jwks;
    if (config.uses_static_keys()) {
        for (const auto& key : jwks.static_keys) {
            if (key.key_id.empty()) {
                result.add_error("Static key has an empty key_id");
            }
            if (key.public_key_path.empty()) {
                result.add_error("Static key '" + key.key_id + "' has no public_key_path");
            }
            if (!key.algorithm.empty()) {
                auto alg = core::parse_algorithm(key.algorithm);
                if (!alg || *alg == core::JwtAlgorithm::None) {
                    result.add_error("Static key '" + key.key_id + "' has unsupported algorithm '" +
                                     key.algorithm + "'");
                }
            }
        }
        if (!jwks.url.empty()) {
            result.add_warning("jwks.url is ignored when static keys are configured");
        }
    } else if (jwks.url.empty()) {
        result.add_error("No key source: set jwks.url, identity.tenant_id or static keys");
    } else {
        if (jwks.url.rfind("https://", 0) != 0) {
            result.add_warning("jwks.url is not HTTPS: " + jwks.url);
        }
        if (jwks.timeout_ms == 0) {
            result.add_error("jwks.timeout_ms must be > 0");
        }
        if (jwks.cache_ttl_seconds == 0) {
            result.add_warning("jwks.cache_ttl_seconds is 0 (every lookup refetches)");
        }
    }

    // Validate logging
    const auto& log = config.logging;
    if (log.level != "debug" && log.level != "info" && log.level != "warning" &&
        log.level != "warn" && log.level != "error") {
        result.add_error("Unknown logging level '" + log.level + "'");
    }
    if (log.format != "json" && log.format != "text") {
        result.add_error("Unknown logging format '" + log.format + "'");
    }
    if (log.output.empty()) {
        result.add_error("logging.output must be 'stdout' or a directory");
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

}  // namespace tokengate::control
