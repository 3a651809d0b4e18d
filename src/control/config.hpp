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

// tokengate Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace tokengate::control {

/// Default Microsoft Entra ID authority host
inline constexpr std::string_view DEFAULT_AUTHORITY = "https://login.microsoftonline.com";

/// HTTP listener configuration
struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8080;

    // Timeouts (milliseconds)
    uint32_t read_timeout = 60000;
    uint32_t write_timeout = 60000;

    uint32_t worker_threads = 0;  // 0 = cpp-httplib default pool size

    std::string service_name = "tokengate";  // Reported by the health endpoint
};

/// Identity provider and trust policy settings
struct IdentityConfig {
    std::string tenant_id;                                 // Entra tenant (AZURE_TENANT_ID)
    std::string client_id;                                 // App registration (AZURE_CLIENT_ID)
    std::string authority = std::string(DEFAULT_AUTHORITY);

    std::vector<std::string> issuers;   // Accepted iss values (derived from tenant if empty)
    std::string audience;               // Required aud (api://{client_id} if empty)
    std::vector<std::string> allowed_algorithms = {"RS256"};
    int64_t clock_skew_seconds = 60;    // Tolerance for exp/nbf/iat (clock drift)
};

/// Static verification key (PEM file)
struct StaticKeyConfig {
    std::string key_id;           // kid the tokens reference
    std::string public_key_path;  // SubjectPublicKeyInfo PEM file
    std::string algorithm;        // Optional pin, e.g. "RS256"
};

/// Key source settings
struct JwksSettings {
    std::string url;                         // JWKS endpoint (derived from tenant if empty)
    uint32_t cache_ttl_seconds = 3600;       // Snapshot lifetime (1 hour)
    uint32_t timeout_ms = 5000;              // Bound on a single fetch
    uint32_t refresh_interval_seconds = 0;   // Background refresh, 0 = on demand only
    bool serve_stale_on_error = false;       // Keep serving expired keys when the provider is down

    // Offline key material (replaces the JWKS endpoint when set)
    std::vector<StaticKeyConfig> static_keys;
    std::string static_jwks_path;            // JWKS document on disk
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";     // debug, info, warning, error
    std::string format = "text";    // json, text (file output only)
    std::string output = "stdout";  // "stdout" or a log directory (tokengate.log appended)
    bool log_requests = true;
    std::vector<std::string> exclude_paths;  // Don't log these paths

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full tokengate configuration
struct Config {
    ServerConfig server;
    IdentityConfig identity;
    JwksSettings jwks;
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;

    /// True when keys come from files instead of the JWKS endpoint
    [[nodiscard]] bool uses_static_keys() const noexcept {
        return !jwks.static_keys.empty() || !jwks.static_jwks_path.empty();
    }
};

// Custom from_json/to_json (missing fields keep their defaults)

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", uint16_t(8080));
    s.read_timeout = j.value("read_timeout", 60000u);
    s.write_timeout = j.value("write_timeout", 60000u);
    s.worker_threads = j.value("worker_threads", 0u);
    s.service_name = j.value("service_name", std::string("tokengate"));
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"read_timeout", s.read_timeout},
                       {"write_timeout", s.write_timeout},
                       {"worker_threads", s.worker_threads},
                       {"service_name", s.service_name}};
}

inline void from_json(const nlohmann::json& j, IdentityConfig& i) {
    i.tenant_id = j.value("tenant_id", std::string());
    i.client_id = j.value("client_id", std::string());
    i.authority = j.value("authority", std::string(DEFAULT_AUTHORITY));
    i.issuers = j.value("issuers", std::vector<std::string>());
    i.audience = j.value("audience", std::string());
    i.allowed_algorithms =
        j.value("allowed_algorithms", std::vector<std::string>{"RS256"});
    i.clock_skew_seconds = j.value("clock_skew_seconds", int64_t(60));
}

inline void to_json(nlohmann::json& j, const IdentityConfig& i) {
    j = nlohmann::json{{"tenant_id", i.tenant_id},
                       {"client_id", i.client_id},
                       {"authority", i.authority},
                       {"issuers", i.issuers},
                       {"audience", i.audience},
                       {"allowed_algorithms", i.allowed_algorithms},
                       {"clock_skew_seconds", i.clock_skew_seconds}};
}

inline void from_json(const nlohmann::json& j, StaticKeyConfig& k) {
    j.at("key_id").get_to(k.key_id);                    // key_id is required
    j.at("public_key_path").get_to(k.public_key_path);  // public_key_path is required
    k.algorithm = j.value("algorithm", std::string());
}

inline void to_json(nlohmann::json& j, const StaticKeyConfig& k) {
    j = nlohmann::json{
        {"key_id", k.key_id}, {"public_key_path", k.public_key_path}, {"algorithm", k.algorithm}};
}

inline void from_json(const nlohmann::json& j, JwksSettings& s) {
    s.url = j.value("url", std::string());
    s.cache_ttl_seconds = j.value("cache_ttl_seconds", 3600u);
    s.timeout_ms = j.value("timeout_ms", 5000u);
    s.refresh_interval_seconds = j.value("refresh_interval_seconds", 0u);
    s.serve_stale_on_error = j.value("serve_stale_on_error", false);
    // Use contains() for complex vector types to avoid infinite recursion
    if (j.contains("static_keys")) {
        j.at("static_keys").get_to(s.static_keys);
    }
    s.static_jwks_path = j.value("static_jwks_path", std::string());
}

inline void to_json(nlohmann::json& j, const JwksSettings& s) {
    j = nlohmann::json{{"url", s.url},
                       {"cache_ttl_seconds", s.cache_ttl_seconds},
                       {"timeout_ms", s.timeout_ms},
                       {"refresh_interval_seconds", s.refresh_interval_seconds},
                       {"serve_stale_on_error", s.serve_stale_on_error},
                       {"static_keys", s.static_keys},
                       {"static_jwks_path", s.static_jwks_path}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("stdout"));
    l.log_requests = j.value("log_requests", true);
    l.exclude_paths = j.value("exclude_paths", std::vector<std::string>());
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"log_requests", l.log_requests},
                       {"exclude_paths", l.exclude_paths},
                       {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get() instead of value() to avoid infinite recursion
    // when default values trigger to_json() -> from_json() cycles
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("identity")) {
        j.at("identity").get_to(c.identity);
    }
    if (j.contains("jwks")) {
        j.at("jwks").get_to(c.jwks);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    c.version = j.value("version", std::string("1.0"));
    if (j.contains("description") && j.at("description").is_string()) {
        c.description = j.at("description").get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{{"version", c.version},
                       {"server", c.server},
                       {"identity", c.identity},
                       {"jwks", c.jwks},
                       {"logging", c.logging}};
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Entra ID v1 token issuer: https://sts.windows.net/{tenant}/
[[nodiscard]] std::string entra_issuer_v1(std::string_view tenant_id);

/// Entra ID v2 token issuer: {authority}/{tenant}/v2.0
[[nodiscard]] std::string entra_issuer_v2(std::string_view authority, std::string_view tenant_id);

/// Entra ID key set: {authority}/{tenant}/discovery/v2.0/keys
[[nodiscard]] std::string entra_jwks_uri(std::string_view authority, std::string_view tenant_id);

/// Application ID URI audience: api://{client_id}
[[nodiscard]] std::string application_id_uri(std::string_view client_id);

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string (no validation, no derived values)
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Override fields from AZURE_TENANT_ID, AZURE_CLIENT_ID and PORT
    static void apply_environment(Config& config);

    /// Fill issuers, audience and JWKS URL from tenant and client IDs where unset
    static void apply_derived_defaults(Config& config);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace tokengate::control
