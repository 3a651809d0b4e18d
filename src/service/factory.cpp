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

// tokengate Component Factory - Implementation

#include "factory.hpp"

#include <fstream>
#include <sstream>

#include "../core/logging.hpp"

namespace tokengate::service {

core::TrustPolicy build_trust_policy(const control::Config& config) {
    const auto& identity = config.identity;

    core::TrustPolicy policy;
    policy.expected_issuers = identity.issuers;
    policy.expected_audience = identity.audience;
    policy.clock_skew = std::chrono::seconds(identity.clock_skew_seconds);

    for (const auto& name : identity.allowed_algorithms) {
        auto alg = core::parse_algorithm(name);
        if (!alg || *alg == core::JwtAlgorithm::None) {
            continue;  // Rejected by ConfigLoader::validate
        }
        policy.allowed_algorithms.push_back(*alg);
    }

    return policy;
}

std::shared_ptr<core::StaticKeySource> build_static_key_source(const control::Config& config) {
    if (!config.uses_static_keys()) {
        return nullptr;
    }

    auto* logger = logging::get_logger();
    auto keys = std::make_shared<core::StaticKeySource>();

    for (const auto& key_config : config.jwks.static_keys) {
        std::optional<core::JwtAlgorithm> alg;
        if (!key_config.algorithm.empty()) {
            alg = core::parse_algorithm(key_config.algorithm);
            if (!alg || *alg == core::JwtAlgorithm::None) {
                continue;  // Rejected by ConfigLoader::validate
            }
        }

        auto key = core::SigningKey::from_pem_file(key_config.key_id, key_config.public_key_path,
                                                   alg);
        if (!key) {
            if (logger) {
                LOG_ERROR(logger, "Failed to load static key: kid={}, path={}",
                          key_config.key_id, key_config.public_key_path);
            }
            continue;
        }

        if (!keys->add_key(std::move(*key)) && logger) {
            LOG_WARNING(logger, "Duplicate static key ignored: kid={}", key_config.key_id);
        }
    }

    if (!config.jwks.static_jwks_path.empty()) {
        std::ifstream file{config.jwks.static_jwks_path};
        if (!file.is_open()) {
            if (logger) {
                LOG_ERROR(logger, "Cannot open static JWKS file: path={}",
                          config.jwks.static_jwks_path);
            }
        } else {
            std::stringstream buffer;
            buffer << file.rdbuf();
            size_t added = keys->add_jwks(buffer.str());
            if (logger) {
                LOG_INFO(logger, "Loaded static JWKS: path={}, keys={}",
                         config.jwks.static_jwks_path, added);
            }
        }
    }

    if (keys->key_count() == 0) {
        return nullptr;
    }
    return keys;
}

std::shared_ptr<core::JwksCache> build_jwks_cache(const control::Config& config,
                                                  std::shared_ptr<core::JwksTransport> transport) {
    if (config.jwks.url.empty()) {
        return nullptr;
    }

    // Convert JwksSettings to JwksCacheConfig
    core::JwksCacheConfig cache_config;
    cache_config.url = config.jwks.url;
    cache_config.cache_ttl_seconds = config.jwks.cache_ttl_seconds;
    cache_config.timeout_ms = config.jwks.timeout_ms;
    cache_config.refresh_interval_seconds = config.jwks.refresh_interval_seconds;
    cache_config.serve_stale_on_error = config.jwks.serve_stale_on_error;

    if (!transport) {
        transport = std::make_shared<core::HttpJwksTransport>();
    }

    return std::make_shared<core::JwksCache>(std::move(cache_config), std::move(transport));
}

std::shared_ptr<core::JwtValidator> build_jwt_validator(const control::Config& config,
                                                        std::shared_ptr<core::KeySource> keys) {
    if (!keys) {
        return nullptr;
    }
    return std::make_shared<core::JwtValidator>(build_trust_policy(config), std::move(keys));
}

}  // namespace tokengate::service
