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

// tokengate - Main Entry Point
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include "control/config.hpp"
#include "core/crypto.hpp"
#include "core/logging.hpp"
#include "service/backend_service.hpp"
#include "service/factory.hpp"

namespace {
std::atomic<bool> g_server_running{true};
}  // namespace

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_server_running = false;
    }
}

int main(int argc, char* argv[]) {
    printf("tokengate v0.1.0\n");
    printf("Bearer token validation service\n\n");

    // Initialize OpenSSL
    tokengate::core::initialize_openssl();

    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            fprintf(stderr, "Usage: %s [--config <config.json>]\n", argv[0]);
            return EXIT_FAILURE;
        }
    }

    // Configuration file is optional: environment variables alone are enough
    tokengate::control::Config config;
    if (!config_path.empty()) {
        printf("Loading configuration from %s...\n", config_path.c_str());
        auto loaded = tokengate::control::ConfigLoader::load_from_file(config_path);
        if (!loaded) {
            fprintf(stderr, "Failed to load configuration\n");
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }
    tokengate::control::ConfigLoader::apply_environment(config);
    tokengate::control::ConfigLoader::apply_derived_defaults(config);

    auto validation = tokengate::control::ConfigLoader::validate(config);
    if (!validation.warnings.empty()) {
        printf("Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            printf("  - %s\n", warning.c_str());
        }
    }
    if (validation.has_errors()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
        return EXIT_FAILURE;
    }

    tokengate::logging::init_logging_system();
    auto* logger = tokengate::logging::init_logger(config.logging);

    LOG_INFO(logger, "Starting tokengate: tenant_id={}, client_id={}, audience={}",
             config.identity.tenant_id, config.identity.client_id, config.identity.audience);
    for (const auto& issuer : config.identity.issuers) {
        LOG_INFO(logger, "Accepted issuer: {}", issuer);
    }

    // Build key source: static keys when configured, otherwise the JWKS cache
    std::shared_ptr<tokengate::core::KeySource> keys;
    std::shared_ptr<tokengate::core::JwksCache> jwks_cache;

    if (config.uses_static_keys()) {
        keys = tokengate::service::build_static_key_source(config);
        if (!keys) {
            LOG_ERROR(logger, "No static key could be loaded");
            tokengate::logging::shutdown_logging();
            return EXIT_FAILURE;
        }
    } else {
        LOG_INFO(logger, "JWKS URI: {}", config.jwks.url);
        jwks_cache = tokengate::service::build_jwks_cache(config);
        jwks_cache->start();
        keys = jwks_cache;
    }

    auto validator = tokengate::service::build_jwt_validator(config, keys);
    tokengate::service::BackendService service(config, validator, jwks_cache);

    // Install signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal

    printf("Listening on %s:%u\n", config.server.listen_address.c_str(),
           static_cast<unsigned>(config.server.listen_port));

    std::atomic<bool> listen_ok{true};
    std::atomic<bool> listen_returned{false};
    std::thread server_thread([&] {
        listen_ok = service.listen();
        listen_returned = true;
    });

    // Server runs until a signal arrives or the listener fails
    while (g_server_running && listen_ok) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // A signal can arrive before the listener is up
    service.stop_until_exited(listen_returned);
    server_thread.join();

    if (jwks_cache) {
        jwks_cache->stop();
    }

    if (!listen_ok) {
        LOG_ERROR(logger, "Failed to listen on {}:{}", config.server.listen_address,
                  config.server.listen_port);
        tokengate::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    LOG_INFO(logger, "tokengate stopped");
    tokengate::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
