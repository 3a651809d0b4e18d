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

// tokengate Unit Tests - Main Entry Point
#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include "control/config.hpp"
#include "core/crypto.hpp"
#include "core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        tokengate::core::initialize_openssl();

        // Initialize logging system for tests
        tokengate::logging::init_logging_system();

        // Rejection warnings go to a file, not the test console
        tokengate::control::LogConfig log_config;
        log_config.output = "/tmp/tokengate_tests";
        log_config.level = "debug";
        tokengate::logging::init_logger(log_config);
    }

    ~GlobalSetup() {
        // Cleanup logging system
        tokengate::logging::shutdown_logging();
    }
};

// Create global instance to run setup/teardown
static GlobalSetup g_setup;

int main(int argc, char* argv[]) {
    return Catch::Session().run(argc, argv);
}

TEST_CASE("Basic sanity test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}
