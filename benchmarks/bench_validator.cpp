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

// tokengate Validator Benchmark
// Measures per-token validation cost by algorithm and rejection path

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/crypto.hpp"
#include "core/jwks_cache.hpp"
#include "core/jwt.hpp"
#include "test_support.hpp"

using namespace tokengate::core;
using namespace tokengate::testing;

namespace {

constexpr const char* AUDIENCE = "api://00000000-0000-0000-0000-000000000000";
constexpr const char* ISSUER = "https://login.microsoftonline.com/tenant/v2.0";

// Benchmark helper
template <typename Func>
double benchmark(Func&& func, size_t iterations) {
    auto start = std::chrono::high_resolution_clock::now();

    for (size_t i = 0; i < iterations; i++) {
        func();
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    return static_cast<double>(duration.count()) / iterations;
}

nlohmann::json claims() {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    return {{"iss", ISSUER}, {"aud", AUDIENCE}, {"sub", "bench"}, {"iat", now},
            {"exp", now + 3600}};
}

void print_row(const std::string& name, double ns) {
    std::cout << std::setw(28) << name << std::setw(15) << std::fixed << std::setprecision(2)
              << ns / 1000.0 << std::setw(15) << std::fixed << std::setprecision(0)
              << 1e9 / ns << "\n";
}

void print_header(const char* title) {
    std::cout << "\n=== " << title << " ===\n";
    std::cout << std::setw(28) << "Case" << std::setw(15) << "us/token" << std::setw(15)
              << "tokens/s" << "\n";
    std::cout << std::string(58, '-') << "\n";
}

}  // namespace

int main() {
    std::cout << "tokengate Validator Benchmark\n";
    std::cout << "=============================\n";

    initialize_openssl();

    auto rsa = generate_rsa_key();
    auto p256 = generate_ec_key("P-256");
    auto p384 = generate_ec_key("P-384");

    auto keys = std::make_shared<StaticKeySource>();
    keys->add_jwks(jwks_document({rsa_jwk(rsa.get(), "rsa"), ec_jwk(p256.get(), "p256", "P-256"),
                                  ec_jwk(p384.get(), "p384", "P-384")}));

    TrustPolicy policy;
    policy.expected_issuers = {ISSUER};
    policy.expected_audience = AUDIENCE;
    policy.allowed_algorithms = {JwtAlgorithm::RS256, JwtAlgorithm::PS256, JwtAlgorithm::ES256,
                                 JwtAlgorithm::ES384};
    policy.clock_skew = std::chrono::seconds(60);
    JwtValidator validator(policy, keys);

    struct Case {
        std::string name;
        std::string token;
        size_t iterations;
    };

    std::vector<Case> accepted = {
        {"RS256", sign_token(make_header("RS256", "rsa"), claims(), rsa.get(), JwtAlgorithm::RS256),
         20000},
        {"PS256", sign_token(make_header("PS256", "rsa"), claims(), rsa.get(), JwtAlgorithm::PS256),
         20000},
        {"ES256",
         sign_token(make_header("ES256", "p256"), claims(), p256.get(), JwtAlgorithm::ES256),
         10000},
        {"ES384",
         sign_token(make_header("ES384", "p384"), claims(), p384.get(), JwtAlgorithm::ES384),
         5000},
    };

    print_header("Accepted tokens");
    for (const auto& c : accepted) {
        double ns = benchmark([&]() {
            volatile bool ok = static_cast<bool>(validator.validate(c.token));
            (void)ok;
        }, c.iterations);
        print_row(c.name, ns);
    }

    std::string good = accepted[0].token;
    std::string tampered = good;
    tampered[tampered.size() - 5] = tampered[tampered.size() - 5] == 'A' ? 'B' : 'A';

    std::vector<Case> rejected = {
        {"malformed", "not-a-token", 1000000},
        {"alg none", encode_segment(make_header("none", "rsa")) + "." +
                         encode_segment(claims()) + ".",
         500000},
        {"unknown kid",
         sign_token(make_header("RS256", "other"), claims(), rsa.get(), JwtAlgorithm::RS256),
         500000},
        {"bad signature", tampered, 20000},
    };

    print_header("Rejected tokens");
    for (const auto& c : rejected) {
        double ns = benchmark([&]() {
            volatile bool ok = static_cast<bool>(validator.validate(c.token));
            (void)ok;
        }, c.iterations);
        print_row(c.name, ns);
    }

    // Fresh snapshot lookup (no network after the first fetch)
    auto transport = std::make_shared<FakeTransport>(jwks_document({rsa_jwk(rsa.get(), "rsa")}));
    JwksCacheConfig cache_config;
    cache_config.url = "https://login.example.com/keys";
    JwksCache cache(cache_config, transport);
    (void)cache.refresh();

    print_header("Key lookup");
    double ns = benchmark([&]() {
        volatile bool found = static_cast<bool>(cache.get_key("rsa"));
        (void)found;
    }, 1000000);
    print_row("JwksCache fresh hit", ns);

    std::cout << "\n";
    return 0;
}
