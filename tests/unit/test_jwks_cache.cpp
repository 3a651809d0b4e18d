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

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "core/jwks_cache.hpp"
#include "test_support.hpp"

using namespace tokengate::core;
using namespace tokengate::testing;
using namespace std::chrono_literals;

namespace {

constexpr const char* JWKS_URL = "https://login.example.com/tenant/discovery/v2.0/keys";

JwksCacheConfig cache_config(uint32_t ttl_seconds = 3600) {
    JwksCacheConfig config;
    config.url = JWKS_URL;
    config.cache_ttl_seconds = ttl_seconds;
    config.timeout_ms = 1000;
    return config;
}

std::string key_set(std::initializer_list<const char*> kids) {
    std::vector<nlohmann::json> keys;
    for (const char* kid : kids) {
        keys.push_back(rsa_jwk(shared_rsa_key(), kid));
    }
    return jwks_document(keys);
}

/// Throws a value that is not a std::exception on its first call, then serves keys
class ThrowingTransport final : public JwksTransport {
public:
    explicit ThrowingTransport(std::string body) : body_(std::move(body)) {}

    TransportResult fetch(const std::string&, std::chrono::milliseconds) override {
        if (calls_.fetch_add(1) == 0) {
            throw 42;
        }
        return TransportResult::success(body_);
    }

    [[nodiscard]] int calls() const { return calls_.load(); }

private:
    std::string body_;
    std::atomic<int> calls_{0};
};

}  // namespace

// ============================================================================
// Snapshot construction
// ============================================================================

TEST_CASE("Building key set snapshots", "[jwks][snapshot]") {
    auto now = std::chrono::steady_clock::now();

    SECTION("Usable keys are indexed by kid") {
        auto result = build_snapshot(key_set({"k1", "k2"}), now, 60s);
        REQUIRE(result);
        REQUIRE(result.snapshot->keys.size() == 2);
        REQUIRE(result.snapshot->find("k1") != nullptr);
        REQUIRE(result.snapshot->find("k3") == nullptr);
        REQUIRE(result.snapshot->expires_at == now + 60s);
        REQUIRE(result.snapshot->is_fresh(now));
        REQUIRE_FALSE(result.snapshot->is_fresh(now + 60s));
    }

    SECTION("First duplicate kid wins") {
        auto doc = jwks_document({rsa_jwk(shared_rsa_key(), "dup"),
                                  ec_jwk(shared_ec_key("P-256"), "dup", "P-256")});
        auto result = build_snapshot(doc, now, 60s);
        REQUIRE(result);
        REQUIRE(result.snapshot->keys.size() == 1);
        REQUIRE(result.snapshot->find("dup")->family == KeyFamily::RSA);
    }

    SECTION("Unusable entries are skipped") {
        auto doc = jwks_document({nlohmann::json{{"kty", "oct"}, {"kid", "hmac"}},
                                  rsa_jwk(shared_rsa_key(), "good")});
        auto result = build_snapshot(doc, now, 60s);
        REQUIRE(result);
        REQUIRE(result.snapshot->keys.size() == 1);
        REQUIRE(result.snapshot->find("good") != nullptr);
    }

    SECTION("No usable keys") {
        auto result = build_snapshot(R"({"keys":[{"kty":"oct","kid":"x"}]})", now, 60s);
        REQUIRE_FALSE(result);
        REQUIRE(result.error == FetchError::NoUsableKeys);

        auto empty = build_snapshot(R"({"keys":[]})", now, 60s);
        REQUIRE(empty.error == FetchError::NoUsableKeys);
    }

    SECTION("Not a key set") {
        auto result = build_snapshot("<html>login</html>", now, 60s);
        REQUIRE_FALSE(result);
        REQUIRE(result.error == FetchError::InvalidKeySet);
    }
}

// ============================================================================
// Cache lookups
// ============================================================================

TEST_CASE("JwksCache lookups", "[jwks][cache]") {
    auto transport = std::make_shared<FakeTransport>(key_set({"k1"}));
    JwksCache cache(cache_config(), transport);

    SECTION("Empty cache fetches on first lookup") {
        REQUIRE(cache.state() == JwksCacheState::Empty);

        auto result = cache.get_key("k1");
        REQUIRE(result);
        REQUIRE(result.key->key_id == "k1");
        REQUIRE(transport->calls() == 1);
        REQUIRE(transport->last_url() == JWKS_URL);
        REQUIRE(cache.state() == JwksCacheState::Fresh);
        REQUIRE(cache.fetch_count() == 1);
        REQUIRE(cache.last_success_timestamp() > 0);
    }

    SECTION("Fresh snapshot answers without fetching") {
        REQUIRE(cache.get_key("k1"));
        REQUIRE(cache.get_key("k1"));
        REQUIRE(cache.get_key("k1"));
        REQUIRE(transport->calls() == 1);
    }

    SECTION("Unknown kid on a fresh snapshot is NotFound without a refetch") {
        REQUIRE(cache.get_key("k1"));

        auto result = cache.get_key("unknown");
        REQUIRE(result.status == KeyLookupStatus::NotFound);
        REQUIRE(transport->calls() == 1);
    }

    SECTION("Fetch failure on an empty cache") {
        transport->set_error(FetchError::Timeout);

        auto result = cache.get_key("k1");
        REQUIRE(result.status == KeyLookupStatus::FetchFailed);
        REQUIRE(result.fetch_error == FetchError::Timeout);
        REQUIRE(cache.state() == JwksCacheState::Degraded);
        REQUIRE(cache.consecutive_failures() == 1);
        REQUIRE(cache.snapshot() == nullptr);
    }

    SECTION("Recovery after a failure") {
        transport->set_error(FetchError::BadStatus);
        REQUIRE(cache.get_key("k1").fetch_error == FetchError::BadStatus);

        transport->set_body(key_set({"k1"}));
        REQUIRE(cache.get_key("k1"));
        REQUIRE(cache.consecutive_failures() == 0);
        REQUIRE(cache.state() == JwksCacheState::Fresh);
    }

    SECTION("Body that is not a key set") {
        transport->set_body("{\"error\":\"throttled\"}");

        auto result = cache.get_key("k1");
        REQUIRE(result.status == KeyLookupStatus::FetchFailed);
        REQUIRE(result.fetch_error == FetchError::InvalidKeySet);
    }
}

TEST_CASE("JwksCache refresh on expiry", "[jwks][cache][rotation]") {
    auto transport = std::make_shared<FakeTransport>(key_set({"k1"}));

    // TTL 0: every snapshot is born stale, so each lookup refreshes
    JwksCache cache(cache_config(0), transport);

    SECTION("Stale snapshot is refreshed") {
        REQUIRE(cache.get_key("k1"));
        REQUIRE(cache.state() == JwksCacheState::Stale);

        REQUIRE(cache.get_key("k1"));
        REQUIRE(transport->calls() == 2);
    }

    SECTION("Rotated key becomes visible and the old key disappears") {
        REQUIRE(cache.get_key("k1"));

        transport->set_body(key_set({"k2"}));
        auto rotated = cache.get_key("k2");
        REQUIRE(rotated);
        REQUIRE(rotated.key->key_id == "k2");

        REQUIRE(cache.get_key("k1").status == KeyLookupStatus::NotFound);
    }

    SECTION("Failure on a stale snapshot is reported by default") {
        REQUIRE(cache.get_key("k1"));

        transport->set_error(FetchError::Unreachable);
        auto result = cache.get_key("k1");
        REQUIRE(result.status == KeyLookupStatus::FetchFailed);
        REQUIRE(result.fetch_error == FetchError::Unreachable);

        // The last good snapshot is kept
        REQUIRE(cache.snapshot() != nullptr);
    }
}

TEST_CASE("JwksCache serves stale keys when configured", "[jwks][cache][stale]") {
    auto transport = std::make_shared<FakeTransport>(key_set({"k1"}));
    auto config = cache_config(0);
    config.serve_stale_on_error = true;
    JwksCache cache(config, transport);

    REQUIRE(cache.get_key("k1"));
    transport->set_error(FetchError::Timeout);

    SECTION("Known kid is served from the expired snapshot") {
        auto result = cache.get_key("k1");
        REQUIRE(result);
        REQUIRE(result.stale);
        REQUIRE(result.key->key_id == "k1");
        REQUIRE(cache.state() == JwksCacheState::Degraded);
    }

    SECTION("Unknown kid still reports the fetch failure") {
        auto result = cache.get_key("other");
        REQUIRE(result.status == KeyLookupStatus::FetchFailed);
        REQUIRE(result.fetch_error == FetchError::Timeout);
    }
}

TEST_CASE("JwksCache single-flight refresh", "[jwks][cache][concurrency]") {
    auto transport = std::make_shared<FakeTransport>(key_set({"k1"}));
    transport->set_delay(200ms);
    JwksCache cache(cache_config(), transport);

    constexpr int THREADS = 16;
    std::atomic<int> found{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    threads.reserve(THREADS);
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            if (cache.get_key("k1")) {
                found.fetch_add(1);
            }
        });
    }

    go = true;
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(found.load() == THREADS);
    REQUIRE(transport->calls() == 1);
    REQUIRE(cache.fetch_count() == 1);
}

TEST_CASE("JwksCache concurrent failure is shared", "[jwks][cache][concurrency]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->set_error(FetchError::Timeout);
    transport->set_delay(200ms);
    JwksCache cache(cache_config(), transport);

    constexpr int THREADS = 8;
    std::atomic<int> timeouts{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&] {
            auto result = cache.get_key("k1");
            if (result.status == KeyLookupStatus::FetchFailed &&
                result.fetch_error == FetchError::Timeout) {
                timeouts.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(timeouts.load() == THREADS);

    // Threads that arrive after a failed fetch start a new one; never one per caller
    REQUIRE(transport->calls() >= 1);
    REQUIRE(transport->calls() < THREADS);
}

TEST_CASE("JwksCache recovers from a transport throwing a non-standard exception",
          "[jwks][cache][errors]") {
    auto transport = std::make_shared<ThrowingTransport>(key_set({"k1"}));
    JwksCache cache(cache_config(), transport);

    auto failed = cache.get_key("k1");
    REQUIRE(failed.status == KeyLookupStatus::FetchFailed);
    REQUIRE(failed.fetch_error == FetchError::Unreachable);

    // The refresh slot was released: the next lookup fetches again and succeeds
    auto found = cache.get_key("k1");
    REQUIRE(found.status == KeyLookupStatus::Found);
    REQUIRE(transport->calls() == 2);
}

TEST_CASE("JwksCache explicit refresh and lifecycle", "[jwks][cache][lifecycle]") {
    auto transport = std::make_shared<FakeTransport>(key_set({"k1"}));

    SECTION("refresh() always fetches") {
        JwksCache cache(cache_config(), transport);
        REQUIRE(cache.refresh());
        REQUIRE(cache.refresh());
        REQUIRE(transport->calls() == 2);
    }

    SECTION("start() warms the cache") {
        JwksCache cache(cache_config(), transport);
        cache.start();
        REQUIRE(transport->calls() == 1);
        REQUIRE(cache.state() == JwksCacheState::Fresh);

        REQUIRE(cache.get_key("k1"));
        REQUIRE(transport->calls() == 1);
        cache.stop();
    }

    SECTION("start() survives a failing provider") {
        transport->set_error(FetchError::Unreachable);
        JwksCache cache(cache_config(), transport);
        cache.start();
        REQUIRE(cache.state() == JwksCacheState::Degraded);

        transport->set_body(key_set({"k1"}));
        REQUIRE(cache.get_key("k1"));
        cache.stop();
    }

    SECTION("Background refresher runs and stops promptly") {
        auto config = cache_config();
        config.refresh_interval_seconds = 1;
        JwksCache cache(config, transport);
        cache.start();

        std::this_thread::sleep_for(1500ms);
        REQUIRE(transport->calls() >= 2);

        auto started = std::chrono::steady_clock::now();
        cache.stop();
        REQUIRE(std::chrono::steady_clock::now() - started < 1s);
    }

    SECTION("stop() without start() is harmless") {
        JwksCache cache(cache_config(), transport);
        cache.stop();
        REQUIRE(transport->calls() == 0);
    }
}

TEST_CASE("JwksCache state names", "[jwks][cache]") {
    REQUIRE(jwks_cache_state_to_string(JwksCacheState::Empty) == "empty");
    REQUIRE(jwks_cache_state_to_string(JwksCacheState::Fresh) == "fresh");
    REQUIRE(jwks_cache_state_to_string(JwksCacheState::Stale) == "stale");
    REQUIRE(jwks_cache_state_to_string(JwksCacheState::Degraded) == "degraded");
}
