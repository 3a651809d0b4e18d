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

// tokengate JWKS Cache - Header
// Fetch, cache and rotate the identity provider's signing keys

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "jwks_transport.hpp"
#include "key_source.hpp"

namespace tokengate::core {

/// JWKS cache configuration
struct JwksCacheConfig {
    std::string url;                          // JWKS endpoint URL
    uint32_t cache_ttl_seconds = 3600;        // Snapshot lifetime (1 hour)
    uint32_t timeout_ms = 5000;               // Bound on a single fetch
    uint32_t refresh_interval_seconds = 0;    // Background refresh period, 0 = disabled
    bool serve_stale_on_error = false;        // Serve expired keys when the provider is down
};

/// Cache state, for health reporting
enum class JwksCacheState {
    Empty,     // No key set fetched yet
    Fresh,     // Snapshot within its TTL
    Stale,     // Snapshot expired, next lookup refreshes
    Degraded   // Last refresh failed
};

[[nodiscard]] std::string_view jwks_cache_state_to_string(JwksCacheState state) noexcept;

/// Immutable key set held by the cache. Replaced as a whole, never mutated.
struct KeySetSnapshot {
    KeyIndex keys;
    std::chrono::steady_clock::time_point fetched_at;
    std::chrono::steady_clock::time_point expires_at;

    [[nodiscard]] bool is_fresh(std::chrono::steady_clock::time_point now) const noexcept {
        return now < expires_at;
    }

    [[nodiscard]] std::shared_ptr<const SigningKey> find(std::string_view key_id) const;
};

/// Outcome of a refresh (shared by every caller that joined the same fetch)
struct RefreshResult {
    std::shared_ptr<const KeySetSnapshot> snapshot;  // Set on success
    FetchError error = FetchError::Unreachable;

    [[nodiscard]] static RefreshResult success(std::shared_ptr<const KeySetSnapshot> snapshot) {
        return {std::move(snapshot), FetchError::Unreachable};
    }

    [[nodiscard]] static RefreshResult failure(FetchError error) { return {nullptr, error}; }

    [[nodiscard]] explicit operator bool() const noexcept { return snapshot != nullptr; }
};

/// Build a snapshot from a JWKS document. Unusable entries and duplicate key
/// IDs are skipped with a warning.
[[nodiscard]] RefreshResult build_snapshot(std::string_view jwks_json,
                                           std::chrono::steady_clock::time_point fetched_at,
                                           std::chrono::seconds ttl);

/// Caching key source backed by a JWKS endpoint.
///
/// Lookups read an atomically swapped snapshot and never block on each other.
/// A stale or missing snapshot triggers a refresh; concurrent refreshes
/// collapse into a single in-flight fetch whose outcome every caller shares.
class JwksCache final : public KeySource {
public:
    JwksCache(JwksCacheConfig config, std::shared_ptr<JwksTransport> transport);
    ~JwksCache() override;

    // Non-copyable, non-movable (owns thread)
    JwksCache(const JwksCache&) = delete;
    JwksCache& operator=(const JwksCache&) = delete;
    JwksCache(JwksCache&&) = delete;
    JwksCache& operator=(JwksCache&&) = delete;

    [[nodiscard]] KeyLookupResult get_key(std::string_view key_id) override;

    /// Force a fetch. Joins a fetch already in flight instead of starting a second one.
    RefreshResult refresh();

    /// Warm the cache and, if refresh_interval_seconds > 0, start the background refresher
    void start();

    /// Stop the background refresher (joins the thread)
    void stop();

    /// Current snapshot (nullptr before the first successful fetch)
    [[nodiscard]] std::shared_ptr<const KeySetSnapshot> snapshot() const { return snapshot_.load(); }

    /// State monitoring
    [[nodiscard]] JwksCacheState state() const;
    [[nodiscard]] uint64_t fetch_count() const noexcept { return fetch_count_.load(); }
    [[nodiscard]] uint32_t consecutive_failures() const noexcept {
        return consecutive_failures_.load();
    }
    [[nodiscard]] uint64_t last_success_timestamp() const noexcept {
        return last_success_ts_.load();
    }

    [[nodiscard]] const JwksCacheConfig& config() const noexcept { return config_; }

private:
    /// Refresh unless the snapshot has already moved past observed
    RefreshResult refresh_if_current(const std::shared_ptr<const KeySetSnapshot>& observed);

    /// Join or lead a fetch (caller holds refresh_mutex_ via lock)
    RefreshResult join_or_fetch(std::unique_lock<std::mutex>& lock);

    /// Network fetch + parse (runs on the leading caller's thread)
    RefreshResult fetch_snapshot();

    /// Background thread loop
    void refresh_loop();

    JwksCacheConfig config_;
    std::shared_ptr<JwksTransport> transport_;

    // RCU pattern: atomic pointer swap for rotation
    std::atomic<std::shared_ptr<const KeySetSnapshot>> snapshot_;

    // Single-flight: valid() while a fetch is running
    std::mutex refresh_mutex_;
    std::shared_future<RefreshResult> in_flight_;

    // State tracking
    std::atomic<uint64_t> fetch_count_{0};
    std::atomic<uint32_t> consecutive_failures_{0};
    std::atomic<uint64_t> last_success_ts_{0};

    // Background thread
    std::unique_ptr<std::thread> refresh_thread_;
    std::atomic<bool> running_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
};

}  // namespace tokengate::core
