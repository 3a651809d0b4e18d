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

// tokengate JWKS Cache - Implementation

#include "jwks_cache.hpp"

#include <ctime>
#include <exception>

#include "logging.hpp"

namespace tokengate::core {

std::string_view jwks_cache_state_to_string(JwksCacheState state) noexcept {
    switch (state) {
        case JwksCacheState::Empty:
            return "empty";
        case JwksCacheState::Fresh:
            return "fresh";
        case JwksCacheState::Stale:
            return "stale";
        case JwksCacheState::Degraded:
            return "degraded";
    }
    return "unknown";
}

std::shared_ptr<const SigningKey> KeySetSnapshot::find(std::string_view key_id) const {
    auto it = keys.find(std::string(key_id));
    if (it == keys.end()) {
        return nullptr;
    }
    return it->second;
}

RefreshResult build_snapshot(std::string_view jwks_json,
                             std::chrono::steady_clock::time_point fetched_at,
                             std::chrono::seconds ttl) {
    auto* logger = logging::get_logger();

    auto jwks = parse_jwks(jwks_json);
    if (!jwks) {
        return RefreshResult::failure(FetchError::InvalidKeySet);
    }

    auto snapshot = std::make_shared<KeySetSnapshot>();
    snapshot->fetched_at = fetched_at;
    snapshot->expires_at = fetched_at + ttl;
    snapshot->keys.reserve(jwks->size());

    for (const auto& jwk : *jwks) {
        std::string reason;
        auto key = SigningKey::from_jwk(jwk, &reason);
        if (!key) {
            if (logger) {
                LOG_WARNING(logger, "Skipping JWK: kid={}, kty={}, reason={}", jwk.kid, jwk.kty,
                            reason);
            }
            continue;
        }

        // First occurrence of a key ID wins
        if (snapshot->keys.contains(key->key_id)) {
            if (logger) {
                LOG_WARNING(logger, "Duplicate JWK kid ignored: kid={}", key->key_id);
            }
            continue;
        }

        std::string kid = key->key_id;
        snapshot->keys.emplace(std::move(kid),
                               std::make_shared<const SigningKey>(std::move(*key)));
    }

    if (snapshot->keys.empty()) {
        return RefreshResult::failure(FetchError::NoUsableKeys);
    }

    return RefreshResult::success(std::move(snapshot));
}

// JwksCache implementation

JwksCache::JwksCache(JwksCacheConfig config, std::shared_ptr<JwksTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

JwksCache::~JwksCache() {
    stop();
}

KeyLookupResult JwksCache::get_key(std::string_view key_id) {
    auto current = snapshot_.load();

    if (current && current->is_fresh(std::chrono::steady_clock::now())) {
        // Fresh snapshot is authoritative: an unknown kid never triggers a fetch
        auto key = current->find(key_id);
        return key ? KeyLookupResult::found(std::move(key)) : KeyLookupResult::not_found();
    }

    auto result = refresh_if_current(current);
    if (result) {
        auto key = result.snapshot->find(key_id);
        return key ? KeyLookupResult::found(std::move(key)) : KeyLookupResult::not_found();
    }

    if (config_.serve_stale_on_error) {
        if (auto fallback = snapshot_.load()) {
            if (auto key = fallback->find(key_id)) {
                if (auto* logger = logging::get_logger()) {
                    LOG_WARNING(logger, "Serving stale JWKS key: kid={}, fetch_error={}", key_id,
                                fetch_error_to_string(result.error));
                }
                return KeyLookupResult::found(std::move(key), true);
            }
        }
    }

    return KeyLookupResult::fetch_failed(result.error);
}

RefreshResult JwksCache::refresh() {
    std::unique_lock lock(refresh_mutex_);
    return join_or_fetch(lock);
}

RefreshResult JwksCache::refresh_if_current(
    const std::shared_ptr<const KeySetSnapshot>& observed) {
    std::unique_lock lock(refresh_mutex_);

    if (!in_flight_.valid()) {
        // Another caller completed a refresh after we looked: reuse it
        auto current = snapshot_.load();
        if (current && current != observed) {
            return RefreshResult::success(std::move(current));
        }
    }

    return join_or_fetch(lock);
}

RefreshResult JwksCache::join_or_fetch(std::unique_lock<std::mutex>& lock) {
    if (in_flight_.valid()) {
        auto pending = in_flight_;
        lock.unlock();
        return pending.get();
    }

    std::promise<RefreshResult> promise;
    in_flight_ = promise.get_future().share();
    lock.unlock();

    RefreshResult result;
    try {
        result = fetch_snapshot();
    } catch (const std::exception& e) {
        if (auto* logger = logging::get_logger()) {
            LOG_ERROR(logger, "JWKS refresh raised: url={}, error={}", config_.url, e.what());
        }
        consecutive_failures_.fetch_add(1);
        result = RefreshResult::failure(FetchError::Unreachable);
    } catch (...) {
        // Joined callers wait on this promise; it must be fulfilled whatever was thrown
        if (auto* logger = logging::get_logger()) {
            LOG_ERROR(logger, "JWKS refresh raised a non-standard exception: url={}", config_.url);
        }
        consecutive_failures_.fetch_add(1);
        result = RefreshResult::failure(FetchError::Unreachable);
    }

    // Snapshot is already published; later callers see it instead of a finished future
    lock.lock();
    in_flight_ = {};
    lock.unlock();

    promise.set_value(result);
    return result;
}

RefreshResult JwksCache::fetch_snapshot() {
    fetch_count_.fetch_add(1);
    auto* logger = logging::get_logger();

    auto response = transport_->fetch(config_.url, std::chrono::milliseconds(config_.timeout_ms));
    if (!response) {
        auto failures = consecutive_failures_.fetch_add(1) + 1;
        if (logger) {
            LOG_WARNING(logger,
                        "JWKS fetch failed: url={}, error={}, http_status={}, "
                        "consecutive_failures={}",
                        config_.url, fetch_error_to_string(response.error), response.http_status,
                        failures);
        }
        return RefreshResult::failure(response.error);
    }

    auto result = build_snapshot(response.body, std::chrono::steady_clock::now(),
                                 std::chrono::seconds(config_.cache_ttl_seconds));
    if (!result) {
        auto failures = consecutive_failures_.fetch_add(1) + 1;
        if (logger) {
            LOG_WARNING(logger, "JWKS rejected: url={}, error={}, consecutive_failures={}",
                        config_.url, fetch_error_to_string(result.error), failures);
        }
        return result;
    }

    // RCU: Atomic pointer swap
    snapshot_.store(result.snapshot);

    consecutive_failures_.store(0);
    last_success_ts_.store(static_cast<uint64_t>(std::time(nullptr)));

    if (logger) {
        LOG_INFO(logger, "JWKS refreshed: url={}, keys={}, ttl_seconds={}", config_.url,
                 result.snapshot->keys.size(), config_.cache_ttl_seconds);
    }
    return result;
}

void JwksCache::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    // Fetch keys immediately on start; a failure here is retried on first use
    auto warm = refresh();
    if (!warm) {
        if (auto* logger = logging::get_logger()) {
            LOG_WARNING(logger, "JWKS warm-up failed: url={}, error={}", config_.url,
                        fetch_error_to_string(warm.error));
        }
    }

    if (config_.refresh_interval_seconds > 0) {
        refresh_thread_ = std::make_unique<std::thread>(&JwksCache::refresh_loop, this);
    }
}

void JwksCache::stop() {
    if (!running_.exchange(false)) {
        return;  // Not running
    }

    {
        std::lock_guard lock(stop_mutex_);
    }
    stop_cv_.notify_all();

    if (refresh_thread_ && refresh_thread_->joinable()) {
        refresh_thread_->join();
    }
    refresh_thread_.reset();
}

void JwksCache::refresh_loop() {
    const auto interval = std::chrono::seconds(config_.refresh_interval_seconds);

    while (running_) {
        {
            std::unique_lock lock(stop_mutex_);
            if (stop_cv_.wait_for(lock, interval, [this] { return !running_.load(); })) {
                break;
            }
        }

        // Failures are logged by fetch_snapshot; the current snapshot stays in use
        refresh();
    }
}

JwksCacheState JwksCache::state() const {
    if (consecutive_failures_.load() > 0) {
        return JwksCacheState::Degraded;
    }
    auto current = snapshot_.load();
    if (!current) {
        return JwksCacheState::Empty;
    }
    return current->is_fresh(std::chrono::steady_clock::now()) ? JwksCacheState::Fresh
                                                                : JwksCacheState::Stale;
}

}  // namespace tokengate::core
