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

// tokengate Key Sources - Header
// Resolve verification keys by key ID (dynamic JWKS cache or static keys)

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "containers.hpp"
#include "signing_key.hpp"

namespace tokengate::core {

/// Why a key set could not be obtained
enum class FetchError {
    Timeout,        // Provider did not answer within the configured timeout
    Unreachable,    // Connection or TLS failure
    BadStatus,      // Non-200 HTTP response
    InvalidKeySet,  // Body is not a JWKS document (or is oversized)
    NoUsableKeys    // JWKS parsed but no key could be converted
};

[[nodiscard]] std::string_view fetch_error_to_string(FetchError error) noexcept;

/// Outcome of a key lookup
enum class KeyLookupStatus {
    Found,
    NotFound,
    FetchFailed
};

struct KeyLookupResult {
    KeyLookupStatus status = KeyLookupStatus::NotFound;
    std::shared_ptr<const SigningKey> key;  // Set only when Found
    FetchError fetch_error = FetchError::Unreachable;  // Meaningful only when FetchFailed
    bool stale = false;  // Served from an expired snapshot (degraded mode)

    [[nodiscard]] static KeyLookupResult found(std::shared_ptr<const SigningKey> key,
                                               bool stale = false) {
        return {KeyLookupStatus::Found, std::move(key), FetchError::Unreachable, stale};
    }

    [[nodiscard]] static KeyLookupResult not_found() { return {}; }

    [[nodiscard]] static KeyLookupResult fetch_failed(FetchError error) {
        return {KeyLookupStatus::FetchFailed, nullptr, error, false};
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return status == KeyLookupStatus::Found;
    }
};

/// Key index shared by snapshots and static sources (kid -> immutable key)
using KeyIndex = fast_map<std::string, std::shared_ptr<const SigningKey>>;

/// Source of verification keys (injected into JwtValidator)
class KeySource {
public:
    virtual ~KeySource() = default;

    /// Resolve a key by its identifier. Must be safe to call concurrently.
    [[nodiscard]] virtual KeyLookupResult get_key(std::string_view key_id) = 0;
};

/// Fixed key set loaded once at startup (PEM files or an inline JWKS document)
class StaticKeySource final : public KeySource {
public:
    StaticKeySource() = default;
    ~StaticKeySource() override = default;

    // Non-copyable
    StaticKeySource(const StaticKeySource&) = delete;
    StaticKeySource& operator=(const StaticKeySource&) = delete;

    /// Add a key; returns false if the key ID is already present
    bool add_key(SigningKey key);

    /// Add every usable key of a JWKS document; returns the number added
    size_t add_jwks(std::string_view jwks_json);

    [[nodiscard]] KeyLookupResult get_key(std::string_view key_id) override;

    [[nodiscard]] size_t key_count() const noexcept { return keys_.size(); }

private:
    // Keys are added during setup only, before any concurrent lookup
    KeyIndex keys_;
};

}  // namespace tokengate::core
