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

// tokengate JWKS Transport - Header
// Retrieve a key set document from the identity provider's discovery endpoint

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "key_source.hpp"

namespace tokengate::core {

/// Largest key set document accepted from the network (1 MiB)
constexpr size_t MAX_JWKS_BODY_SIZE = 1024 * 1024;

/// Raw fetch outcome (body on success, typed error otherwise)
struct TransportResult {
    bool ok = false;
    std::string body;
    FetchError error = FetchError::Unreachable;
    int http_status = 0;  // 0 when no response was received

    [[nodiscard]] static TransportResult success(std::string body, int status = 200) {
        return {true, std::move(body), FetchError::Unreachable, status};
    }

    [[nodiscard]] static TransportResult failure(FetchError error, int status = 0) {
        return {false, {}, error, status};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return ok; }
};

/// Transport seam used by JwksCache (replaced by a fake in tests)
class JwksTransport {
public:
    virtual ~JwksTransport() = default;

    /// Blocking GET of url. Must return within roughly timeout, whatever the peer does.
    [[nodiscard]] virtual TransportResult fetch(const std::string& url,
                                                std::chrono::milliseconds timeout) = 0;
};

/// cpp-httplib backed transport (HTTPS via OpenSSL)
class HttpJwksTransport final : public JwksTransport {
public:
    HttpJwksTransport() = default;

    [[nodiscard]] TransportResult fetch(const std::string& url,
                                        std::chrono::milliseconds timeout) override;

    /// Split "scheme://host[:port]/path" into base URL and path ("/" if absent).
    /// Returns false when url has no scheme or host.
    [[nodiscard]] static bool split_url(const std::string& url, std::string& base,
                                        std::string& path);
};

}  // namespace tokengate::core
