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

// tokengate Backend Service - Header
// Bearer-protected HTTP API (health, protected resource, token introspection)

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "../control/config.hpp"
#include "../core/jwks_cache.hpp"
#include "../core/jwt.hpp"

namespace tokengate::service {

/// Generic 401 body; the typed reason goes to the log only
inline constexpr std::string_view UNAUTHORIZED_BODY =
    R"({"error":"unauthorized","message":"Authentication required"})";

/// Placeholder for absent user claims
inline constexpr std::string_view NOT_AVAILABLE = "N/A";

/// Extract the token from an Authorization header value ("Bearer <token>",
/// scheme case-insensitive). nullopt if the header is not a bearer credential.
[[nodiscard]] std::optional<std::string_view> extract_bearer_token(std::string_view header);

/// HTTP status for a token rejection. Authentication failures are always 401;
/// 403 belongs to authorization decisions made above this service.
[[nodiscard]] int status_for(core::ValidationError error) noexcept;

/// ISO-8601 UTC timestamp with a trailing Z (microseconds shown when non-zero)
[[nodiscard]] std::string format_iso8601(core::NumericDate time);

/// Authentication outcome for one request
struct AuthOutcome {
    bool authenticated = false;
    int status = 401;  // Response status when not authenticated
    core::VerifiedClaims claims;
    std::string reason;  // Typed rejection reason (for logs)
    std::string detail;

    [[nodiscard]] explicit operator bool() const noexcept { return authenticated; }
};

/// Response payload builders
[[nodiscard]] nlohmann::json protected_payload(const core::VerifiedClaims& claims,
                                               core::NumericDate now);
[[nodiscard]] nlohmann::json token_info_payload(const core::VerifiedClaims& claims);

/// Protected backend HTTP service (cpp-httplib)
class BackendService {
public:
    /// jwks_cache is optional and only used for health reporting
    BackendService(control::Config config, std::shared_ptr<core::JwtValidator> validator,
                   std::shared_ptr<core::JwksCache> jwks_cache = nullptr);
    ~BackendService();

    // Non-copyable, non-movable (routes capture this)
    BackendService(const BackendService&) = delete;
    BackendService& operator=(const BackendService&) = delete;
    BackendService(BackendService&&) = delete;
    BackendService& operator=(BackendService&&) = delete;

    /// Listen on the configured address and port (blocks until stop())
    [[nodiscard]] bool listen();

    /// Bind to an ephemeral port; returns the port or -1
    [[nodiscard]] int bind_to_any_port(const std::string& host);

    /// Serve on a socket bound by bind_to_any_port (blocks until stop())
    [[nodiscard]] bool listen_after_bind();

    void stop();

    /// Stop a listener that may not have entered listen() yet: stop() is repeated
    /// until the listening thread reports it has returned
    void stop_until_exited(const std::atomic<bool>& listener_exited);

    void wait_until_ready() const;
    [[nodiscard]] bool is_running() const;

    /// Validate the Authorization header of a request
    [[nodiscard]] AuthOutcome authenticate(const httplib::Request& req) const;

    /// Health payload for GET /
    [[nodiscard]] nlohmann::json health_payload() const;

private:
    using Handler = std::function<void(const httplib::Request&, httplib::Response&,
                                       const core::VerifiedClaims&, const std::string&)>;

    void register_routes();

    /// Wrap a handler with correlation ID, request logging and (optionally) authentication
    [[nodiscard]] httplib::Server::Handler wrap(bool requires_auth, Handler handler) const;

    void send_unauthorized(httplib::Response& res, int status) const;

    [[nodiscard]] bool should_log(const std::string& path) const;

    control::Config config_;
    std::shared_ptr<core::JwtValidator> validator_;
    std::shared_ptr<core::JwksCache> jwks_cache_;
    httplib::Server server_;
};

}  // namespace tokengate::service
