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

// tokengate Backend Service - Implementation

#include "backend_service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <thread>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "../core/logging.hpp"

namespace tokengate::service {

namespace {

constexpr const char* JSON_CONTENT_TYPE = "application/json";
constexpr const char* CORRELATION_HEADER = "X-Correlation-ID";

bool is_space(char c) {
    return c == ' ' || c == '\t';
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

core::NumericDate now_utc() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

nlohmann::json string_claim_or_na(const nlohmann::json& raw, const char* name) {
    auto it = raw.find(name);
    if (it != raw.end() && it->is_string()) {
        return *it;
    }
    return std::string(NOT_AVAILABLE);
}

}  // namespace

std::optional<std::string_view> extract_bearer_token(std::string_view header) {
    // Trim surrounding whitespace
    while (!header.empty() && is_space(header.front())) {
        header.remove_prefix(1);
    }
    while (!header.empty() && is_space(header.back())) {
        header.remove_suffix(1);
    }

    // Exactly two whitespace-separated parts: scheme and credential
    auto scheme_end = std::find_if(header.begin(), header.end(), is_space);
    if (scheme_end == header.end()) {
        return std::nullopt;
    }
    std::string_view scheme = header.substr(0, static_cast<size_t>(scheme_end - header.begin()));

    std::string_view rest = header.substr(scheme.size());
    while (!rest.empty() && is_space(rest.front())) {
        rest.remove_prefix(1);
    }
    if (rest.empty() || std::any_of(rest.begin(), rest.end(), is_space)) {
        return std::nullopt;
    }

    if (!iequals(scheme, "bearer")) {
        return std::nullopt;
    }
    return rest;
}

int status_for(core::ValidationError error) noexcept {
    switch (error) {
        case core::ValidationError::Malformed:
        case core::ValidationError::AlgorithmRejected:
        case core::ValidationError::KeyUnresolvable:
        case core::ValidationError::SignatureInvalid:
        case core::ValidationError::IssuerRejected:
        case core::ValidationError::AudienceRejected:
        case core::ValidationError::Expired:
        case core::ValidationError::NotYetValid:
            return 401;
    }
    return 401;
}

std::string format_iso8601(core::NumericDate time) {
    auto seconds = std::chrono::floor<std::chrono::seconds>(time);
    auto micros = (time - seconds).count();

    std::time_t epoch = static_cast<std::time_t>(seconds.time_since_epoch().count());
    std::tm utc{};
    gmtime_r(&epoch, &utc);

    std::string out = fmt::format("{:%Y-%m-%dT%H:%M:%S}", utc);
    if (micros != 0) {
        out += fmt::format(".{:06}", micros);
    }
    out += 'Z';
    return out;
}

nlohmann::json protected_payload(const core::VerifiedClaims& claims, core::NumericDate now) {
    auto aud = claims.raw.find("aud");

    nlohmann::json token_info = {
        {"issuer", claims.issuer},
        {"audience", aud != claims.raw.end() ? *aud : nlohmann::json(claims.audience)},
        {"issued_at", claims.issued_at ? nlohmann::json(format_iso8601(*claims.issued_at))
                                       : nlohmann::json(nullptr)},
        {"expires_at", format_iso8601(claims.expires_at)}};

    return {{"message", "Successfully accessed protected resource"},
            {"timestamp", format_iso8601(now)},
            {"user",
             {{"upn", string_claim_or_na(claims.raw, "upn")},
              {"name", string_claim_or_na(claims.raw, "name")},
              {"oid", string_claim_or_na(claims.raw, "oid")}}},
            {"token_info", std::move(token_info)}};
}

nlohmann::json token_info_payload(const core::VerifiedClaims& claims) {
    return {{"message", "Token decoded successfully"}, {"claims", claims.raw}};
}

// BackendService implementation

BackendService::BackendService(control::Config config,
                               std::shared_ptr<core::JwtValidator> validator,
                               std::shared_ptr<core::JwksCache> jwks_cache)
    : config_(std::move(config)),
      validator_(std::move(validator)),
      jwks_cache_(std::move(jwks_cache)) {
    server_.set_read_timeout(std::chrono::milliseconds(config_.server.read_timeout));
    server_.set_write_timeout(std::chrono::milliseconds(config_.server.write_timeout));

    if (config_.server.worker_threads > 0) {
        size_t threads = config_.server.worker_threads;
        server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    }

    register_routes();
}

BackendService::~BackendService() {
    stop();
}

void BackendService::register_routes() {
    server_.Get("/", wrap(false, [this](const httplib::Request&, httplib::Response& res,
                                        const core::VerifiedClaims&, const std::string&) {
                    res.status = 200;
                    res.set_content(health_payload().dump(), JSON_CONTENT_TYPE);
                }));

    auto protected_handler = wrap(true, [](const httplib::Request&, httplib::Response& res,
                                           const core::VerifiedClaims& claims,
                                           const std::string& correlation_id) {
        if (auto* logger = logging::get_logger()) {
            LOG_INFO(logger, "Protected endpoint accessed: upn={}, oid={}, correlation_id={}",
                     string_claim_or_na(claims.raw, "upn").get<std::string>(),
                     string_claim_or_na(claims.raw, "oid").get<std::string>(), correlation_id);
        }
        res.status = 200;
        res.set_content(protected_payload(claims, now_utc()).dump(), JSON_CONTENT_TYPE);
    });
    server_.Get("/api/protected", protected_handler);
    server_.Post("/api/protected", protected_handler);

    server_.Post("/api/token-info",
                 wrap(true, [](const httplib::Request&, httplib::Response& res,
                               const core::VerifiedClaims& claims,
                               const std::string& correlation_id) {
                     if (auto* logger = logging::get_logger()) {
                         LOG_INFO(logger, "Token info requested: upn={}, correlation_id={}",
                                  string_claim_or_na(claims.raw, "upn").get<std::string>(),
                                  correlation_id);
                     }
                     res.status = 200;
                     res.set_content(token_info_payload(claims).dump(), JSON_CONTENT_TYPE);
                 }));

    // JSON bodies for unmatched routes; handlers that already set a body keep it
    server_.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            res.set_content(fmt::format(R"({{"error":"{}"}})", httplib::status_message(res.status)),
                            JSON_CONTENT_TYPE);
        }
    });
}

httplib::Server::Handler BackendService::wrap(bool requires_auth, Handler handler) const {
    return [this, requires_auth, handler = std::move(handler)](const httplib::Request& req,
                                                               httplib::Response& res) {
        auto started = std::chrono::steady_clock::now();

        // Propagate a well-formed caller correlation ID, otherwise mint one
        std::string correlation_id;
        if (req.has_header(CORRELATION_HEADER)) {
            auto incoming = req.get_header_value(CORRELATION_HEADER);
            if (logging::is_valid_uuid(incoming)) {
                correlation_id = std::move(incoming);
            }
        }
        if (correlation_id.empty()) {
            correlation_id = logging::generate_correlation_id();
        }
        res.set_header(CORRELATION_HEADER, correlation_id);

        auto* logger = logging::get_logger();

        if (requires_auth) {
            auto outcome = authenticate(req);
            if (!outcome) {
                if (logger) {
                    TOKENGATE_LOG_AUTH_FAILURE(logger, req.path, outcome.reason, outcome.detail,
                                               correlation_id);
                }
                send_unauthorized(res, outcome.status);
            } else {
                handler(req, res, outcome.claims, correlation_id);
            }
        } else {
            handler(req, res, core::VerifiedClaims{}, correlation_id);
        }

        if (logger && should_log(req.path)) {
            auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(
                                   std::chrono::steady_clock::now() - started)
                                   .count();
            TOKENGATE_LOG_REQUEST(logger, req.method, req.path, res.status, duration_us,
                                  req.remote_addr, correlation_id);
        }
    };
}

AuthOutcome BackendService::authenticate(const httplib::Request& req) const {
    AuthOutcome outcome;

    if (!req.has_header("Authorization")) {
        outcome.reason = "missing_authorization";
        outcome.detail = "no Authorization header";
        return outcome;
    }

    // Keep the header alive while the token view is in use
    std::string header = req.get_header_value("Authorization");
    auto token = extract_bearer_token(header);
    if (!token) {
        outcome.reason = "invalid_authorization_format";
        outcome.detail = "expected 'Bearer <token>'";
        return outcome;
    }

    if (!validator_) {
        outcome.reason = "no_validator";
        outcome.detail = "validator not configured";
        return outcome;
    }

    auto result = validator_->validate(*token);
    if (!result) {
        outcome.status = status_for(result.error);
        outcome.reason = std::string(core::validation_error_to_string(result.error));
        outcome.detail = std::move(result.detail);
        return outcome;
    }

    outcome.authenticated = true;
    outcome.claims = std::move(result.claims);
    return outcome;
}

void BackendService::send_unauthorized(httplib::Response& res, int status) const {
    res.status = status;

    // Add WWW-Authenticate header (RFC 6750); no error details are leaked
    res.set_header("WWW-Authenticate", "Bearer realm=\"tokengate\"");
    res.set_content(std::string(UNAUTHORIZED_BODY), JSON_CONTENT_TYPE);
}

nlohmann::json BackendService::health_payload() const {
    std::string jwks_state =
        jwks_cache_ ? std::string(core::jwks_cache_state_to_string(jwks_cache_->state()))
                    : std::string("static");

    return {{"status", "healthy"},
            {"service", config_.server.service_name},
            {"timestamp", format_iso8601(now_utc())},
            {"tenant_id", config_.identity.tenant_id},
            {"client_id", config_.identity.client_id},
            {"jwks_state", jwks_state}};
}

bool BackendService::should_log(const std::string& path) const {
    const auto& log = config_.logging;
    if (!log.log_requests) {
        return false;
    }
    return std::find(log.exclude_paths.begin(), log.exclude_paths.end(), path) ==
           log.exclude_paths.end();
}

bool BackendService::listen() {
    return server_.listen(config_.server.listen_address, config_.server.listen_port);
}

int BackendService::bind_to_any_port(const std::string& host) {
    return server_.bind_to_any_port(host);
}

bool BackendService::listen_after_bind() {
    return server_.listen_after_bind();
}

void BackendService::stop() {
    if (server_.is_running()) {
        server_.stop();
    }
}

void BackendService::stop_until_exited(const std::atomic<bool>& listener_exited) {
    while (!listener_exited) {
        stop();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void BackendService::wait_until_ready() const {
    server_.wait_until_ready();
}

bool BackendService::is_running() const {
    return server_.is_running();
}

}  // namespace tokengate::service
