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

// tokengate JWKS Transport - Implementation

#include "jwks_transport.hpp"

#include <httplib.h>

#include <exception>

#include "logging.hpp"

namespace tokengate::core {

bool HttpJwksTransport::split_url(const std::string& url, std::string& base, std::string& path) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }

    auto host_start = scheme_end + 3;
    auto path_start = url.find('/', host_start);
    if (path_start == host_start) {
        return false;  // Empty host
    }

    if (path_start == std::string::npos) {
        if (host_start >= url.size()) {
            return false;
        }
        base = url;
        path = "/";
    } else {
        base = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return true;
}

TransportResult HttpJwksTransport::fetch(const std::string& url,
                                         std::chrono::milliseconds timeout) {
    std::string base;
    std::string path;
    if (!split_url(url, base, path)) {
        return TransportResult::failure(FetchError::Unreachable);
    }

    auto started = std::chrono::steady_clock::now();
    auto deadline = started + timeout;

    try {
        httplib::Client client(base);
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);
        // Per-wait timeouts above restart on every byte; this bounds the whole request
        client.set_max_timeout(timeout);
        // Redirects are not followed: keys come from the configured URL only (3xx is BadStatus)

        std::string body;
        bool oversized = false;
        bool deadline_exceeded = false;

        auto res = client.Get(path, [&](const char* data, size_t length) {
            if (std::chrono::steady_clock::now() > deadline) {
                deadline_exceeded = true;
                return false;
            }
            if (body.size() + length > MAX_JWKS_BODY_SIZE) {
                oversized = true;
                return false;  // Cancel the transfer
            }
            body.append(data, length);
            return true;
        });

        if (deadline_exceeded) {
            return TransportResult::failure(FetchError::Timeout, res ? res->status : 0);
        }

        if (oversized) {
            return TransportResult::failure(FetchError::InvalidKeySet,
                                            res ? res->status : 0);
        }

        if (!res) {
            auto error = res.error();
            auto elapsed = std::chrono::steady_clock::now() - started;

            // A request that ran the full budget is a timeout, not a reset
            if (error == httplib::Error::ConnectionTimeout || elapsed >= timeout) {
                return TransportResult::failure(FetchError::Timeout);
            }

            if (auto* logger = logging::get_logger()) {
                LOG_DEBUG(logger, "JWKS request failed: url={}, error={}", url,
                          httplib::to_string(error));
            }
            return TransportResult::failure(FetchError::Unreachable);
        }

        if (res->status != 200) {
            return TransportResult::failure(FetchError::BadStatus, res->status);
        }

        return TransportResult::success(std::move(body), res->status);
    } catch (const std::exception& e) {
        if (auto* logger = logging::get_logger()) {
            LOG_WARNING(logger, "JWKS request raised: url={}, error={}", url, e.what());
        }
        return TransportResult::failure(FetchError::Unreachable);
    }
}

}  // namespace tokengate::core
