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

// tokengate Key Sources - Implementation

#include "key_source.hpp"

#include "logging.hpp"

namespace tokengate::core {

std::string_view fetch_error_to_string(FetchError error) noexcept {
    switch (error) {
        case FetchError::Timeout:
            return "timeout";
        case FetchError::Unreachable:
            return "unreachable";
        case FetchError::BadStatus:
            return "bad_status";
        case FetchError::InvalidKeySet:
            return "invalid_key_set";
        case FetchError::NoUsableKeys:
            return "no_usable_keys";
    }
    return "unknown";
}

bool StaticKeySource::add_key(SigningKey key) {
    std::string kid = key.key_id;
    auto [it, inserted] =
        keys_.try_emplace(std::move(kid), std::make_shared<const SigningKey>(std::move(key)));
    return inserted;
}

size_t StaticKeySource::add_jwks(std::string_view jwks_json) {
    auto jwks = parse_jwks(jwks_json);
    if (!jwks) {
        return 0;
    }

    size_t added = 0;
    for (const auto& jwk : *jwks) {
        std::string reason;
        auto key = SigningKey::from_jwk(jwk, &reason);
        if (!key) {
            if (auto* logger = logging::get_logger()) {
                LOG_WARNING(logger, "Skipping static JWK: kid={}, reason={}", jwk.kid, reason);
            }
            continue;
        }
        if (add_key(std::move(*key))) {
            ++added;
        }
    }
    return added;
}

KeyLookupResult StaticKeySource::get_key(std::string_view key_id) {
    auto it = keys_.find(std::string(key_id));
    if (it == keys_.end()) {
        return KeyLookupResult::not_found();
    }
    return KeyLookupResult::found(it->second);
}

}  // namespace tokengate::core
