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

// tokengate Component Factory - Header
// Factory functions for building the validation engine from configuration

#pragma once

#include <memory>

#include "../control/config.hpp"
#include "../core/jwks_cache.hpp"
#include "../core/jwks_transport.hpp"
#include "../core/jwt.hpp"
#include "../core/key_source.hpp"

namespace tokengate::service {

/// Build the validator's trust policy (expects a validated config)
[[nodiscard]] core::TrustPolicy build_trust_policy(const control::Config& config);

/// Build static key source from PEM files and/or a JWKS file.
/// Returns nullptr if no key could be loaded.
[[nodiscard]] std::shared_ptr<core::StaticKeySource> build_static_key_source(
    const control::Config& config);

/// Build JWKS cache (not started). Uses HttpJwksTransport unless transport is given.
[[nodiscard]] std::shared_ptr<core::JwksCache> build_jwks_cache(
    const control::Config& config, std::shared_ptr<core::JwksTransport> transport = nullptr);

/// Build JWT validator over an already-built key source
[[nodiscard]] std::shared_ptr<core::JwtValidator> build_jwt_validator(
    const control::Config& config, std::shared_ptr<core::KeySource> keys);

}  // namespace tokengate::service
