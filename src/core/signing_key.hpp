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

// tokengate Signing Keys - Header
// RFC 7517 JSON Web Key parsing and conversion to verification-only keys

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "algorithm.hpp"
#include "crypto.hpp"

namespace tokengate::core {

/// JWK (JSON Web Key) as published in a key set
struct JsonWebKey {
    std::string kty;   // Key type: "RSA" or "EC"
    std::string alg;   // Algorithm (optional; Entra ID omits it)
    std::string kid;   // Key ID
    std::string use;   // Key use: "sig" for signature

    // RSA-specific fields
    std::string n;     // Modulus (base64url)
    std::string e;     // Exponent (base64url)

    // EC-specific fields
    std::string crv;   // Curve: "P-256", "P-384", "P-521"
    std::string x;     // X coordinate (base64url)
    std::string y;     // Y coordinate (base64url)

    [[nodiscard]] static std::optional<JsonWebKey> parse(std::string_view json);

    /// Parse an already-decoded JWK object
    [[nodiscard]] static std::optional<JsonWebKey> from_object(const nlohmann::json& j);
};

/// Parse a JWKS document ({"keys": [...]}). Entries that are not JWK objects
/// are dropped; nullopt when the document itself is not a key set.
[[nodiscard]] std::optional<std::vector<JsonWebKey>> parse_jwks(std::string_view json);

/// Verification-only public key. Immutable once built.
struct SigningKey {
    std::string key_id;
    std::optional<JwtAlgorithm> algorithm;  // Pinned algorithm when the JWK declares one
    KeyFamily family = KeyFamily::None;
    int curve_nid = 0;                      // NID_undef for RSA
    EvpPkeyPtr public_key;

    /// True if this key may verify a token declared with alg
    [[nodiscard]] bool accepts(JwtAlgorithm alg) const noexcept;

    /// Convert a JWK. On failure, reason (if given) says why the key was skipped.
    [[nodiscard]] static std::optional<SigningKey> from_jwk(const JsonWebKey& jwk,
                                                            std::string* reason = nullptr);

    /// Load from a SubjectPublicKeyInfo PEM file
    [[nodiscard]] static std::optional<SigningKey> from_pem_file(
        std::string_view key_id, std::string_view pem_path,
        std::optional<JwtAlgorithm> algorithm = std::nullopt);
};

}  // namespace tokengate::core
