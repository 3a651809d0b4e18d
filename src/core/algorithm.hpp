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

// tokengate JWS Algorithms - Header
// RFC 7518 signature algorithm identifiers and their OpenSSL parameters

#pragma once

#include <optional>
#include <string_view>

#include <openssl/evp.h>

namespace tokengate::core {

/// JWS algorithm types (asymmetric only; "none" is parsed so it can be rejected)
enum class JwtAlgorithm {
    RS256,  // RSASSA-PKCS1-v1_5 + SHA-256
    RS384,
    RS512,
    PS256,  // RSASSA-PSS + SHA-256
    PS384,
    PS512,
    ES256,  // ECDSA P-256 + SHA-256
    ES384,  // ECDSA P-384 + SHA-384
    ES512,  // ECDSA P-521 + SHA-512
    None    // Unsecured JWS (always rejected)
};

/// Key family an algorithm needs
enum class KeyFamily {
    RSA,
    EC,
    None
};

/// Parse "alg" header value. "none" is matched case-insensitively.
[[nodiscard]] std::optional<JwtAlgorithm> parse_algorithm(std::string_view alg_str);

/// Convert algorithm enum to its registered name
[[nodiscard]] std::string_view algorithm_to_string(JwtAlgorithm alg) noexcept;

[[nodiscard]] KeyFamily key_family(JwtAlgorithm alg) noexcept;

/// Message digest for the algorithm (nullptr for None)
[[nodiscard]] const EVP_MD* algorithm_digest(JwtAlgorithm alg) noexcept;

/// Curve NID required by an ES* algorithm, NID_undef otherwise
[[nodiscard]] int algorithm_curve_nid(JwtAlgorithm alg) noexcept;

}  // namespace tokengate::core
