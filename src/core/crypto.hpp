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

// tokengate Crypto - Header
// OpenSSL wrappers: base64url, public key construction, signature verification

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <openssl/bn.h>
#include <openssl/evp.h>

namespace tokengate::core {

/// Smallest RSA modulus accepted for verification keys
constexpr int MIN_RSA_KEY_BITS = 2048;

/// EVP_PKEY deleter for std::unique_ptr
struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept {
        if (key) {
            EVP_PKEY_free(key);
        }
    }
};

/// EVP_PKEY_CTX deleter for std::unique_ptr
struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const noexcept {
        if (ctx) {
            EVP_PKEY_CTX_free(ctx);
        }
    }
};

/// EVP_MD_CTX deleter for std::unique_ptr
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

/// BIGNUM deleter for std::unique_ptr
struct BignumDeleter {
    void operator()(BIGNUM* bn) const noexcept {
        if (bn) {
            BN_free(bn);
        }
    }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

/// Signature padding / encoding family
enum class SignatureScheme {
    RsaPkcs1,  // RSASSA-PKCS1-v1_5
    RsaPss,    // RSASSA-PSS, MGF1 with the same digest, salt = digest length
    Ecdsa      // ECDSA with JWS raw R||S signature encoding
};

/// Base64url encode (RFC 4648 section 5, unpadded)
[[nodiscard]] std::string base64url_encode(std::string_view input);

/// Base64url decode (RFC 4648 section 5)
/// Rejects padding, whitespace and characters outside the url-safe alphabet.
[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view input);

/// Build an RSA public key from big-endian modulus and exponent bytes.
/// Returns nullptr for malformed input or moduli below MIN_RSA_KEY_BITS.
[[nodiscard]] EvpPkeyPtr rsa_public_key_from_components(std::string_view modulus,
                                                        std::string_view exponent);

/// Build an EC public key from affine coordinates on the named curve.
/// Coordinates must be exactly the field size; the point must lie on the curve.
[[nodiscard]] EvpPkeyPtr ec_public_key_from_coordinates(int curve_nid, std::string_view x,
                                                        std::string_view y);

/// Load a SubjectPublicKeyInfo PEM file
[[nodiscard]] EvpPkeyPtr load_public_key_pem(std::string_view pem_path);

/// Curve NID for a JWK "crv" name (P-256, P-384, P-521), NID_undef otherwise
[[nodiscard]] int curve_nid_from_jwk_name(std::string_view crv) noexcept;

/// Field element size in bytes for a supported curve, 0 otherwise
[[nodiscard]] size_t curve_coordinate_size(int curve_nid) noexcept;

/// Curve NID of an EC key, NID_undef for other key types
[[nodiscard]] int ec_key_curve_nid(EVP_PKEY* key) noexcept;

/// Convert a JWS ECDSA signature (R||S, each coordinate_size bytes) to DER
[[nodiscard]] std::optional<std::string> ecdsa_raw_to_der(std::string_view raw,
                                                          size_t coordinate_size);

/// Verify a signature over message. Never throws; any OpenSSL failure is a mismatch.
[[nodiscard]] bool verify_signature(SignatureScheme scheme, const EVP_MD* digest, EVP_PKEY* key,
                                    std::string_view message, std::string_view signature);

/// Initialize OpenSSL library (call once at startup)
void initialize_openssl() noexcept;

}  // namespace tokengate::core
