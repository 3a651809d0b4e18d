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

#include <catch2/catch_test_macros.hpp>

#include <openssl/obj_mac.h>

#include "core/algorithm.hpp"
#include "core/crypto.hpp"
#include "test_support.hpp"

using namespace tokengate::core;
using namespace tokengate::testing;

// ============================================================================
// Base64url
// ============================================================================

TEST_CASE("Base64url encoding/decoding", "[crypto][base64url]") {
    SECTION("Encode empty string") {
        REQUIRE(base64url_encode("").empty());
    }

    SECTION("Decode empty string") {
        auto decoded = base64url_decode("");
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->empty());
    }

    SECTION("Encoding is unpadded") {
        REQUIRE(base64url_encode("f") == "Zg");
        REQUIRE(base64url_encode("fo") == "Zm8");
        REQUIRE(base64url_encode("foo") == "Zm9v");
        REQUIRE(base64url_encode("foob") == "Zm9vYg");
    }

    SECTION("Url-safe alphabet") {
        std::string binary = "\xfb\xff\xbf";
        REQUIRE(base64url_encode(binary) == "-_-_");

        auto decoded = base64url_decode("-_-_");
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == binary);
    }

    SECTION("Decode JWT header") {
        auto decoded = base64url_decode("eyJhbGciOiJSUzI1NiIsInR5cCI6IkpXVCJ9");
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == R"({"alg":"RS256","typ":"JWT"})");
    }

    SECTION("Binary data survives") {
        std::string binary("\x00\x01\x02\xfe\xff", 5);
        auto decoded = base64url_decode(base64url_encode(binary));
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == binary);
    }

    SECTION("Reject standard base64 characters and padding") {
        REQUIRE_FALSE(base64url_decode("ab+/").has_value());
        REQUIRE_FALSE(base64url_decode("Zg==").has_value());
        REQUIRE_FALSE(base64url_decode("Zm 9v").has_value());
    }

    SECTION("Reject impossible length") {
        REQUIRE_FALSE(base64url_decode("Zm9vY").has_value());
    }
}

// ============================================================================
// Algorithms
// ============================================================================

TEST_CASE("JWS algorithm parsing", "[crypto][algorithm]") {
    SECTION("Asymmetric algorithms") {
        REQUIRE(parse_algorithm("RS256") == JwtAlgorithm::RS256);
        REQUIRE(parse_algorithm("PS384") == JwtAlgorithm::PS384);
        REQUIRE(parse_algorithm("ES512") == JwtAlgorithm::ES512);
    }

    SECTION("none in any case") {
        REQUIRE(parse_algorithm("none") == JwtAlgorithm::None);
        REQUIRE(parse_algorithm("None") == JwtAlgorithm::None);
        REQUIRE(parse_algorithm("NONE") == JwtAlgorithm::None);
    }

    SECTION("Unsupported names") {
        REQUIRE_FALSE(parse_algorithm("HS256").has_value());
        REQUIRE_FALSE(parse_algorithm("rs256").has_value());
        REQUIRE_FALSE(parse_algorithm("").has_value());
    }

    SECTION("Key family and curve") {
        REQUIRE(key_family(JwtAlgorithm::PS256) == KeyFamily::RSA);
        REQUIRE(key_family(JwtAlgorithm::ES384) == KeyFamily::EC);
        REQUIRE(key_family(JwtAlgorithm::None) == KeyFamily::None);
        REQUIRE(algorithm_curve_nid(JwtAlgorithm::ES256) == NID_X9_62_prime256v1);
        REQUIRE(algorithm_curve_nid(JwtAlgorithm::ES512) == NID_secp521r1);
        REQUIRE(algorithm_digest(JwtAlgorithm::None) == nullptr);
        REQUIRE(algorithm_to_string(JwtAlgorithm::RS512) == "RS512");
    }
}

// ============================================================================
// Key construction and verification
// ============================================================================

TEST_CASE("RSA key from components", "[crypto][rsa]") {
    EVP_PKEY* source = shared_rsa_key();
    std::string n = bignum_bytes(source, OSSL_PKEY_PARAM_RSA_N);
    std::string e = bignum_bytes(source, OSSL_PKEY_PARAM_RSA_E);

    SECTION("Builds a key that verifies signatures of the source key") {
        auto key = rsa_public_key_from_components(n, e);
        REQUIRE(key);

        std::string message = "header.payload";
        std::string sig = sign_message(source, JwtAlgorithm::RS256, message);
        REQUIRE(verify_signature(SignatureScheme::RsaPkcs1, EVP_sha256(), key.get(), message, sig));
        REQUIRE_FALSE(
            verify_signature(SignatureScheme::RsaPkcs1, EVP_sha256(), key.get(), "tampered", sig));
    }

    SECTION("Rejects moduli below 2048 bits") {
        auto small = generate_rsa_key(1024);
        REQUIRE(small);
        auto key = rsa_public_key_from_components(bignum_bytes(small.get(), OSSL_PKEY_PARAM_RSA_N),
                                                  bignum_bytes(small.get(), OSSL_PKEY_PARAM_RSA_E));
        REQUIRE_FALSE(key);
    }

    SECTION("Rejects empty components") {
        REQUIRE_FALSE(rsa_public_key_from_components("", e));
        REQUIRE_FALSE(rsa_public_key_from_components(n, ""));
    }
}

TEST_CASE("EC key from coordinates", "[crypto][ec]") {
    EVP_PKEY* source = shared_ec_key("P-256");
    std::string x = bignum_bytes(source, OSSL_PKEY_PARAM_EC_PUB_X, 32);
    std::string y = bignum_bytes(source, OSSL_PKEY_PARAM_EC_PUB_Y, 32);

    SECTION("Valid point") {
        auto key = ec_public_key_from_coordinates(NID_X9_62_prime256v1, x, y);
        REQUIRE(key);
        REQUIRE(ec_key_curve_nid(key.get()) == NID_X9_62_prime256v1);

        std::string message = "header.payload";
        std::string sig = sign_message(source, JwtAlgorithm::ES256, message);
        REQUIRE(sig.size() == 64);
        REQUIRE(verify_signature(SignatureScheme::Ecdsa, EVP_sha256(), key.get(), message, sig));
    }

    SECTION("Point not on the curve") {
        std::string bad_y = y;
        bad_y[31] = static_cast<char>(bad_y[31] ^ 0x01);
        REQUIRE_FALSE(ec_public_key_from_coordinates(NID_X9_62_prime256v1, x, bad_y));
    }

    SECTION("Wrong coordinate length") {
        REQUIRE_FALSE(ec_public_key_from_coordinates(NID_X9_62_prime256v1, x.substr(1), y));
    }

    SECTION("Curve names") {
        REQUIRE(curve_nid_from_jwk_name("P-256") == NID_X9_62_prime256v1);
        REQUIRE(curve_nid_from_jwk_name("P-384") == NID_secp384r1);
        REQUIRE(curve_nid_from_jwk_name("P-521") == NID_secp521r1);
        REQUIRE(curve_nid_from_jwk_name("secp256k1") == NID_undef);
        REQUIRE(curve_coordinate_size(NID_secp521r1) == 66);
    }
}

TEST_CASE("Signature verification edge cases", "[crypto][verify]") {
    EVP_PKEY* rsa = shared_rsa_key();
    EVP_PKEY* ec = shared_ec_key("P-256");
    std::string message = "a.b";

    SECTION("Empty signature never verifies") {
        REQUIRE_FALSE(verify_signature(SignatureScheme::RsaPkcs1, EVP_sha256(), rsa, message, ""));
    }

    SECTION("Scheme and key family must agree") {
        std::string sig = sign_message(rsa, JwtAlgorithm::RS256, message);
        REQUIRE_FALSE(verify_signature(SignatureScheme::Ecdsa, EVP_sha256(), rsa, message, sig));

        std::string ec_sig = sign_message(ec, JwtAlgorithm::ES256, message);
        REQUIRE_FALSE(
            verify_signature(SignatureScheme::RsaPkcs1, EVP_sha256(), ec, message, ec_sig));
    }

    SECTION("PKCS1 signature does not pass as PSS") {
        std::string sig = sign_message(rsa, JwtAlgorithm::RS256, message);
        REQUIRE_FALSE(verify_signature(SignatureScheme::RsaPss, EVP_sha256(), rsa, message, sig));
    }

    SECTION("PSS signature verifies") {
        std::string sig = sign_message(rsa, JwtAlgorithm::PS256, message);
        REQUIRE(verify_signature(SignatureScheme::RsaPss, EVP_sha256(), rsa, message, sig));
    }

    SECTION("DER encoded ECDSA signature is not accepted") {
        std::string raw = sign_message(ec, JwtAlgorithm::ES256, message);
        auto der = ecdsa_raw_to_der(raw, 32);
        REQUIRE(der.has_value());
        REQUIRE_FALSE(verify_signature(SignatureScheme::Ecdsa, EVP_sha256(), ec, message, *der));
    }
}
