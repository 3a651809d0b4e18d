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

// tokengate Crypto - Implementation

#include "crypto.hpp"

#include <algorithm>
#include <cstdio>
#include <vector>

#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/param_build.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>

namespace tokengate::core {

namespace {

struct OsslParamBldDeleter {
    void operator()(OSSL_PARAM_BLD* bld) const noexcept { OSSL_PARAM_BLD_free(bld); }
};

struct OsslParamDeleter {
    void operator()(OSSL_PARAM* params) const noexcept { OSSL_PARAM_free(params); }
};

struct EcdsaSigDeleter {
    void operator()(ECDSA_SIG* sig) const noexcept { ECDSA_SIG_free(sig); }
};

using OsslParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, OsslParamBldDeleter>;
using OsslParamPtr = std::unique_ptr<OSSL_PARAM, OsslParamDeleter>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter>;

const unsigned char* as_bytes(std::string_view s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

bool is_base64url_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_';
}

// Build a public key of the given type from an OSSL_PARAM array
EvpPkeyPtr pkey_from_params(const char* type, OSSL_PARAM* params) {
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, type, nullptr));
    if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
        return nullptr;
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params) != 1) {
        return nullptr;
    }
    return EvpPkeyPtr(raw);
}

}  // namespace

// ============================================================================
// Base64url
// ============================================================================

std::string base64url_encode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    // EVP_EncodeBlock NUL-terminates its output
    std::string result(4 * ((input.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(result.data()),
                                  as_bytes(input), static_cast<int>(input.size()));
    result.resize(static_cast<size_t>(written));

    // base64 -> base64url: '+' -> '-', '/' -> '_', strip '='
    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());

    return result;
}

std::optional<std::string> base64url_decode(std::string_view input) {
    if (input.empty()) {
        return std::string();
    }

    // A single trailing sextet cannot encode a whole byte
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string base64;
    base64.reserve(input.size() + 3);
    for (char c : input) {
        if (!is_base64url_char(c)) {
            return std::nullopt;
        }
        base64.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
    }

    size_t padding = (4 - (base64.size() % 4)) % 4;
    base64.append(padding, '=');

    std::string decoded(3 * base64.size() / 4, '\0');
    int decoded_size = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
                                       as_bytes(base64), static_cast<int>(base64.size()));
    if (decoded_size < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding positions as zero bytes
    decoded.resize(static_cast<size_t>(decoded_size) - padding);
    return decoded;
}

// ============================================================================
// Key construction
// ============================================================================

EvpPkeyPtr rsa_public_key_from_components(std::string_view modulus, std::string_view exponent) {
    if (modulus.empty() || exponent.empty()) {
        return nullptr;
    }

    BignumPtr n(BN_bin2bn(as_bytes(modulus), static_cast<int>(modulus.size()), nullptr));
    BignumPtr e(BN_bin2bn(as_bytes(exponent), static_cast<int>(exponent.size()), nullptr));
    if (!n || !e || BN_is_zero(e.get())) {
        return nullptr;
    }

    OsslParamBldPtr bld(OSSL_PARAM_BLD_new());
    if (!bld || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get()) != 1) {
        return nullptr;
    }

    OsslParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()));
    if (!params) {
        return nullptr;
    }

    auto pkey = pkey_from_params("RSA", params.get());
    if (!pkey || EVP_PKEY_get_bits(pkey.get()) < MIN_RSA_KEY_BITS) {
        ERR_clear_error();
        return nullptr;
    }
    return pkey;
}

EvpPkeyPtr ec_public_key_from_coordinates(int curve_nid, std::string_view x, std::string_view y) {
    size_t coordinate_size = curve_coordinate_size(curve_nid);
    if (coordinate_size == 0 || x.size() != coordinate_size || y.size() != coordinate_size) {
        return nullptr;
    }

    // Uncompressed SEC1 point: 0x04 || X || Y
    std::string point;
    point.reserve(1 + 2 * coordinate_size);
    point.push_back('\x04');
    point.append(x);
    point.append(y);

    const char* group_name = OBJ_nid2sn(curve_nid);
    OsslParamBldPtr bld(OSSL_PARAM_BLD_new());
    if (!bld || !group_name ||
        OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, group_name, 0) !=
            1 ||
        OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY, point.data(),
                                         point.size()) != 1) {
        return nullptr;
    }

    OsslParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()));
    if (!params) {
        return nullptr;
    }

    auto pkey = pkey_from_params("EC", params.get());
    if (!pkey) {
        ERR_clear_error();
        return nullptr;
    }

    // Reject points that are not on the curve
    EvpPkeyCtxPtr check_ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr));
    if (!check_ctx || EVP_PKEY_public_check(check_ctx.get()) != 1) {
        ERR_clear_error();
        return nullptr;
    }
    return pkey;
}

EvpPkeyPtr load_public_key_pem(std::string_view pem_path) {
    FILE* fp = fopen(std::string(pem_path).c_str(), "r");
    if (!fp) {
        return nullptr;
    }

    EVP_PKEY* pkey = PEM_read_PUBKEY(fp, nullptr, nullptr, nullptr);
    fclose(fp);

    if (!pkey) {
        ERR_clear_error();
        return nullptr;
    }
    return EvpPkeyPtr(pkey);
}

int curve_nid_from_jwk_name(std::string_view crv) noexcept {
    if (crv == "P-256") {
        return NID_X9_62_prime256v1;
    } else if (crv == "P-384") {
        return NID_secp384r1;
    } else if (crv == "P-521") {
        return NID_secp521r1;
    }
    return NID_undef;
}

size_t curve_coordinate_size(int curve_nid) noexcept {
    switch (curve_nid) {
        case NID_X9_62_prime256v1:
            return 32;
        case NID_secp384r1:
            return 48;
        case NID_secp521r1:
            return 66;
        default:
            return 0;
    }
}

int ec_key_curve_nid(EVP_PKEY* key) noexcept {
    if (!key || EVP_PKEY_base_id(key) != EVP_PKEY_EC) {
        return NID_undef;
    }

    char group_name[64] = {};
    size_t name_len = 0;
    if (EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME, group_name,
                                       sizeof(group_name), &name_len) != 1) {
        ERR_clear_error();
        return NID_undef;
    }

    int nid = OBJ_txt2nid(group_name);
    if (nid == NID_undef) {
        nid = EC_curve_nist2nid(group_name);
    }
    return nid;
}

// ============================================================================
// Signature verification
// ============================================================================

std::optional<std::string> ecdsa_raw_to_der(std::string_view raw, size_t coordinate_size) {
    if (coordinate_size == 0 || raw.size() != 2 * coordinate_size) {
        return std::nullopt;
    }

    BignumPtr r(BN_bin2bn(as_bytes(raw), static_cast<int>(coordinate_size), nullptr));
    BignumPtr s(BN_bin2bn(as_bytes(raw.substr(coordinate_size)), static_cast<int>(coordinate_size),
                          nullptr));
    EcdsaSigPtr sig(ECDSA_SIG_new());
    if (!r || !s || !sig) {
        return std::nullopt;
    }

    // ECDSA_SIG_set0 takes ownership of r and s on success
    if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
        return std::nullopt;
    }
    r.release();
    s.release();

    int der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
    if (der_len <= 0) {
        return std::nullopt;
    }

    std::string der(static_cast<size_t>(der_len), '\0');
    auto* out = reinterpret_cast<unsigned char*>(der.data());
    if (i2d_ECDSA_SIG(sig.get(), &out) != der_len) {
        return std::nullopt;
    }
    return der;
}

bool verify_signature(SignatureScheme scheme, const EVP_MD* digest, EVP_PKEY* key,
                      std::string_view message, std::string_view signature) {
    if (!digest || !key || signature.empty()) {
        return false;
    }

    // Key type must match the scheme (no cross-family confusion)
    int key_type = EVP_PKEY_base_id(key);
    bool wants_rsa = scheme == SignatureScheme::RsaPkcs1 || scheme == SignatureScheme::RsaPss;
    if (wants_rsa && key_type != EVP_PKEY_RSA) {
        return false;
    }
    if (scheme == SignatureScheme::Ecdsa && key_type != EVP_PKEY_EC) {
        return false;
    }

    std::string der_signature;
    if (scheme == SignatureScheme::Ecdsa) {
        size_t coordinate_size = static_cast<size_t>((EVP_PKEY_get_bits(key) + 7) / 8);
        auto der = ecdsa_raw_to_der(signature, coordinate_size);
        if (!der) {
            return false;
        }
        der_signature = std::move(*der);
        signature = der_signature;
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }

    EVP_PKEY_CTX* pctx = nullptr;  // Owned by ctx
    if (EVP_DigestVerifyInit(ctx.get(), &pctx, digest, nullptr, key) != 1) {
        ERR_clear_error();
        return false;
    }

    if (scheme == SignatureScheme::RsaPss) {
        if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1 ||
            EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, digest) != 1 ||
            EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) != 1) {
            ERR_clear_error();
            return false;
        }
    }

    int rc = EVP_DigestVerify(ctx.get(), as_bytes(signature), signature.size(), as_bytes(message),
                              message.size());
    if (rc != 1) {
        ERR_clear_error();
        return false;
    }
    return true;
}

void initialize_openssl() noexcept {
    // OpenSSL 1.1.0+ auto-initializes; explicit init keeps the JWKS HTTPS client ready
    OPENSSL_init_ssl(0, nullptr);
    OPENSSL_init_crypto(OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}

}  // namespace tokengate::core
