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

// tokengate Signing Keys - Implementation

#include "signing_key.hpp"

#include <openssl/evp.h>
#include <openssl/obj_mac.h>

namespace tokengate::core {

namespace {

void set_reason(std::string* reason, std::string text) {
    if (reason) {
        *reason = std::move(text);
    }
}

}  // namespace

// JsonWebKey implementation

std::optional<JsonWebKey> JsonWebKey::from_object(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    try {
        JsonWebKey jwk;
        jwk.kty = j.value("kty", "");
        jwk.alg = j.value("alg", "");
        jwk.kid = j.value("kid", "");
        jwk.use = j.value("use", "sig");  // Default to signature

        if (jwk.kty == "RSA") {
            jwk.n = j.value("n", "");
            jwk.e = j.value("e", "");
        } else if (jwk.kty == "EC") {
            jwk.crv = j.value("crv", "");
            jwk.x = j.value("x", "");
            jwk.y = j.value("y", "");
        }

        return jwk;
    } catch (const nlohmann::json::exception&) {
        // Member present with a non-string type
        return std::nullopt;
    }
}

std::optional<JsonWebKey> JsonWebKey::parse(std::string_view json) {
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded()) {
        return std::nullopt;
    }
    return from_object(j);
}

std::optional<std::vector<JsonWebKey>> parse_jwks(std::string_view json) {
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    // JWKS format: { "keys": [ {...}, {...} ] }
    auto keys = j.find("keys");
    if (keys == j.end() || !keys->is_array()) {
        return std::nullopt;
    }

    std::vector<JsonWebKey> jwks;
    jwks.reserve(keys->size());
    for (const auto& jwk_json : *keys) {
        auto jwk = JsonWebKey::from_object(jwk_json);
        if (jwk) {
            jwks.push_back(std::move(*jwk));
        }
    }
    return jwks;
}

// SigningKey implementation

bool SigningKey::accepts(JwtAlgorithm alg) const noexcept {
    if (alg == JwtAlgorithm::None || !public_key) {
        return false;
    }
    if (key_family(alg) != family) {
        return false;
    }
    if (algorithm && *algorithm != alg) {
        return false;
    }
    if (family == KeyFamily::EC && algorithm_curve_nid(alg) != curve_nid) {
        return false;
    }
    return true;
}

std::optional<SigningKey> SigningKey::from_jwk(const JsonWebKey& jwk, std::string* reason) {
    if (jwk.kid.empty()) {
        set_reason(reason, "missing kid");
        return std::nullopt;
    }
    if (jwk.use != "sig") {
        set_reason(reason, "use is not 'sig'");
        return std::nullopt;
    }

    SigningKey key;
    key.key_id = jwk.kid;

    if (!jwk.alg.empty()) {
        auto alg = parse_algorithm(jwk.alg);
        if (!alg || *alg == JwtAlgorithm::None) {
            set_reason(reason, "unsupported alg '" + jwk.alg + "'");
            return std::nullopt;
        }
        key.algorithm = *alg;
    }

    if (jwk.kty == "RSA") {
        auto n_bin = base64url_decode(jwk.n);
        auto e_bin = base64url_decode(jwk.e);
        if (!n_bin || !e_bin) {
            set_reason(reason, "undecodable RSA components");
            return std::nullopt;
        }
        key.family = KeyFamily::RSA;
        key.curve_nid = NID_undef;
        key.public_key = rsa_public_key_from_components(*n_bin, *e_bin);
    } else if (jwk.kty == "EC") {
        int nid = curve_nid_from_jwk_name(jwk.crv);
        if (nid == NID_undef) {
            set_reason(reason, "unsupported curve '" + jwk.crv + "'");
            return std::nullopt;
        }
        auto x_bin = base64url_decode(jwk.x);
        auto y_bin = base64url_decode(jwk.y);
        if (!x_bin || !y_bin) {
            set_reason(reason, "undecodable EC coordinates");
            return std::nullopt;
        }
        key.family = KeyFamily::EC;
        key.curve_nid = nid;
        key.public_key = ec_public_key_from_coordinates(nid, *x_bin, *y_bin);
    } else {
        set_reason(reason, "unsupported kty '" + jwk.kty + "'");
        return std::nullopt;
    }

    if (!key.public_key) {
        set_reason(reason, "invalid key material");
        return std::nullopt;
    }

    // A pinned alg must fit the key it came with
    if (key.algorithm && !key.accepts(*key.algorithm)) {
        set_reason(reason, "alg does not match key type");
        return std::nullopt;
    }

    return key;
}

std::optional<SigningKey> SigningKey::from_pem_file(std::string_view key_id,
                                                    std::string_view pem_path,
                                                    std::optional<JwtAlgorithm> algorithm) {
    auto pkey = load_public_key_pem(pem_path);
    if (!pkey) {
        return std::nullopt;
    }

    SigningKey key;
    key.key_id = std::string(key_id);
    key.algorithm = algorithm;

    int key_type = EVP_PKEY_base_id(pkey.get());
    if (key_type == EVP_PKEY_RSA) {
        if (EVP_PKEY_get_bits(pkey.get()) < MIN_RSA_KEY_BITS) {
            return std::nullopt;
        }
        key.family = KeyFamily::RSA;
    } else if (key_type == EVP_PKEY_EC) {
        key.family = KeyFamily::EC;
        key.curve_nid = ec_key_curve_nid(pkey.get());
        if (curve_coordinate_size(key.curve_nid) == 0) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    key.public_key = std::move(pkey);

    if (algorithm && !key.accepts(*algorithm)) {
        return std::nullopt;
    }
    return key;
}

}  // namespace tokengate::core
