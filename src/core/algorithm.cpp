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

// tokengate JWS Algorithms - Implementation

#include "algorithm.hpp"

#include <cctype>

#include <openssl/obj_mac.h>

namespace tokengate::core {

std::optional<JwtAlgorithm> parse_algorithm(std::string_view alg_str) {
    if (alg_str == "RS256") {
        return JwtAlgorithm::RS256;
    } else if (alg_str == "RS384") {
        return JwtAlgorithm::RS384;
    } else if (alg_str == "RS512") {
        return JwtAlgorithm::RS512;
    } else if (alg_str == "PS256") {
        return JwtAlgorithm::PS256;
    } else if (alg_str == "PS384") {
        return JwtAlgorithm::PS384;
    } else if (alg_str == "PS512") {
        return JwtAlgorithm::PS512;
    } else if (alg_str == "ES256") {
        return JwtAlgorithm::ES256;
    } else if (alg_str == "ES384") {
        return JwtAlgorithm::ES384;
    } else if (alg_str == "ES512") {
        return JwtAlgorithm::ES512;
    }

    // "None", "NONE", ... are all the unsecured algorithm
    if (alg_str.size() == 4) {
        bool is_none = true;
        constexpr std::string_view none = "none";
        for (size_t i = 0; i < none.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(alg_str[i])) != none[i]) {
                is_none = false;
                break;
            }
        }
        if (is_none) {
            return JwtAlgorithm::None;
        }
    }
    return std::nullopt;
}

std::string_view algorithm_to_string(JwtAlgorithm alg) noexcept {
    switch (alg) {
        case JwtAlgorithm::RS256:
            return "RS256";
        case JwtAlgorithm::RS384:
            return "RS384";
        case JwtAlgorithm::RS512:
            return "RS512";
        case JwtAlgorithm::PS256:
            return "PS256";
        case JwtAlgorithm::PS384:
            return "PS384";
        case JwtAlgorithm::PS512:
            return "PS512";
        case JwtAlgorithm::ES256:
            return "ES256";
        case JwtAlgorithm::ES384:
            return "ES384";
        case JwtAlgorithm::ES512:
            return "ES512";
        case JwtAlgorithm::None:
            return "none";
    }
    return "unknown";
}

KeyFamily key_family(JwtAlgorithm alg) noexcept {
    switch (alg) {
        case JwtAlgorithm::RS256:
        case JwtAlgorithm::RS384:
        case JwtAlgorithm::RS512:
        case JwtAlgorithm::PS256:
        case JwtAlgorithm::PS384:
        case JwtAlgorithm::PS512:
            return KeyFamily::RSA;
        case JwtAlgorithm::ES256:
        case JwtAlgorithm::ES384:
        case JwtAlgorithm::ES512:
            return KeyFamily::EC;
        case JwtAlgorithm::None:
            return KeyFamily::None;
    }
    return KeyFamily::None;
}

const EVP_MD* algorithm_digest(JwtAlgorithm alg) noexcept {
    switch (alg) {
        case JwtAlgorithm::RS256:
        case JwtAlgorithm::PS256:
        case JwtAlgorithm::ES256:
            return EVP_sha256();
        case JwtAlgorithm::RS384:
        case JwtAlgorithm::PS384:
        case JwtAlgorithm::ES384:
            return EVP_sha384();
        case JwtAlgorithm::RS512:
        case JwtAlgorithm::PS512:
        case JwtAlgorithm::ES512:
            return EVP_sha512();
        case JwtAlgorithm::None:
            return nullptr;
    }
    return nullptr;
}

int algorithm_curve_nid(JwtAlgorithm alg) noexcept {
    switch (alg) {
        case JwtAlgorithm::ES256:
            return NID_X9_62_prime256v1;
        case JwtAlgorithm::ES384:
            return NID_secp384r1;
        case JwtAlgorithm::ES512:
            return NID_secp521r1;
        default:
            return NID_undef;
    }
}

}  // namespace tokengate::core
