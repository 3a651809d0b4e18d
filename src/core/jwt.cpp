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

// tokengate JWT Validation - Implementation

#include "jwt.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

#include <fmt/format.h>

#include "crypto.hpp"
#include "logging.hpp"

namespace tokengate::core {

namespace {

// Largest NumericDate (in seconds) representable in microseconds
constexpr int64_t MAX_NUMERIC_DATE_SECONDS = std::numeric_limits<int64_t>::max() / 1'000'000;

SignatureScheme signature_scheme(JwtAlgorithm alg) noexcept {
    switch (alg) {
        case JwtAlgorithm::PS256:
        case JwtAlgorithm::PS384:
        case JwtAlgorithm::PS512:
            return SignatureScheme::RsaPss;
        case JwtAlgorithm::ES256:
        case JwtAlgorithm::ES384:
        case JwtAlgorithm::ES512:
            return SignatureScheme::Ecdsa;
        default:
            return SignatureScheme::RsaPkcs1;
    }
}

/// Read an optional string member. False if present with another type.
bool read_string(const nlohmann::json& j, const char* name, std::optional<std::string>& out) {
    auto it = j.find(name);
    if (it == j.end()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

/// Read an optional NumericDate member. False if present but not a usable number.
bool read_numeric_date(const nlohmann::json& j, const char* name,
                       std::optional<NumericDate>& out) {
    auto it = j.find(name);
    if (it == j.end()) {
        return true;
    }
    out = parse_numeric_date(*it);
    return out.has_value();
}

}  // namespace

// ============================================================================
// Claim parsing
// ============================================================================

std::optional<NumericDate> parse_numeric_date(const nlohmann::json& value) {
    using std::chrono::microseconds;

    if (value.is_number_unsigned()) {
        auto seconds = value.get<uint64_t>();
        if (seconds > static_cast<uint64_t>(MAX_NUMERIC_DATE_SECONDS)) {
            return std::nullopt;
        }
        return NumericDate(microseconds(static_cast<int64_t>(seconds) * 1'000'000));
    }

    if (value.is_number_integer()) {
        auto seconds = value.get<int64_t>();
        if (seconds > MAX_NUMERIC_DATE_SECONDS || seconds < -MAX_NUMERIC_DATE_SECONDS) {
            return std::nullopt;
        }
        return NumericDate(microseconds(seconds * 1'000'000));
    }

    if (value.is_number_float()) {
        double seconds = value.get<double>();
        if (!std::isfinite(seconds) ||
            std::fabs(seconds) > static_cast<double>(MAX_NUMERIC_DATE_SECONDS)) {
            return std::nullopt;
        }
        return NumericDate(microseconds(std::llround(seconds * 1'000'000.0)));
    }

    return std::nullopt;
}

std::optional<JwtHeader> JwtHeader::parse(std::string_view json) {
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    JwtHeader header;

    // Parse algorithm (required, must be a string)
    auto alg = j.find("alg");
    if (alg == j.end() || !alg->is_string()) {
        return std::nullopt;
    }
    header.alg = alg->get<std::string>();
    header.algorithm = parse_algorithm(header.alg);

    // Parse type (optional, defaults to "JWT")
    auto typ = j.find("typ");
    header.type = (typ != j.end() && typ->is_string()) ? typ->get<std::string>() : "JWT";

    // Parse key ID (optional, but a string when present)
    if (!read_string(j, "kid", header.key_id)) {
        return std::nullopt;
    }

    return header;
}

std::optional<JwtClaims> JwtClaims::parse(std::string_view json) {
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    JwtClaims claims;

    if (!read_string(j, "sub", claims.sub) || !read_string(j, "iss", claims.iss) ||
        !read_string(j, "jti", claims.jti)) {
        return std::nullopt;
    }

    // Audience: single string or array of strings
    auto aud = j.find("aud");
    if (aud != j.end()) {
        if (aud->is_string()) {
            claims.aud.push_back(aud->get<std::string>());
        } else if (aud->is_array()) {
            for (const auto& entry : *aud) {
                if (!entry.is_string()) {
                    return std::nullopt;
                }
                claims.aud.push_back(entry.get<std::string>());
            }
        } else {
            return std::nullopt;
        }
    }

    // Expiration is mandatory for bearer tokens
    auto exp = j.find("exp");
    if (exp == j.end()) {
        return std::nullopt;
    }
    auto expires_at = parse_numeric_date(*exp);
    if (!expires_at) {
        return std::nullopt;
    }
    claims.exp = *expires_at;

    if (!read_numeric_date(j, "iat", claims.iat) || !read_numeric_date(j, "nbf", claims.nbf)) {
        return std::nullopt;
    }

    claims.raw = std::move(j);
    return claims;
}

// ============================================================================
// TrustPolicy / errors
// ============================================================================

bool TrustPolicy::allows(JwtAlgorithm alg) const noexcept {
    if (alg == JwtAlgorithm::None) {
        return false;
    }
    return std::find(allowed_algorithms.begin(), allowed_algorithms.end(), alg) !=
           allowed_algorithms.end();
}

std::string_view validation_error_to_string(ValidationError error) noexcept {
    switch (error) {
        case ValidationError::Malformed:
            return "malformed";
        case ValidationError::AlgorithmRejected:
            return "algorithm_rejected";
        case ValidationError::KeyUnresolvable:
            return "key_unresolvable";
        case ValidationError::SignatureInvalid:
            return "signature_invalid";
        case ValidationError::IssuerRejected:
            return "issuer_rejected";
        case ValidationError::AudienceRejected:
            return "audience_rejected";
        case ValidationError::Expired:
            return "expired";
        case ValidationError::NotYetValid:
            return "not_yet_valid";
    }
    return "unknown";
}

// ============================================================================
// JwtValidator Implementation
// ============================================================================

JwtValidator::JwtValidator(TrustPolicy policy, std::shared_ptr<KeySource> keys, Clock clock)
    : policy_(std::move(policy)), keys_(std::move(keys)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

ValidationResult JwtValidator::validate(std::string_view token) const {
    auto result = validate_token(token);

    if (!result.valid) {
        if (auto* logger = logging::get_logger()) {
            LOG_WARNING(logger, "Token rejected: reason={}, detail={}",
                        validation_error_to_string(result.error), result.detail);
        }
    }

    return result;
}

ValidationResult JwtValidator::validate_token(std::string_view token) const {
    // STEP 1: Parse header.payload.signature
    if (token.size() > MAX_TOKEN_SIZE) {
        return ValidationResult::failure(ValidationError::Malformed,
                                         fmt::format("token exceeds {} bytes", MAX_TOKEN_SIZE));
    }

    size_t first_dot = token.find('.');
    size_t second_dot =
        first_dot == std::string_view::npos ? first_dot : token.find('.', first_dot + 1);
    if (second_dot == std::string_view::npos ||
        token.find('.', second_dot + 1) != std::string_view::npos) {
        return ValidationResult::failure(ValidationError::Malformed, "expected three segments");
    }

    std::string_view header_part = token.substr(0, first_dot);
    std::string_view payload_part = token.substr(first_dot + 1, second_dot - first_dot - 1);
    std::string_view signature_part = token.substr(second_dot + 1);

    auto header_json = base64url_decode(header_part);
    if (!header_json) {
        return ValidationResult::failure(ValidationError::Malformed, "invalid header encoding");
    }

    auto payload_json = base64url_decode(payload_part);
    if (!payload_json) {
        return ValidationResult::failure(ValidationError::Malformed, "invalid payload encoding");
    }

    // Empty signature segment decodes to an empty signature (unsecured JWS)
    auto signature = base64url_decode(signature_part);
    if (!signature) {
        return ValidationResult::failure(ValidationError::Malformed,
                                         "invalid signature encoding");
    }

    auto header = JwtHeader::parse(*header_json);
    if (!header) {
        return ValidationResult::failure(ValidationError::Malformed, "invalid header");
    }

    // STEP 2: Algorithm check ("none" is never allowed, whatever the policy or claims say)
    if (!header->algorithm) {
        return ValidationResult::failure(ValidationError::AlgorithmRejected,
                                         fmt::format("unsupported alg '{}'", header->alg));
    }
    JwtAlgorithm alg = *header->algorithm;
    if (alg == JwtAlgorithm::None) {
        return ValidationResult::failure(ValidationError::AlgorithmRejected,
                                         "unsecured token");
    }
    if (!policy_.allows(alg)) {
        return ValidationResult::failure(
            ValidationError::AlgorithmRejected,
            fmt::format("alg {} not allowed", algorithm_to_string(alg)));
    }

    auto claims = JwtClaims::parse(*payload_json);
    if (!claims) {
        return ValidationResult::failure(ValidationError::Malformed, "invalid claims");
    }

    // STEP 3: Resolve verification key
    if (!header->key_id) {
        return ValidationResult::failure(ValidationError::KeyUnresolvable, "missing kid");
    }
    if (!keys_) {
        return ValidationResult::failure(ValidationError::KeyUnresolvable,
                                         "no key source configured");
    }

    auto lookup = keys_->get_key(*header->key_id);
    switch (lookup.status) {
        case KeyLookupStatus::Found:
            break;
        case KeyLookupStatus::NotFound:
            return ValidationResult::failure(ValidationError::KeyUnresolvable,
                                             fmt::format("unknown kid '{}'", *header->key_id));
        case KeyLookupStatus::FetchFailed:
            return ValidationResult::failure(
                ValidationError::KeyUnresolvable,
                fmt::format("key set unavailable: {}", fetch_error_to_string(lookup.fetch_error)));
    }

    const SigningKey& key = *lookup.key;
    if (!key.accepts(alg)) {
        return ValidationResult::failure(
            ValidationError::AlgorithmRejected,
            fmt::format("key '{}' cannot verify {}", key.key_id, algorithm_to_string(alg)));
    }

    // STEP 4: Verify signature over "header.payload"
    std::string_view message = token.substr(0, second_dot);
    if (!verify_signature(signature_scheme(alg), algorithm_digest(alg), key.public_key.get(),
                          message, *signature)) {
        return ValidationResult::failure(ValidationError::SignatureInvalid,
                                         fmt::format("signature mismatch for kid '{}'", key.key_id));
    }

    // STEPS 5-7: Claims are trusted only now
    return validate_claims(std::move(*claims));
}

ValidationResult JwtValidator::validate_claims(JwtClaims claims) const {
    // Check issuer (iss): exact match against the configured variants
    if (!claims.iss ||
        std::find(policy_.expected_issuers.begin(), policy_.expected_issuers.end(), *claims.iss) ==
            policy_.expected_issuers.end()) {
        return ValidationResult::failure(ValidationError::IssuerRejected,
                                         fmt::format("issuer '{}'", claims.iss.value_or("")));
    }

    // Check audience (aud): string equal, or array containing the expected value
    auto audience =
        std::find(claims.aud.begin(), claims.aud.end(), policy_.expected_audience);
    if (audience == claims.aud.end()) {
        return ValidationResult::failure(ValidationError::AudienceRejected,
                                         "expected audience not present");
    }

    // Check validity window with symmetric clock skew tolerance
    auto now = std::chrono::time_point_cast<std::chrono::microseconds>(clock_());
    auto skew = policy_.clock_skew;

    if (claims.iat && *claims.iat > now + skew) {
        return ValidationResult::failure(ValidationError::NotYetValid, "issued in the future");
    }
    if (claims.nbf && *claims.nbf > now + skew) {
        return ValidationResult::failure(ValidationError::NotYetValid, "before nbf");
    }
    if (claims.exp < now - skew) {
        return ValidationResult::failure(ValidationError::Expired, "past exp");
    }

    VerifiedClaims verified;
    verified.subject = claims.sub.value_or("");
    verified.issuer = std::move(*claims.iss);
    verified.audience = std::move(*audience);
    verified.expires_at = claims.exp;
    verified.issued_at = claims.iat;
    verified.not_before = claims.nbf;
    verified.jwt_id = std::move(claims.jti);
    verified.raw = std::move(claims.raw);

    return ValidationResult::success(std::move(verified));
}

}  // namespace tokengate::core
