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

// tokengate JWT Validation - Header
// RFC 7519 bearer token validation with RS*/PS*/ES* signatures

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "algorithm.hpp"
#include "key_source.hpp"

namespace tokengate::core {

/// Largest token accepted before any decoding (16 KiB)
constexpr size_t MAX_TOKEN_SIZE = 16 * 1024;

/// RFC 7519 NumericDate, kept at microsecond precision
using NumericDate = std::chrono::sys_time<std::chrono::microseconds>;

/// Wall clock used for temporal checks (injectable for tests)
using Clock = std::function<std::chrono::system_clock::time_point()>;

/// JWT header (decoded from first part)
struct JwtHeader {
    std::string alg;                        // Declared algorithm, verbatim
    std::optional<JwtAlgorithm> algorithm;  // nullopt if not a supported algorithm
    std::string type;                       // Usually "JWT"
    std::optional<std::string> key_id;      // kid used to select the signing key

    /// nullopt unless json is an object with a string "alg"
    [[nodiscard]] static std::optional<JwtHeader> parse(std::string_view json);
};

/// JWT claims (decoded from payload, not yet trusted)
struct JwtClaims {
    // Standard claims (RFC 7519)
    std::optional<std::string> sub;       // Subject
    std::optional<std::string> iss;       // Issuer
    std::vector<std::string> aud;         // Audience (string form becomes one element)
    NumericDate exp;                      // Expiration time (required)
    std::optional<NumericDate> iat;       // Issued at
    std::optional<NumericDate> nbf;       // Not before
    std::optional<std::string> jti;       // JWT ID

    nlohmann::json raw;  // Full payload object

    /// nullopt if the payload is not an object or a registered claim has the wrong type
    [[nodiscard]] static std::optional<JwtClaims> parse(std::string_view json);
};

/// Convert a JSON number to a NumericDate (fractional seconds allowed)
[[nodiscard]] std::optional<NumericDate> parse_numeric_date(const nlohmann::json& value);

/// Claims of a token that passed every check. Built fresh for each validation.
struct VerifiedClaims {
    std::string subject;                  // Empty if the token has no "sub"
    std::string issuer;
    std::string audience;                 // The audience value that matched the policy
    NumericDate expires_at;
    std::optional<NumericDate> issued_at;
    std::optional<NumericDate> not_before;
    std::optional<std::string> jwt_id;

    nlohmann::json raw;  // Every payload claim, verbatim (upn, oid, scp, roles, ...)

    bool operator==(const VerifiedClaims&) const = default;
};

/// Operator trust configuration. Immutable for the validator's lifetime.
struct TrustPolicy {
    std::vector<std::string> expected_issuers;     // Exact issuer strings accepted
    std::string expected_audience;                 // Exact audience required
    std::vector<JwtAlgorithm> allowed_algorithms;  // "none" is never honoured
    std::chrono::microseconds clock_skew{0};       // Symmetric tolerance for time claims

    [[nodiscard]] bool allows(JwtAlgorithm alg) const noexcept;
};

/// Why a token was rejected
enum class ValidationError {
    Malformed,          // Not a structurally valid JWS compact token
    AlgorithmRejected,  // "none", unknown, not allowed, or not usable with the key
    KeyUnresolvable,    // No kid, unknown kid, or key set unavailable
    SignatureInvalid,   // Signature does not verify
    IssuerRejected,
    AudienceRejected,
    Expired,
    NotYetValid         // iat or nbf in the future
};

[[nodiscard]] std::string_view validation_error_to_string(ValidationError error) noexcept;

/// JWT validation result
struct ValidationResult {
    bool valid = false;
    VerifiedClaims claims;
    ValidationError error = ValidationError::Malformed;
    std::string detail;  // Human-readable reason for logs, never sent to clients

    [[nodiscard]] static ValidationResult success(VerifiedClaims claims) {
        return {true, std::move(claims), ValidationError::Malformed, ""};
    }

    [[nodiscard]] static ValidationResult failure(ValidationError error, std::string detail) {
        return {false, {}, error, std::move(detail)};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// JWT validator. Stateless apart from its key source and clock, safe to share
/// across threads.
class JwtValidator {
public:
    /// An empty clock means std::chrono::system_clock::now
    JwtValidator(TrustPolicy policy, std::shared_ptr<KeySource> keys, Clock clock = nullptr);
    ~JwtValidator() = default;

    // Non-copyable, movable
    JwtValidator(const JwtValidator&) = delete;
    JwtValidator& operator=(const JwtValidator&) = delete;
    JwtValidator(JwtValidator&&) noexcept = default;
    JwtValidator& operator=(JwtValidator&&) noexcept = default;

    /// Validate a compact-serialized token (without the "Bearer " prefix)
    [[nodiscard]] ValidationResult validate(std::string_view token) const;

    [[nodiscard]] const TrustPolicy& policy() const noexcept { return policy_; }

private:
    [[nodiscard]] ValidationResult validate_token(std::string_view token) const;

    /// Issuer, audience and validity window (after the signature is proven)
    [[nodiscard]] ValidationResult validate_claims(JwtClaims claims) const;

    TrustPolicy policy_;
    std::shared_ptr<KeySource> keys_;
    Clock clock_;
};

}  // namespace tokengate::core
