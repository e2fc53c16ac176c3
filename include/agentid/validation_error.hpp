/**
 * @file validation_error.hpp
 * @brief Typed validation failures for agent identifiers
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace agentid {

/**
 * @brief Reasons a candidate identity or record can be rejected
 */
enum class ValidationErrorKind {
    EmptyIdentifier,         ///< Candidate identifier has no characters
    MalformedDocument,       ///< Serialized identity could not be decoded
    SelfTrust                ///< Trust relationship from an agent to itself
};

/**
 * @brief Validation failure with a human-readable description
 */
struct ValidationError {
    ValidationErrorKind kind;   ///< Which rule was violated
    std::string message;        ///< Description of the violated rule

    /**
     * @brief Failure for an empty candidate identifier
     */
    static ValidationError empty_identifier();

    /**
     * @brief Failure for an undecodable identity document
     * @param detail What was wrong with the document
     */
    static ValidationError malformed_document(const std::string& detail);

    static ValidationError self_trust();

    bool operator==(const ValidationError& other) const {
        return kind == other.kind && message == other.message;
    }
    bool operator!=(const ValidationError& other) const { return !(*this == other); }
};

/**
 * @brief Stable name of an error kind (e.g. "EmptyIdentifier")
 */
std::string to_string(ValidationErrorKind kind);

/**
 * @brief Exception raised at the binding boundary for a rejected identity
 *
 * Derives from std::invalid_argument so callers may catch it broadly or
 * narrowly. The carried ValidationError keeps the failure cause.
 */
class IdentityError : public std::invalid_argument {
public:
    explicit IdentityError(const ValidationError& error);

    /**
     * @brief The validation failure that caused this exception
     */
    const ValidationError& error() const noexcept { return error_; }

    ValidationErrorKind kind() const noexcept { return error_.kind; }

private:
    ValidationError error_;
};

} // namespace agentid
