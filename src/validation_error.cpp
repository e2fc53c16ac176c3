/**
 * @file validation_error.cpp
 * @brief Implementation of identity validation errors
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentid/validation_error.hpp"

namespace agentid {

ValidationError ValidationError::empty_identifier() {
    return ValidationError{ValidationErrorKind::EmptyIdentifier,
                           "identifier must not be empty"};
}

ValidationError ValidationError::malformed_document(const std::string& detail) {
    return ValidationError{ValidationErrorKind::MalformedDocument,
                           "malformed identity document: " + detail};
}

ValidationError ValidationError::self_trust() {
    return ValidationError{ValidationErrorKind::SelfTrust,
                           "cannot establish trust with self"};
}

std::string to_string(ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::EmptyIdentifier:   return "EmptyIdentifier";
        case ValidationErrorKind::MalformedDocument: return "MalformedDocument";
        case ValidationErrorKind::SelfTrust:         return "SelfTrust";
        default:                                     return "Unknown";
    }
}

IdentityError::IdentityError(const ValidationError& error)
    : std::invalid_argument("Invalid agent identifier: " + error.message)
    , error_(error)
{
}

} // namespace agentid
