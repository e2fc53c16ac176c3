/**
 * @file agent_identity.hpp
 * @brief Validated, immutable agent identifier
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Defines what a well-formed agent identifier is:
 * - Non-empty character sequence
 * - Stored exactly as given (no trimming or case folding)
 * - Never changes after construction
 */

#pragma once

#include "agentid/result.hpp"
#include "agentid/validation_error.hpp"
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace agentid {

class AgentIdentity;

/// Outcome of building an AgentIdentity
using IdentityResult = Result<AgentIdentity, ValidationError>;

/**
 * @brief AgentIdentity - Immutable identifier of a software agent
 *
 * Only obtainable through construct() or from_json(), so every instance
 * holds a non-empty id. There are no mutating members.
 *
 * Copies are independent values. Moves are copies, so a moved-from
 * identity still satisfies the invariant. Assignment is deleted: an
 * existing identity never takes on another id.
 */
class AgentIdentity {
public:
    AgentIdentity(const AgentIdentity&) = default;
    AgentIdentity& operator=(const AgentIdentity&) = delete;

    /**
     * @brief Validate a candidate identifier and build an identity
     * @param candidate Any character sequence, including empty
     * @return Identity whose id equals candidate, or EmptyIdentifier
     */
    static IdentityResult construct(std::string candidate);

    /**
     * @brief Get agent ID
     * @return Identifier exactly as it was constructed
     */
    const std::string& id() const noexcept { return id_; }

    /**
     * @brief SHA-256 digest of the identifier
     * @return 64 lowercase hex characters, stable across processes
     */
    std::string fingerprint() const;

    // ========================================================================
    // Serialization
    // ========================================================================

    /**
     * @brief Export identity to JSON
     *
     * Never fails. A UTF-8 id is written as {"id":"..."}; any other byte
     * sequence is written hex encoded as {"id_hex":"..."}.
     *
     * @return JSON object text
     */
    std::string to_json() const;

    /**
     * @brief Import identity from JSON
     * @param json JSON object text with a string "id" or "id_hex" member
     * @return Identity, MalformedDocument, or EmptyIdentifier
     */
    static IdentityResult from_json(const std::string& json);

    bool operator==(const AgentIdentity& other) const { return id_ == other.id_; }
    bool operator!=(const AgentIdentity& other) const { return id_ != other.id_; }
    bool operator<(const AgentIdentity& other) const { return id_ < other.id_; }

private:
    /// Agent identifier, never empty
    std::string id_;

    explicit AgentIdentity(std::string id);
};

std::ostream& operator<<(std::ostream& os, const AgentIdentity& identity);

} // namespace agentid

namespace std {

template <>
struct hash<agentid::AgentIdentity> {
    size_t operator()(const agentid::AgentIdentity& identity) const noexcept {
        return hash<string>()(identity.id());
    }
};

} // namespace std
