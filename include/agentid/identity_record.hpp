/**
 * @file identity_record.hpp
 * @brief Verification state of an agent's identity
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Bookkeeping only: records who vouched for an agent and how strongly.
 * No signatures are checked here.
 */

#pragma once

#include "agentid/agent.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace agentid {

/**
 * @brief How an identity has been verified
 */
enum class VerificationLevel {
    Unverified,            ///< Not verified
    SelfVerified,          ///< Verified by the agent itself
    AgentVerified,         ///< Verified by another agent
    MultiAgentVerified,    ///< Verified by several agents
    AuthorityVerified      ///< Verified by a trusted authority
};

std::string to_string(VerificationLevel level);

/**
 * @brief Parse level name (e.g. "AgentVerified")
 * @return Level, or std::nullopt if unrecognized
 */
std::optional<VerificationLevel> verification_level_from_string(const std::string& name);

/**
 * @brief Latest verification of an identity
 */
struct VerificationStatus {
    VerificationLevel level = VerificationLevel::Unverified;
    std::optional<uint64_t> verified_at;          ///< Unix seconds, unset until verified
    std::optional<AgentIdentity> verified_by;     ///< Verifying agent, if any
};

/**
 * @brief IdentityRecord - An agent together with its verification state
 *
 * Starts unverified. Each call to update_verification replaces the
 * previous verification and refreshes updated_at.
 */
class IdentityRecord {
public:
    explicit IdentityRecord(Agent agent);

    // ========================================================================
    // Accessors
    // ========================================================================

    const Agent& agent() const { return agent_; }
    const VerificationStatus& verification() const { return verification_; }
    uint64_t created_at() const { return created_at_; }
    uint64_t updated_at() const { return updated_at_; }

    /// JSON object text
    const std::string& metadata() const { return metadata_; }

    // ========================================================================
    // Mutators
    // ========================================================================

    /**
     * @brief Record a new verification
     * @param level New verification level
     * @param verified_by Agent that performed the verification, if any
     */
    void update_verification(VerificationLevel level,
                             const std::optional<AgentIdentity>& verified_by = std::nullopt);

    /**
     * @brief Replace metadata
     * @return false (record unchanged) if metadata_json is not a JSON object
     */
    bool update_metadata(const std::string& metadata_json);

    // ========================================================================
    // Verification Checks
    // ========================================================================

    /// Any level other than Unverified
    bool is_verified() const;

    /// AgentVerified or MultiAgentVerified
    bool is_agent_verified() const;

    bool is_authority_verified() const;

    /**
     * @brief Human-readable summary
     * @return e.g. "Identity for Agent alice (...) (Verification: AgentVerified, Updated: ...)"
     */
    std::string to_string() const;

private:
    Agent agent_;
    VerificationStatus verification_;
    uint64_t created_at_;
    uint64_t updated_at_;
    std::string metadata_ = "{}";
};

} // namespace agentid
