/**
 * @file identity_record.cpp
 * @brief Implementation of identity verification records
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentid/identity_record.hpp"
#include "agentid/utilities.hpp"
#include <utility>

namespace agentid {

// ============================================================================
// Level Names
// ============================================================================

std::string to_string(VerificationLevel level) {
    switch (level) {
        case VerificationLevel::Unverified:         return "Unverified";
        case VerificationLevel::SelfVerified:       return "SelfVerified";
        case VerificationLevel::AgentVerified:      return "AgentVerified";
        case VerificationLevel::MultiAgentVerified: return "MultiAgentVerified";
        case VerificationLevel::AuthorityVerified:  return "AuthorityVerified";
        default:                                    return "Unknown";
    }
}

std::optional<VerificationLevel> verification_level_from_string(const std::string& name) {
    if (name == "Unverified")         return VerificationLevel::Unverified;
    if (name == "SelfVerified")       return VerificationLevel::SelfVerified;
    if (name == "AgentVerified")      return VerificationLevel::AgentVerified;
    if (name == "MultiAgentVerified") return VerificationLevel::MultiAgentVerified;
    if (name == "AuthorityVerified")  return VerificationLevel::AuthorityVerified;
    return std::nullopt;
}

// ============================================================================
// IdentityRecord
// ============================================================================

IdentityRecord::IdentityRecord(Agent agent)
    : agent_(std::move(agent))
    , created_at_(utilities::get_current_timestamp())
    , updated_at_(created_at_)
{
}

void IdentityRecord::update_verification(VerificationLevel level,
                                         const std::optional<AgentIdentity>& verified_by) {
    uint64_t now = utilities::get_current_timestamp();

    verification_.level = level;
    verification_.verified_at = now;
    // AgentIdentity is not assignable, so the verifier is rebuilt in place
    verification_.verified_by.reset();
    if (verified_by) {
        verification_.verified_by.emplace(*verified_by);
    }
    updated_at_ = now;

    utilities::log_info("Identity " + agent_.id() + ": verification " + agentid::to_string(level) +
                        (verified_by ? " by " + verified_by->id() : std::string()));
}

bool IdentityRecord::update_metadata(const std::string& metadata_json) {
    auto normalized = utilities::normalize_json_object(metadata_json);
    if (!normalized) {
        return false;
    }

    metadata_ = *normalized;
    updated_at_ = utilities::get_current_timestamp();
    return true;
}

bool IdentityRecord::is_verified() const {
    return verification_.level != VerificationLevel::Unverified;
}

bool IdentityRecord::is_agent_verified() const {
    return verification_.level == VerificationLevel::AgentVerified ||
           verification_.level == VerificationLevel::MultiAgentVerified;
}

bool IdentityRecord::is_authority_verified() const {
    return verification_.level == VerificationLevel::AuthorityVerified;
}

std::string IdentityRecord::to_string() const {
    return "Identity for " + agent_.to_string() +
           " (Verification: " + agentid::to_string(verification_.level) +
           ", Updated: " + utilities::format_timestamp(updated_at_) + ")";
}

} // namespace agentid
