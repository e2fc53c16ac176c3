/**
 * @file trust.cpp
 * @brief Implementation of trust relationships
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentid/trust.hpp"
#include "agentid/utilities.hpp"

namespace agentid {

std::string to_string(TrustLevel level) {
    switch (level) {
        case TrustLevel::None:     return "None";
        case TrustLevel::Low:      return "Low";
        case TrustLevel::Medium:   return "Medium";
        case TrustLevel::High:     return "High";
        case TrustLevel::VeryHigh: return "Very High";
        default:                   return "Unknown";
    }
}

// ============================================================================
// Construction
// ============================================================================

TrustRelationship::TrustRelationship(const AgentIdentity& from, const AgentIdentity& to,
                                     TrustLevel level)
    : from_(from)
    , to_(to)
    , level_(level)
    , established_at_(utilities::get_current_timestamp())
    , updated_at_(established_at_)
{
}

TrustResult TrustRelationship::establish(const AgentIdentity& from, const AgentIdentity& to,
                                         TrustLevel level) {
    if (from == to) {
        utilities::log_warn("Rejected trust relationship from " + from.id() + " to itself");
        return ValidationError::self_trust();
    }

    return TrustRelationship(from, to, level);
}

// ============================================================================
// Mutators
// ============================================================================

void TrustRelationship::update_level(TrustLevel level) {
    if (level != level_) {
        utilities::log_info("Trust " + from_.id() + " -> " + to_.id() + ": " +
                            agentid::to_string(level_) + " -> " + agentid::to_string(level));
    }

    level_ = level;
    updated_at_ = utilities::get_current_timestamp();
}

bool TrustRelationship::update_metadata(const std::string& metadata_json) {
    auto normalized = utilities::normalize_json_object(metadata_json);
    if (!normalized) {
        return false;
    }

    metadata_ = *normalized;
    updated_at_ = utilities::get_current_timestamp();
    return true;
}

std::string TrustRelationship::to_string() const {
    return "Trust from " + from_.id() + " to " + to_.id() + ": " + agentid::to_string(level_) +
           " (Updated: " + utilities::format_timestamp(updated_at_) + ")";
}

} // namespace agentid
