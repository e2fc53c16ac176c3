/**
 * @file trust.hpp
 * @brief Directed trust between two agents
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "agentid/agent_identity.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace agentid {

/**
 * @brief Trust levels, ordered from None to VeryHigh
 */
enum class TrustLevel {
    None,
    Low,
    Medium,
    High,
    VeryHigh
};

/**
 * @brief Display name of a trust level ("None", ..., "Very High")
 */
std::string to_string(TrustLevel level);

class TrustRelationship;

/// Outcome of establishing a TrustRelationship
using TrustResult = Result<TrustRelationship, ValidationError>;

/**
 * @brief TrustRelationship - Trust one agent places in another
 *
 * The two endpoints are fixed and always distinct; the level and
 * metadata may change and refresh updated_at when they do.
 */
class TrustRelationship {
public:
    /**
     * @brief Establish trust from one agent in another
     * @return Relationship, or SelfTrust if from == to
     */
    static TrustResult establish(const AgentIdentity& from, const AgentIdentity& to,
                                 TrustLevel level);

    const AgentIdentity& from() const { return from_; }
    const AgentIdentity& to() const { return to_; }
    TrustLevel level() const { return level_; }
    uint64_t established_at() const { return established_at_; }
    uint64_t updated_at() const { return updated_at_; }

    /// JSON object text
    const std::string& metadata() const { return metadata_; }

    void update_level(TrustLevel level);

    /**
     * @brief Replace metadata
     * @return false (relationship unchanged) if metadata_json is not a JSON object
     */
    bool update_metadata(const std::string& metadata_json);

    /// Level is above None
    bool is_active() const { return level_ != TrustLevel::None; }

    bool is_at_least(TrustLevel level) const { return level_ >= level; }

    /**
     * @brief Human-readable summary
     * @return e.g. "Trust from alice to bob: High (Updated: 2025-11-10T15:30:45Z)"
     */
    std::string to_string() const;

private:
    AgentIdentity from_;
    AgentIdentity to_;
    TrustLevel level_;
    uint64_t established_at_;
    uint64_t updated_at_;
    std::string metadata_ = "{}";

    TrustRelationship(const AgentIdentity& from, const AgentIdentity& to, TrustLevel level);
};

} // namespace agentid
