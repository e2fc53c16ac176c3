/**
 * @file agent.hpp
 * @brief Agent record built on a validated identity
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * An agent pairs its immutable AgentIdentity with mutable state:
 * - Capabilities (commerce, verification, trust management)
 * - Lifecycle status (active, suspended, revoked)
 * - Free-form JSON metadata
 */

#pragma once

#include "agentid/agent_identity.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace agentid {

/**
 * @brief What an agent is permitted to do
 */
struct AgentCapabilities {
    bool can_commerce = true;        ///< May take part in commerce operations
    bool can_verify = false;         ///< May verify other agents
    bool can_manage_trust = false;   ///< May manage trust relationships

    bool operator==(const AgentCapabilities& other) const {
        return can_commerce == other.can_commerce &&
               can_verify == other.can_verify &&
               can_manage_trust == other.can_manage_trust;
    }
    bool operator!=(const AgentCapabilities& other) const { return !(*this == other); }
};

/**
 * @brief Lifecycle status of an agent
 */
enum class AgentStatus {
    Active,
    Suspended,
    Revoked
};

std::string to_string(AgentStatus status);

/**
 * @brief Parse status name ("Active", "Suspended", "Revoked")
 * @return Status, or std::nullopt if unrecognized
 */
std::optional<AgentStatus> agent_status_from_string(const std::string& name);

class Agent;

/// Outcome of building an Agent
using AgentResult = Result<Agent, ValidationError>;

/**
 * @brief Agent - An identified participant with capabilities and status
 *
 * The identity is fixed for the lifetime of the agent; every other
 * field may change and refreshes updated_at when it does.
 */
class Agent {
public:
    /**
     * @brief Create agent with default capabilities
     * @param candidate Identifier, validated by AgentIdentity::construct
     */
    static AgentResult create(std::string candidate);

    /**
     * @brief Create agent with custom capabilities
     */
    static AgentResult create(std::string candidate, const AgentCapabilities& capabilities);

    /**
     * @brief Create agent around an already validated identity
     */
    explicit Agent(AgentIdentity identity, AgentCapabilities capabilities = AgentCapabilities());

    // ========================================================================
    // Accessors
    // ========================================================================

    const AgentIdentity& identity() const { return identity_; }
    const std::string& id() const { return identity_.id(); }
    const AgentCapabilities& capabilities() const { return capabilities_; }
    AgentStatus status() const { return status_; }

    /// Unix timestamp (seconds) of the last change
    uint64_t updated_at() const { return updated_at_; }

    /// JSON object text
    const std::string& metadata() const { return metadata_; }

    // ========================================================================
    // Mutators
    // ========================================================================

    void update_capabilities(const AgentCapabilities& capabilities);

    void update_status(AgentStatus status);

    /**
     * @brief Replace metadata
     * @param metadata_json JSON object text
     * @return false (agent unchanged) if metadata_json is not a JSON object
     */
    bool update_metadata(const std::string& metadata_json);

    // ========================================================================
    // Permission Checks
    // ========================================================================

    /// Capability granted and agent is active
    bool can_commerce() const;
    bool can_verify() const;
    bool can_manage_trust() const;

    // ========================================================================
    // Formatting / Serialization
    // ========================================================================

    /**
     * @brief Human-readable summary
     * @return e.g. "Agent alice (Status: Active, Updated: 2025-11-10T15:30:45Z)"
     */
    std::string to_string() const;

    /**
     * @brief Export agent to JSON
     *
     * Never fails. The identifier is written the way
     * AgentIdentity::to_json() writes it ("id", or "id_hex" for ids that
     * are not UTF-8).
     */
    std::string to_json() const;

    /**
     * @brief Import agent from JSON produced by to_json()
     * @return Agent, MalformedDocument, or EmptyIdentifier. An updated_at
     *         above utilities::MAX_TIMESTAMP is MalformedDocument.
     */
    static AgentResult from_json(const std::string& json);

private:
    AgentIdentity identity_;
    AgentCapabilities capabilities_;
    AgentStatus status_ = AgentStatus::Active;
    uint64_t updated_at_;
    std::string metadata_ = "{}";

    void touch();
};

} // namespace agentid
