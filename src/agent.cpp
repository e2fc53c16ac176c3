/**
 * @file agent.cpp
 * @brief Implementation of agent records
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentid/agent.hpp"
#include "agentid/utilities.hpp"
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace agentid {

// ============================================================================
// Status Names
// ============================================================================

std::string to_string(AgentStatus status) {
    switch (status) {
        case AgentStatus::Active:    return "Active";
        case AgentStatus::Suspended: return "Suspended";
        case AgentStatus::Revoked:   return "Revoked";
        default:                     return "Unknown";
    }
}

std::optional<AgentStatus> agent_status_from_string(const std::string& name) {
    if (name == "Active")    return AgentStatus::Active;
    if (name == "Suspended") return AgentStatus::Suspended;
    if (name == "Revoked")   return AgentStatus::Revoked;
    return std::nullopt;
}

// ============================================================================
// Construction
// ============================================================================

Agent::Agent(AgentIdentity identity, AgentCapabilities capabilities)
    : identity_(std::move(identity))
    , capabilities_(capabilities)
    , updated_at_(utilities::get_current_timestamp())
{
}

AgentResult Agent::create(std::string candidate) {
    return create(std::move(candidate), AgentCapabilities());
}

AgentResult Agent::create(std::string candidate, const AgentCapabilities& capabilities) {
    auto identity = AgentIdentity::construct(std::move(candidate));
    if (!identity) {
        return identity.error();
    }

    return Agent(identity.value(), capabilities);
}

// ============================================================================
// Mutators
// ============================================================================

void Agent::touch() {
    updated_at_ = utilities::get_current_timestamp();
}

void Agent::update_capabilities(const AgentCapabilities& capabilities) {
    capabilities_ = capabilities;
    touch();
}

void Agent::update_status(AgentStatus status) {
    if (status != status_) {
        utilities::log_info("Agent " + id() + ": status " + agentid::to_string(status_) +
                            " -> " + agentid::to_string(status));
    }

    status_ = status;
    touch();
}

bool Agent::update_metadata(const std::string& metadata_json) {
    auto normalized = utilities::normalize_json_object(metadata_json);

    if (!normalized) {
        utilities::log_warn("Agent " + id() + ": rejected metadata that is not a JSON object");
        return false;
    }

    metadata_ = *normalized;
    touch();
    return true;
}

// ============================================================================
// Permission Checks
// ============================================================================

bool Agent::can_commerce() const {
    return capabilities_.can_commerce && status_ == AgentStatus::Active;
}

bool Agent::can_verify() const {
    return capabilities_.can_verify && status_ == AgentStatus::Active;
}

bool Agent::can_manage_trust() const {
    return capabilities_.can_manage_trust && status_ == AgentStatus::Active;
}

// ============================================================================
// Formatting / Serialization
// ============================================================================

std::string Agent::to_string() const {
    return "Agent " + id() + " (Status: " + agentid::to_string(status_) +
           ", Updated: " + utilities::format_timestamp(updated_at_) + ")";
}

std::string Agent::to_json() const {
    // Identity members ("id" or "id_hex") come from the identity itself
    json j = json::parse(identity_.to_json());
    j["capabilities"] = {
        {"can_commerce", capabilities_.can_commerce},
        {"can_verify", capabilities_.can_verify},
        {"can_manage_trust", capabilities_.can_manage_trust}
    };
    j["status"] = agentid::to_string(status_);
    j["updated_at"] = updated_at_;
    j["metadata"] = json::parse(metadata_);

    return j.dump();
}

AgentResult Agent::from_json(const std::string& json_str) {
    json j = json::parse(json_str, nullptr, false);

    if (j.is_discarded() || !j.is_object()) {
        return ValidationError::malformed_document("expected a JSON object");
    }

    auto identity = AgentIdentity::from_json(json_str);
    if (!identity) {
        return identity.error();
    }

    AgentCapabilities capabilities;
    auto caps_it = j.find("capabilities");
    if (caps_it != j.end()) {
        if (!caps_it->is_object()) {
            return ValidationError::malformed_document("\"capabilities\" must be an object");
        }
        const std::pair<const char*, bool*> flags[] = {
            {"can_commerce", &capabilities.can_commerce},
            {"can_verify", &capabilities.can_verify},
            {"can_manage_trust", &capabilities.can_manage_trust}
        };
        for (const auto& [name, field] : flags) {
            auto it = caps_it->find(name);
            if (it == caps_it->end()) {
                continue;
            }
            if (!it->is_boolean()) {
                return ValidationError::malformed_document(
                    std::string("capability \"") + name + "\" must be a boolean");
            }
            *field = it->get<bool>();
        }
    }

    Agent agent(identity.value(), capabilities);

    auto status_it = j.find("status");
    if (status_it != j.end()) {
        auto status = status_it->is_string()
            ? agent_status_from_string(status_it->get<std::string>())
            : std::nullopt;
        if (!status) {
            return ValidationError::malformed_document("unknown agent status");
        }
        agent.status_ = *status;
    }

    auto meta_it = j.find("metadata");
    if (meta_it != j.end()) {
        if (!meta_it->is_object()) {
            return ValidationError::malformed_document("\"metadata\" must be an object");
        }
        agent.metadata_ = meta_it->dump();
    }

    auto updated_it = j.find("updated_at");
    if (updated_it != j.end()) {
        if (!updated_it->is_number_unsigned()) {
            return ValidationError::malformed_document("\"updated_at\" must be an unsigned integer");
        }
        if (updated_it->get<uint64_t>() > utilities::MAX_TIMESTAMP) {
            return ValidationError::malformed_document("\"updated_at\" is out of range");
        }
        agent.updated_at_ = updated_it->get<uint64_t>();
    }

    return agent;
}

} // namespace agentid
