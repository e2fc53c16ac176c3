/**
 * @file agent_identity.cpp
 * @brief Implementation of agent identity validation
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentid/agent_identity.hpp"
#include "agentid/utilities.hpp"
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace agentid {

// ============================================================================
// Construction
// ============================================================================

AgentIdentity::AgentIdentity(std::string id)
    : id_(std::move(id))
{
}

IdentityResult AgentIdentity::construct(std::string candidate) {
    if (candidate.empty()) {
        return ValidationError::empty_identifier();
    }

    return AgentIdentity(std::move(candidate));
}

// ============================================================================
// Identity Information
// ============================================================================

std::string AgentIdentity::fingerprint() const {
    return utilities::sha256_hex(id_);
}

std::ostream& operator<<(std::ostream& os, const AgentIdentity& identity) {
    return os << identity.id();
}

// ============================================================================
// Serialization
// ============================================================================

std::string AgentIdentity::to_json() const {
    json j;
    if (utilities::is_valid_utf8(id_)) {
        j["id"] = id_;
    } else {
        j["id_hex"] = utilities::bytes_to_hex(id_);
    }
    return j.dump();
}

IdentityResult AgentIdentity::from_json(const std::string& json_str) {
    json j = json::parse(json_str, nullptr, false);

    if (j.is_discarded()) {
        return ValidationError::malformed_document("not valid JSON");
    }
    if (!j.is_object()) {
        return ValidationError::malformed_document("expected a JSON object");
    }

    // Validation of the identifier itself stays in construct()
    auto it = j.find("id");
    if (it != j.end() && it->is_string()) {
        return construct(it->get<std::string>());
    }

    auto hex_it = j.find("id_hex");
    if (hex_it != j.end() && hex_it->is_string()) {
        auto bytes = utilities::hex_to_bytes(hex_it->get<std::string>());
        if (!bytes) {
            return ValidationError::malformed_document("\"id_hex\" is not a hex string");
        }
        return construct(std::move(*bytes));
    }

    return ValidationError::malformed_document("missing string member \"id\"");
}

} // namespace agentid
