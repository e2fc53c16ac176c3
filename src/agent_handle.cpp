/**
 * @file agent_handle.cpp
 * @brief Implementation of the host-facing identity handle
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentid/agent_handle.hpp"
#include "agentid/utilities.hpp"

namespace agentid {

AgentHandle::AgentHandle(const AgentIdentity& identity)
    : identity_(std::make_shared<const AgentIdentity>(identity))
{
}

AgentHandle AgentHandle::create(std::string candidate) {
    return from_result(AgentIdentity::construct(std::move(candidate)));
}

AgentHandle AgentHandle::from_result(const IdentityResult& result) {
    if (result.has_error()) {
        const ValidationError& error = result.error();
        utilities::log_warn("Rejected agent identity (" + to_string(error.kind) + "): " +
                            error.message);
        throw IdentityError(error);
    }

    utilities::log_debug("Created agent identity: " + result.value().id());
    return AgentHandle(result.value());
}

} // namespace agentid
