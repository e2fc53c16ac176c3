/**
 * @file agent_handle.hpp
 * @brief Host-facing handle around an AgentIdentity
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Adapter used by language bindings:
 * - Forwards construction to AgentIdentity::construct unchanged
 * - Raises IdentityError instead of returning a failed result
 * - Exposes the identifier read-only
 */

#pragma once

#include "agentid/agent_identity.hpp"
#include <memory>
#include <string>

namespace agentid {

/**
 * @brief AgentHandle - Read-only view of a validated identity
 *
 * Holds an immutable shared reference, so copies are cheap and a handle
 * can be read from many threads. A handle always wraps a valid identity.
 */
class AgentHandle {
public:
    /**
     * @brief Create handle for a candidate identifier
     * @param candidate Identifier passed through unmodified
     * @return Handle wrapping the new identity
     * @throws IdentityError if the candidate is rejected
     */
    static AgentHandle create(std::string candidate);

    /**
     * @brief Wrap an existing identity
     */
    explicit AgentHandle(const AgentIdentity& identity);

    /**
     * @brief Get agent ID
     */
    const std::string& id() const noexcept { return identity_->id(); }

    /**
     * @brief Underlying identity
     */
    const AgentIdentity& identity() const noexcept { return *identity_; }

    /**
     * @brief Raise IdentityError for a failed result, otherwise wrap its value
     * @throws IdentityError
     */
    static AgentHandle from_result(const IdentityResult& result);

    bool operator==(const AgentHandle& other) const { return identity() == other.identity(); }
    bool operator!=(const AgentHandle& other) const { return !(*this == other); }

private:
    std::shared_ptr<const AgentIdentity> identity_;
};

} // namespace agentid
