/**
 * @file agent_identity_example.cpp
 * @brief Agent identity example - Creating and rejecting identities
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates minimal identity usage:
 * - Create an identity through the handle API
 * - Inspect the identifier, fingerprint and JSON form
 * - Record a verification and a trust relationship
 * - Observe the error raised for an empty identifier
 */

#include "agentid/agent.hpp"
#include "agentid/agent_handle.hpp"
#include "agentid/config.hpp"
#include "agentid/identity_record.hpp"
#include "agentid/trust.hpp"
#include <exception>
#include <iostream>

using namespace agentid;

int main(int argc, char** argv) {
    std::string agent_id = argc >= 2 ? argv[1] : "demo-agent-123";

    if (!config::initialize_logging_from_environment()) {
        std::cerr << "Warning: logging could not be initialized\n";
    }

    std::cout << "\n=== AgentID Identity Example ===\n\n";

    try {
        // Create identity
        AgentHandle agent = AgentHandle::create(agent_id);
        std::cout << "Created agent with ID: " << agent.id() << "\n";
        std::cout << "  Fingerprint: " << agent.identity().fingerprint() << "\n";
        std::cout << "  JSON:        " << agent.identity().to_json() << "\n";

        // Agent record on top of the identity
        Agent record(agent.identity());
        std::cout << "  " << record.to_string() << "\n";
        std::cout << "  Can commerce: " << (record.can_commerce() ? "yes" : "no") << "\n";

        // Verification and trust
        AgentHandle verifier = AgentHandle::create("demo-verifier");
        IdentityRecord identity(record);
        identity.update_verification(VerificationLevel::AgentVerified, verifier.identity());
        std::cout << "  " << identity.to_string() << "\n";

        auto trust = TrustRelationship::establish(verifier.identity(), agent.identity(), TrustLevel::High);
        if (trust) {
            std::cout << "  " << trust.value().to_string() << "\n";
        } else {
            std::cout << "  Trust not established: " << trust.error().message << "\n";
        }

        // Try an invalid identifier
        std::cout << "\nTrying to create agent with invalid ID...\n";
        AgentHandle invalid = AgentHandle::create("");
        std::cout << "Unexpectedly created agent: " << invalid.id() << "\n";
        return 1;

    } catch (const IdentityError& e) {
        std::cout << "Error creating agent (" << to_string(e.kind()) << "): " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nExample completed!\n";
    return 0;
}
