#pragma once

#include <array>
#include <string>
#include <vector>

enum class Role { Sender, Receiver };

// Literal suffix appended to the secret before hashing.
const char* role_tag(Role role);
const char* role_name(Role role);
Role counterpart(Role role);

using Seed = std::array<unsigned char, 32>;

// SHA-256(secret || role_tag(role)). Throws ConfigError on an empty secret.
Seed derive_seed(const std::string& secret, Role role);

// Lowercase hex of the Ed25519 public key whose private key is `seed`.
std::string node_identity(const Seed& seed);

struct PeerIdentities {
  std::string sender;
  std::string receiver;

  const std::string& for_role(Role role) const {
    return role == Role::Sender ? sender : receiver;
  }
};

PeerIdentities peer_identities(const std::string& secret);

std::vector<unsigned char> sign_with_seed(const Seed& seed, const std::string& message);
bool verify_identity_signature(const std::string& identity,
                               const std::string& message,
                               const std::vector<unsigned char>& signature);
