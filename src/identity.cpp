#include "identity.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

#include "errors.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kEd25519KeySize = 32;
constexpr std::size_t kEd25519SignatureSize = 64;

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

PkeyPtr private_key_from_seed(const Seed& seed) {
  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
  if(!key) throw std::runtime_error("Unable to build Ed25519 key from seed");
  return key;
}

} // namespace

const char* role_tag(Role role) {
  return role == Role::Sender ? "sender" : "receiver";
}

const char* role_name(Role role) {
  return role == Role::Sender ? "Sender" : "Receiver";
}

Role counterpart(Role role) {
  return role == Role::Sender ? Role::Receiver : Role::Sender;
}

Seed derive_seed(const std::string& secret, Role role) {
  if(secret.empty()) {
    throw ConfigError("Shared secret is empty");
  }
  auto digest = sha256_bytes(secret + role_tag(role));
  Seed seed{};
  std::copy(digest.begin(), digest.end(), seed.begin());
  return seed;
}

std::string node_identity(const Seed& seed) {
  auto key = private_key_from_seed(seed);
  unsigned char public_key[kEd25519KeySize];
  std::size_t length = sizeof(public_key);
  if(EVP_PKEY_get_raw_public_key(key.get(), public_key, &length) != 1 || length != kEd25519KeySize) {
    throw std::runtime_error("Unable to extract Ed25519 public key");
  }
  return hex_from_bytes(public_key, length);
}

PeerIdentities peer_identities(const std::string& secret) {
  PeerIdentities ids;
  ids.sender = node_identity(derive_seed(secret, Role::Sender));
  ids.receiver = node_identity(derive_seed(secret, Role::Receiver));
  return ids;
}

std::vector<unsigned char> sign_with_seed(const Seed& seed, const std::string& message) {
  auto key = private_key_from_seed(seed);
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if(!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    throw std::runtime_error("Unable to initialise Ed25519 signing");
  }
  std::vector<unsigned char> signature(kEd25519SignatureSize);
  std::size_t length = signature.size();
  if(EVP_DigestSign(ctx.get(), signature.data(), &length,
                    reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1) {
    throw std::runtime_error("Ed25519 signing failed");
  }
  signature.resize(length);
  return signature;
}

bool verify_identity_signature(const std::string& identity,
                               const std::string& message,
                               const std::vector<unsigned char>& signature) {
  auto public_key = bytes_from_hex(identity);
  if(!public_key || public_key->size() != kEd25519KeySize) return false;
  PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                          public_key->data(), public_key->size()));
  if(!key) return false;
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if(!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          reinterpret_cast<const unsigned char*>(message.data()),
                          message.size()) == 1;
}
