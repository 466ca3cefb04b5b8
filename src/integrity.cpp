#include "integrity.hpp"

#include <stdexcept>

#include "utils.hpp"

IntegrityVerifier::IntegrityVerifier()
  : ctx_(EVP_MD_CTX_new()) {
  if(!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
  reset();
}

void IntegrityVerifier::reset() {
  if(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
  bytes_seen_ = 0;
  finalized_ = false;
}

void IntegrityVerifier::update(const char* data, std::size_t size) {
  if(finalized_) throw std::logic_error("IntegrityVerifier updated after finalize");
  if(size == 0) return;
  if(EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  bytes_seen_ += size;
}

std::string IntegrityVerifier::finalize() {
  if(finalized_) throw std::logic_error("IntegrityVerifier finalized twice");
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  finalized_ = true;
  return hex_from_bytes(digest, length);
}

std::string IntegrityVerifier::digest_of(const std::string& data) {
  IntegrityVerifier verifier;
  verifier.update(data);
  return verifier.finalize();
}
