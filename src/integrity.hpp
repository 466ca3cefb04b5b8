#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Running SHA-256 over an entry's uncompressed bytes. The result depends
// only on the byte sequence, never on how it was split into updates.
class IntegrityVerifier {
public:
  IntegrityVerifier();

  void reset();
  void update(const char* data, std::size_t size);
  void update(const std::string& data) { update(data.data(), data.size()); }

  // Lowercase hex digest. The verifier must be reset() before reuse.
  std::string finalize();

  uint64_t bytes_seen() const { return bytes_seen_; }

  static std::string digest_of(const std::string& data);

private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  uint64_t bytes_seen_ = 0;
  bool finalized_ = false;
};
