#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Bumped whenever the manifest layout or the per-entry framing changes.
inline constexpr uint32_t kProtocolVersion = 3;

struct ManifestEntry {
  std::string relative_path;   // posix, relative to the destination root
  uint64_t size_bytes = 0;     // uncompressed; tar stream size for directories
  bool is_directory = false;
  std::string content_digest;  // sha256 hex of the uncompressed stream
  uint32_t chunk_size = 0;     // sender window size, informational for the receiver

  uint64_t chunk_count() const;
};

struct Manifest {
  uint32_t protocol_version = kProtocolVersion;
  std::vector<ManifestEntry> entries;

  uint64_t total_bytes() const;
};

nlohmann::json manifest_to_json(const Manifest& manifest);
std::string encode_manifest(const Manifest& manifest);

// Version is checked before anything else. Every failure is a ProtocolError.
Manifest manifest_from_json(const nlohmann::json& doc, uint32_t supported_version = kProtocolVersion);
Manifest decode_manifest(const std::string& text, uint32_t supported_version = kProtocolVersion);

// Unique, safe paths; 64-char lowercase hex digests; non-zero chunk sizes.
void validate_manifest(const Manifest& manifest);
