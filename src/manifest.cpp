#include "manifest.hpp"

#include <limits>
#include <unordered_set>

#include "conflict_guard.hpp"
#include "errors.hpp"
#include "utils.hpp"

using json = nlohmann::json;

uint64_t ManifestEntry::chunk_count() const {
  if(chunk_size == 0) return 0;
  if(size_bytes == 0) return 1;
  return (size_bytes + chunk_size - 1) / chunk_size;
}

uint64_t Manifest::total_bytes() const {
  uint64_t total = 0;
  for(const auto& entry : entries) total += entry.size_bytes;
  return total;
}

json manifest_to_json(const Manifest& manifest) {
  json doc;
  doc["version"] = manifest.protocol_version;
  doc["entries"] = json::array();
  for(const auto& entry : manifest.entries) {
    json item;
    item["path"] = entry.relative_path;
    item["size"] = entry.size_bytes;
    item["is_dir"] = entry.is_directory;
    item["sha256"] = entry.content_digest;
    item["chunk_size"] = entry.chunk_size;
    doc["entries"].push_back(std::move(item));
  }
  return doc;
}

std::string encode_manifest(const Manifest& manifest) {
  return manifest_to_json(manifest).dump();
}

Manifest manifest_from_json(const json& doc, uint32_t supported_version) {
  if(!doc.is_object()) {
    throw ProtocolError("Manifest must be a JSON object, got " + std::string(doc.type_name()));
  }
  auto version_it = doc.find("version");
  if(version_it == doc.end() || !version_it->is_number_unsigned()) {
    throw ProtocolError("Manifest has no protocol version");
  }
  auto version = version_it->get<uint64_t>();
  if(version != supported_version) {
    throw ProtocolError("Version mismatch! Receiver version: " + std::to_string(supported_version) +
                        ", Sender version: " + std::to_string(version));
  }

  auto entries_it = doc.find("entries");
  if(entries_it == doc.end() || !entries_it->is_array()) {
    throw ProtocolError("Manifest 'entries' must be an array");
  }

  Manifest manifest;
  manifest.protocol_version = static_cast<uint32_t>(version);
  manifest.entries.reserve(entries_it->size());
  std::size_t index = 0;
  for(const auto& item : *entries_it) {
    auto where = "manifest entry " + std::to_string(index++);
    if(!item.is_object()) {
      throw ProtocolError(where + " must be an object, got " + std::string(item.type_name()));
    }
    auto field = [&](const char* key) -> const json& {
      auto it = item.find(key);
      if(it == item.end()) throw ProtocolError(where + " is missing '" + key + "'");
      return *it;
    };
    const auto& path = field("path");
    const auto& size = field("size");
    const auto& is_dir = field("is_dir");
    const auto& digest = field("sha256");
    const auto& chunk = field("chunk_size");
    if(!path.is_string() || !size.is_number_unsigned() || !is_dir.is_boolean() ||
       !digest.is_string() || !chunk.is_number_unsigned()) {
      throw ProtocolError(where + " has a field of the wrong type");
    }
    if(chunk.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
      throw ProtocolError(where + " chunk_size does not fit 32 bits");
    }
    ManifestEntry entry;
    entry.relative_path = path.get<std::string>();
    entry.size_bytes = size.get<uint64_t>();
    entry.is_directory = is_dir.get<bool>();
    entry.content_digest = digest.get<std::string>();
    entry.chunk_size = static_cast<uint32_t>(chunk.get<uint64_t>());
    manifest.entries.push_back(std::move(entry));
  }
  validate_manifest(manifest);
  return manifest;
}

Manifest decode_manifest(const std::string& text, uint32_t supported_version) {
  json doc;
  try {
    doc = json::parse(text);
  } catch(const json::parse_error& e) {
    throw ProtocolError(std::string("Malformed manifest JSON: ") + e.what());
  }
  return manifest_from_json(doc, supported_version);
}

void validate_manifest(const Manifest& manifest) {
  std::unordered_set<std::string> seen;
  for(const auto& entry : manifest.entries) {
    std::string reason;
    if(!ConflictGuard::is_safe_relative(entry.relative_path, &reason)) {
      throw ProtocolError("Unsafe manifest path '" + entry.relative_path + "': " + reason,
                          entry.relative_path);
    }
    if(!seen.insert(entry.relative_path).second) {
      throw ProtocolError("Duplicate manifest path '" + entry.relative_path + "'", entry.relative_path);
    }
    if(!is_lower_hex(entry.content_digest, 64)) {
      throw ProtocolError("Malformed sha256 for '" + entry.relative_path + "'", entry.relative_path);
    }
    if(entry.chunk_size == 0) {
      throw ProtocolError("Zero chunk_size for '" + entry.relative_path + "'", entry.relative_path);
    }
  }
  // One entry may not live inside another: the outer one would already
  // occupy the path when the inner one is written.
  for(const auto& entry : manifest.entries) {
    auto slash = entry.relative_path.rfind('/');
    while(slash != std::string::npos) {
      auto ancestor = entry.relative_path.substr(0, slash);
      if(seen.count(ancestor)) {
        throw ProtocolError("Manifest path '" + entry.relative_path + "' is nested under entry '" +
                            ancestor + "'", entry.relative_path);
      }
      slash = ancestor.rfind('/');
    }
  }
}
