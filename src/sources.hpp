#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "manifest.hpp"

class Logger;

// One positional path on the sender, paired with the manifest entry that
// describes it.
struct SendItem {
  std::filesystem::path source;
  ManifestEntry entry;
};

// Name an entry gets on the receiver: the base name, or for "." / ".."
// style paths the name of the directory they point at ("root" for /).
std::string entry_name_for(const std::filesystem::path& source);

// Streams the entry once to learn its exact size and digest. Directories
// are measured through the same tar stream that will be sent.
ManifestEntry describe_entry(const std::filesystem::path& source,
                             const std::string& name,
                             uint32_t chunk_size,
                             Logger* logger = nullptr);

// Throws ConfigError for missing or unsupported sources and for two
// sources that would land on the same entry name.
std::vector<SendItem> prepare_send_items(const std::vector<std::string>& paths,
                                         uint32_t chunk_size,
                                         Logger* logger = nullptr);
