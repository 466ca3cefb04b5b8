#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "manifest.hpp"

class Connection;
class EntrySink;
class EntrySource;
class Logger;

// Called after every window (sender) or block (receiver) with the number
// of uncompressed bytes that just moved.
using ProgressCallback = std::function<void(const ManifestEntry& entry,
                                            uint64_t delta_bytes,
                                            uint64_t chunk_index)>;

struct EntryStats {
  uint64_t raw_bytes = 0;
  uint64_t wire_bytes = 0;
  uint64_t blocks = 0;
  std::string digest;
};

// Streams one entry: windows of entry.chunk_size bytes are compressed,
// hashed and sent one block per message, followed by the compressor
// trailer and a zero-length end-of-entry message. Throws IntegrityError
// if the source no longer matches the manifest.
EntryStats send_entry(Connection& connection,
                      const ManifestEntry& entry,
                      EntrySource& source,
                      int compression_level,
                      const ProgressCallback& progress = {},
                      Logger* logger = nullptr);

// Receives blocks until the end-of-entry message, inflating into `sink`.
// The sink is closed but not committed; that is the caller's decision
// once the digest has been checked here.
EntryStats receive_entry(Connection& connection,
                         const ManifestEntry& entry,
                         EntrySink& sink,
                         const ProgressCallback& progress = {},
                         Logger* logger = nullptr);
