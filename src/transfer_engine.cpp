#include "transfer_engine.hpp"

#include <vector>

#include "entry_io.hpp"
#include "errors.hpp"
#include "integrity.hpp"
#include "log.hpp"
#include "stream_codec.hpp"
#include "transport.hpp"
#include "utils.hpp"

namespace {

std::size_t fill_window(EntrySource& source, char* window, std::size_t capacity) {
  std::size_t filled = 0;
  while(filled < capacity) {
    auto got = source.read(window + filled, capacity - filled);
    if(got == 0) break;
    filled += got;
  }
  return filled;
}

void send_block(Connection& connection, std::vector<char> block, EntryStats& stats) {
  stats.wire_bytes += block.size();
  ++stats.blocks;
  send_message(connection, std::move(block));
}

} // namespace

EntryStats send_entry(Connection& connection,
                      const ManifestEntry& entry,
                      EntrySource& source,
                      int compression_level,
                      const ProgressCallback& progress,
                      Logger* logger) {
  if(entry.chunk_size == 0) {
    throw ConfigError("Chunk size must be at least one byte", entry.relative_path);
  }

  EntryStats stats;
  try {
    ChunkCompressor compressor(compression_level);
    IntegrityVerifier digest;
    std::vector<char> window(entry.chunk_size);
    uint64_t chunk_index = 0;

    while(true) {
      auto filled = fill_window(source, window.data(), window.size());
      // A zero-byte entry still goes through the compressor once.
      if(filled == 0 && chunk_index > 0) break;

      digest.update(window.data(), filled);
      auto block = compressor.compress(window.data(), filled);
      if(!block.empty()) send_block(connection, std::move(block), stats);

      stats.raw_bytes += filled;
      if(progress) progress(entry, filled, chunk_index);
      ++chunk_index;
      if(filled < window.size()) break;
    }

    auto trailer = compressor.finish();
    if(!trailer.empty()) send_block(connection, std::move(trailer), stats);
    send_message(connection, Bytes{});

    stats.digest = digest.finalize();
  } catch(TransferError& e) {
    if(e.entry().empty()) e.set_entry(entry.relative_path);
    throw;
  }

  if(stats.raw_bytes != entry.size_bytes) {
    throw IntegrityError("Source changed while sending: streamed " + std::to_string(stats.raw_bytes) +
                         " bytes, manifest declared " + std::to_string(entry.size_bytes),
                         entry.relative_path);
  }
  if(stats.digest != entry.content_digest) {
    throw IntegrityError("Source changed while sending: digest " + stats.digest +
                         " differs from manifest " + entry.content_digest,
                         entry.relative_path);
  }
  if(logger) {
    logger->debug("Sent {} ({} raw, {} on the wire, {} blocks)", entry.relative_path,
                  format_size(stats.raw_bytes), format_size(stats.wire_bytes), stats.blocks);
  }
  return stats;
}

EntryStats receive_entry(Connection& connection,
                         const ManifestEntry& entry,
                         EntrySink& sink,
                         const ProgressCallback& progress,
                         Logger* logger) {
  EntryStats stats;
  try {
    ChunkDecompressor inflater;
    IntegrityVerifier digest;
    uint64_t chunk_index = 0;

    auto deliver = [&](const char* data, std::size_t size) {
      if(stats.raw_bytes + size > entry.size_bytes) {
        throw IntegrityError("Received more than the declared " + std::to_string(entry.size_bytes) +
                             " bytes", entry.relative_path);
      }
      digest.update(data, size);
      sink.write(data, size);
      stats.raw_bytes += size;
    };

    while(true) {
      auto block = receive_message(connection);
      if(block.empty()) break;
      stats.wire_bytes += block.size();
      ++stats.blocks;

      auto before = stats.raw_bytes;
      inflater.feed(block.data(), block.size(), deliver);
      if(progress && stats.raw_bytes > before) {
        progress(entry, stats.raw_bytes - before, chunk_index);
      }
      ++chunk_index;
    }

    if(!inflater.finished()) {
      throw StreamCorruptError("Entry ended before the compressed stream was complete",
                               entry.relative_path);
    }
    sink.close();
    stats.digest = digest.finalize();
  } catch(TransferError& e) {
    if(e.entry().empty()) e.set_entry(entry.relative_path);
    throw;
  }

  if(stats.raw_bytes != entry.size_bytes) {
    throw IntegrityError("Size mismatch: expected " + std::to_string(entry.size_bytes) +
                         " bytes, received " + std::to_string(stats.raw_bytes),
                         entry.relative_path);
  }
  if(stats.digest != entry.content_digest) {
    throw IntegrityError("Hash mismatch: expected " + entry.content_digest +
                         ", received " + stats.digest, entry.relative_path);
  }
  if(logger) {
    logger->debug("Received {} ({} raw, {} on the wire, {} blocks)", entry.relative_path,
                  format_size(stats.raw_bytes), format_size(stats.wire_bytes), stats.blocks);
  }
  return stats;
}
