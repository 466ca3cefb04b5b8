#pragma once

#include <zlib.h>

#include <cstddef>
#include <functional>
#include <vector>

// Entry-scoped raw deflate stream. Each window is flushed to a byte boundary so
// the receiver can inflate block by block, while the deflate dictionary
// carries over from one window to the next.
class ChunkCompressor {
public:
  explicit ChunkCompressor(int level = Z_DEFAULT_COMPRESSION);
  ~ChunkCompressor();

  ChunkCompressor(const ChunkCompressor&) = delete;
  ChunkCompressor& operator=(const ChunkCompressor&) = delete;

  std::vector<char> compress(const char* data, std::size_t size);
  // Emits the final deflate block.
  std::vector<char> finish();

private:
  std::vector<char> run(const char* data, std::size_t size, int flush);

  z_stream stream_{};
  bool finished_ = false;
};

class ChunkDecompressor {
public:
  using Sink = std::function<void(const char* data, std::size_t size)>;

  ChunkDecompressor();
  ~ChunkDecompressor();

  ChunkDecompressor(const ChunkDecompressor&) = delete;
  ChunkDecompressor& operator=(const ChunkDecompressor&) = delete;

  // Inflates one compressed block and hands decompressed bytes to `sink`
  // as they are produced. Throws StreamCorruptError on malformed input.
  void feed(const char* data, std::size_t size, const Sink& sink);

  bool finished() const { return finished_; }

private:
  z_stream stream_{};
  bool finished_ = false;
};
