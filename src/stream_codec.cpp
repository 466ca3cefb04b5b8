#include "stream_codec.hpp"

#include <array>
#include <stdexcept>
#include <string>

#include "errors.hpp"

namespace {

// Raw deflate: no gzip header or CRC.
constexpr int kRawDeflateWindowBits = -15;
constexpr std::size_t kOutputStep = 64 * 1024;

std::string zlib_message(const z_stream& stream, int code) {
  if(stream.msg) return stream.msg;
  return "zlib error " + std::to_string(code);
}

} // namespace

ChunkCompressor::ChunkCompressor(int level) {
  int rc = deflateInit2(&stream_, level, Z_DEFLATED, kRawDeflateWindowBits, 8, Z_DEFAULT_STRATEGY);
  if(rc != Z_OK) {
    throw std::runtime_error("deflateInit2 failed: " + zlib_message(stream_, rc));
  }
}

ChunkCompressor::~ChunkCompressor() {
  deflateEnd(&stream_);
}

std::vector<char> ChunkCompressor::compress(const char* data, std::size_t size) {
  return run(data, size, Z_SYNC_FLUSH);
}

std::vector<char> ChunkCompressor::finish() {
  return run(nullptr, 0, Z_FINISH);
}

std::vector<char> ChunkCompressor::run(const char* data, std::size_t size, int flush) {
  if(finished_) throw std::logic_error("ChunkCompressor used after finish");

  std::vector<char> out;
  stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
  stream_.avail_in = static_cast<uInt>(size);
  while(true) {
    std::size_t used = out.size();
    out.resize(used + kOutputStep);
    stream_.next_out = reinterpret_cast<Bytef*>(out.data() + used);
    stream_.avail_out = static_cast<uInt>(kOutputStep);
    int rc = deflate(&stream_, flush);
    out.resize(used + (kOutputStep - stream_.avail_out));
    if(rc == Z_STREAM_ERROR) {
      throw std::runtime_error("deflate failed: " + zlib_message(stream_, rc));
    }
    if(flush == Z_FINISH) {
      if(rc == Z_STREAM_END) {
        finished_ = true;
        break;
      }
      continue;
    }
    // Z_BUF_ERROR only means there was nothing left to do.
    if(stream_.avail_out != 0 || rc == Z_BUF_ERROR) break;
  }
  return out;
}

ChunkDecompressor::ChunkDecompressor() {
  int rc = inflateInit2(&stream_, kRawDeflateWindowBits);
  if(rc != Z_OK) {
    throw std::runtime_error("inflateInit2 failed: " + zlib_message(stream_, rc));
  }
}

ChunkDecompressor::~ChunkDecompressor() {
  inflateEnd(&stream_);
}

void ChunkDecompressor::feed(const char* data, std::size_t size, const Sink& sink) {
  if(size == 0) return;
  if(finished_) {
    throw StreamCorruptError("Compressed data continues past end of stream");
  }

  std::array<char, kOutputStep> buffer;
  stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
  stream_.avail_in = static_cast<uInt>(size);
  while(true) {
    stream_.next_out = reinterpret_cast<Bytef*>(buffer.data());
    stream_.avail_out = static_cast<uInt>(buffer.size());
    int rc = inflate(&stream_, Z_NO_FLUSH);
    switch(rc) {
      case Z_NEED_DICT:
      case Z_DATA_ERROR:
      case Z_MEM_ERROR:
      case Z_STREAM_ERROR:
        throw StreamCorruptError("Decompression failed: " + zlib_message(stream_, rc));
      default:
        break;
    }
    std::size_t produced = buffer.size() - stream_.avail_out;
    if(produced > 0 && sink) sink(buffer.data(), produced);

    if(rc == Z_STREAM_END) {
      finished_ = true;
      if(stream_.avail_in != 0) {
        throw StreamCorruptError("Compressed data continues past end of stream");
      }
      return;
    }
    if(rc == Z_BUF_ERROR) return;
    if(stream_.avail_in == 0 && stream_.avail_out != 0) return;
  }
}
