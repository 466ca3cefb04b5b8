#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "entry_io.hpp"

class Logger;

inline constexpr std::size_t kTarBlockSize = 512;

// Produces a ustar stream for a directory tree on demand. Only the list
// of members is gathered up front; file contents are read as the stream
// is consumed. Member names are relative to the directory itself and
// sorted, so two passes over an unchanged tree yield identical bytes.
class TarSource : public EntrySource {
public:
  explicit TarSource(std::filesystem::path directory, Logger* logger = nullptr);

  std::size_t read(char* out, std::size_t max) override;

private:
  struct Member {
    std::filesystem::path full_path;
    std::string name;
    bool is_directory = false;
    uint64_t size = 0;
    uint32_t mode = 0;
    int64_t mtime = 0;
  };

  void collect(Logger* logger);
  bool start_next();

  std::filesystem::path directory_;
  std::vector<Member> members_;
  std::size_t next_member_ = 0;
  std::string pending_;
  std::size_t pending_offset_ = 0;
  std::ifstream file_;
  std::filesystem::path file_path_;
  uint64_t file_remaining_ = 0;
  uint64_t file_padding_ = 0;
  bool trailer_queued_ = false;
};

// Streaming ustar reader that materializes members under `root` as the
// bytes arrive. Understands GNU long names and skips pax headers. Links
// and special files are skipped, never created.
class TarExtractor {
public:
  explicit TarExtractor(std::filesystem::path root, Logger* logger = nullptr);
  ~TarExtractor();

  TarExtractor(const TarExtractor&) = delete;
  TarExtractor& operator=(const TarExtractor&) = delete;

  void write(const char* data, std::size_t size);
  // Throws StreamCorruptError unless the end-of-archive marker was seen.
  void finish();
  void abandon() noexcept;

private:
  enum class State { Header, FileData, LongName, SkipData, Padding, End };

  void on_header();
  void begin_data(State state, uint64_t size);
  void end_data();
  std::filesystem::path member_path(std::string name) const;

  std::filesystem::path root_;
  Logger* logger_;
  State state_ = State::Header;
  std::array<char, kTarBlockSize> block_{};
  std::size_t block_fill_ = 0;
  uint64_t remaining_ = 0;
  uint64_t padding_ = 0;
  int zero_blocks_ = 0;
  std::ofstream out_;
  std::filesystem::path out_path_;
  uint32_t out_mode_ = 0;
  std::string long_name_buffer_;
  std::string long_name_;
};

// Builds the header block(s) for one member, including a GNU long-name
// record when the name does not fit the ustar name/prefix fields.
std::string tar_member_header(const std::string& name, char type, uint64_t size,
                              uint32_t mode, int64_t mtime);
