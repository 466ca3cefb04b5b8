#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>

class Logger;

// Pull side of an entry: the sender reads the entry's logical byte
// stream (file contents or a tar stream) window by window.
class EntrySource {
public:
  virtual ~EntrySource() = default;
  // Fills up to `max` bytes; returns 0 only at end of stream.
  virtual std::size_t read(char* out, std::size_t max) = 0;
};

// Push side of an entry on the receiver. Bytes land in a staging
// location and only move to the final path on commit().
class EntrySink {
public:
  virtual ~EntrySink() = default;
  virtual void write(const char* data, std::size_t size) = 0;
  // Flushes and checks the stream is structurally complete.
  virtual void close() = 0;
  virtual void commit(const std::filesystem::path& final_path) = 0;
  virtual void discard() noexcept = 0;
};

class FileSource : public EntrySource {
public:
  explicit FileSource(const std::filesystem::path& path);
  std::size_t read(char* out, std::size_t max) override;

private:
  std::filesystem::path path_;
  std::ifstream in_;
};

class FileSink : public EntrySink {
public:
  explicit FileSink(std::filesystem::path staging_path, Logger* logger = nullptr);
  ~FileSink() override;

  void write(const char* data, std::size_t size) override;
  void close() override;
  void commit(const std::filesystem::path& final_path) override;
  void discard() noexcept override;

private:
  std::filesystem::path staging_path_;
  Logger* logger_;
  std::ofstream out_;
  bool settled_ = false;
};

std::unique_ptr<EntrySource> open_entry_source(const std::filesystem::path& source,
                                               bool is_directory,
                                               Logger* logger = nullptr);
std::unique_ptr<EntrySink> open_entry_sink(const std::filesystem::path& staging_path,
                                           bool is_directory,
                                           Logger* logger = nullptr);

// Moves a staged file or directory into place without ever replacing
// something at final_path; throws ConflictError if the name is taken.
// Copies when a link or rename is not possible (e.g. across filesystems).
void move_into_place(const std::filesystem::path& staging_path,
                     const std::filesystem::path& final_path);
