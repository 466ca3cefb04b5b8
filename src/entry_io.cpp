#include "entry_io.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

#include "errors.hpp"

#include "log.hpp"
#include "tar_stream.hpp"

namespace fs = std::filesystem;

FileSource::FileSource(const fs::path& path)
  : path_(path), in_(path, std::ios::binary) {
  if(!in_) {
    throw std::runtime_error("Cannot open " + path.string() + " for reading");
  }
}

std::size_t FileSource::read(char* out, std::size_t max) {
  if(max == 0 || !in_) return 0;
  in_.read(out, static_cast<std::streamsize>(max));
  auto got = static_cast<std::size_t>(in_.gcount());
  if(in_.bad()) {
    throw std::runtime_error("Read error on " + path_.string());
  }
  return got;
}

FileSink::FileSink(fs::path staging_path, Logger* logger)
  : staging_path_(std::move(staging_path)), logger_(logger) {
  std::error_code ec;
  if(fs::exists(fs::symlink_status(staging_path_, ec))) {
    throw std::runtime_error("Staging path already exists: " + staging_path_.string());
  }
  fs::create_directories(staging_path_.parent_path(), ec);
  out_.open(staging_path_, std::ios::binary | std::ios::out | std::ios::trunc);
  if(!out_) {
    throw std::runtime_error("Cannot open staging file: " + staging_path_.string());
  }
}

FileSink::~FileSink() {
  if(!settled_) discard();
}

void FileSink::write(const char* data, std::size_t size) {
  out_.write(data, static_cast<std::streamsize>(size));
  if(!out_) {
    throw std::runtime_error("Write failed on " + staging_path_.string());
  }
}

void FileSink::close() {
  if(!out_.is_open()) return;
  out_.flush();
  bool ok = static_cast<bool>(out_);
  out_.close();
  if(!ok) {
    throw std::runtime_error("Flush failed on " + staging_path_.string());
  }
}

void FileSink::commit(const fs::path& final_path) {
  close();
  move_into_place(staging_path_, final_path);
  settled_ = true;
}

void FileSink::discard() noexcept {
  if(out_.is_open()) out_.close();
  std::error_code ec;
  fs::remove(staging_path_, ec);
  if(ec && logger_) {
    logger_->warn("Unable to remove staging file {}: {}", staging_path_.string(), ec.message());
  }
  settled_ = true;
}

namespace {

class TarSink : public EntrySink {
public:
  TarSink(fs::path staging_dir, Logger* logger)
    : staging_dir_(std::move(staging_dir)), logger_(logger), extractor_(staging_dir_, logger) {}

  ~TarSink() override {
    if(!settled_) discard();
  }

  void write(const char* data, std::size_t size) override {
    extractor_.write(data, size);
  }

  void close() override {
    extractor_.finish();
  }

  void commit(const fs::path& final_path) override {
    move_into_place(staging_dir_, final_path);
    settled_ = true;
  }

  void discard() noexcept override {
    extractor_.abandon();
    std::error_code ec;
    fs::remove_all(staging_dir_, ec);
    if(ec && logger_) {
      logger_->warn("Unable to remove staging directory {}: {}", staging_dir_.string(), ec.message());
    }
    settled_ = true;
  }

private:
  fs::path staging_dir_;
  Logger* logger_;
  TarExtractor extractor_;
  bool settled_ = false;
};

} // namespace

std::unique_ptr<EntrySource> open_entry_source(const fs::path& source,
                                               bool is_directory,
                                               Logger* logger) {
  if(is_directory) return std::make_unique<TarSource>(source, logger);
  return std::make_unique<FileSource>(source);
}

std::unique_ptr<EntrySink> open_entry_sink(const fs::path& staging_path,
                                           bool is_directory,
                                           Logger* logger) {
  if(is_directory) return std::make_unique<TarSink>(staging_path, logger);
  return std::make_unique<FileSink>(staging_path, logger);
}

namespace {

[[noreturn]] void throw_taken(const fs::path& final_path) {
  throw ConflictError("Target appeared before commit: " + final_path.string());
}

[[noreturn]] void throw_move_failed(const fs::path& from, const fs::path& to, const std::error_code& ec) {
  throw std::runtime_error("Failed to move " + from.string() + " to " + to.string() + ": " + ec.message());
}

// link() refuses an existing name, so the final path is never replaced.
void move_file_exclusive(const fs::path& staging_path, const fs::path& final_path) {
  std::error_code ec;
  if(::link(staging_path.c_str(), final_path.c_str()) == 0) {
    // A leftover staging name goes with the staging area.
    fs::remove(staging_path, ec);
    return;
  }
  if(errno == EEXIST) throw_taken(final_path);

  // No hard links here (other filesystem, or not supported): copy without overwrite.
  fs::copy_file(staging_path, final_path, fs::copy_options::none, ec);
  if(ec == std::errc::file_exists) throw_taken(final_path);
  if(ec) throw_move_failed(staging_path, final_path, ec);
  fs::remove(staging_path, ec);
}

// The final directory is created here, so moving children into it cannot
// touch anything that was already there.
void move_directory_exclusive(const fs::path& staging_dir, const fs::path& final_dir) {
  std::error_code ec;
  bool created = fs::create_directory(final_dir, ec);
  if(ec == std::errc::file_exists || (!ec && !created)) throw_taken(final_dir);
  if(ec) throw_move_failed(staging_dir, final_dir, ec);

  for(const auto& child : fs::directory_iterator(staging_dir)) {
    auto target = final_dir / child.path().filename();
    fs::rename(child.path(), target, ec);
    if(!ec) continue;
    if(child.is_directory()) {
      move_directory_exclusive(child.path(), target);
    } else {
      move_file_exclusive(child.path(), target);
    }
  }
  fs::remove_all(staging_dir, ec);
}

} // namespace

void move_into_place(const fs::path& staging_path, const fs::path& final_path) {
  std::error_code ec;
  if(final_path.has_parent_path()) {
    fs::create_directories(final_path.parent_path(), ec);
    if(ec) throw_move_failed(staging_path, final_path, ec);
  }
  if(fs::is_directory(fs::symlink_status(staging_path, ec))) {
    move_directory_exclusive(staging_path, final_path);
  } else {
    move_file_exclusive(staging_path, final_path);
  }
}
