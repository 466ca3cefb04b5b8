#include "session.hpp"

#include <openssl/rand.h>

#include <memory>
#include <stdexcept>

#include "conflict_guard.hpp"
#include "entry_io.hpp"
#include "errors.hpp"
#include "handshake.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "transfer_engine.hpp"
#include "transport.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr const char* kStagingPrefix = ".peersend-staging-";

// Per-session scratch directory under the destination root. Entries are
// staged here and renamed into place, which keeps the move on one
// filesystem.
class StagingArea {
public:
  StagingArea(const fs::path& root, Logger* logger) : logger_(logger) {
    for(int attempt = 0; attempt < 8; ++attempt) {
      unsigned char random[4];
      if(RAND_bytes(random, sizeof(random)) != 1) {
        throw FileSystemError("Unable to generate a staging directory name");
      }
      auto candidate = root / (kStagingPrefix + hex_from_bytes(random, sizeof(random)));
      std::error_code ec;
      if(fs::create_directory(candidate, ec)) {
        dir_ = candidate;
        return;
      }
      if(ec) {
        throw FileSystemError("Cannot create staging directory " + candidate.string() + ": " + ec.message());
      }
    }
    throw FileSystemError("Unable to allocate a staging directory under " + root.string());
  }

  ~StagingArea() {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if(ec && logger_) {
      logger_->warn("Unable to remove staging directory {}: {}", dir_.string(), ec.message());
    }
  }

  StagingArea(const StagingArea&) = delete;
  StagingArea& operator=(const StagingArea&) = delete;

  fs::path slot(std::size_t index) const {
    return dir_ / ("entry-" + std::to_string(index));
  }

private:
  fs::path dir_;
  Logger* logger_;
};

ProgressCallback meter_callback(ProgressMeter& meter) {
  return [&meter](const ManifestEntry& entry, uint64_t delta, uint64_t chunk_index) {
    meter.update(entry, delta, chunk_index);
  };
}

} // namespace

SenderSession::SenderSession(std::shared_ptr<Connection> connection,
                             std::shared_ptr<Logger> logger,
                             SessionOptions options)
  : connection_(std::move(connection)), logger_(std::move(logger)), options_(options) {}

void SenderSession::run(const std::vector<SendItem>& items) {
  Manifest manifest;
  for(const auto& item : items) manifest.entries.push_back(item.entry);
  validate_manifest(manifest);

  logger_->info("Offering {} entries ({})", manifest.entries.size(), format_size(manifest.total_bytes()));
  logger_->debug("Manifest: {}", encode_manifest(manifest));
  send_manifest(*connection_, manifest);
  logger_->info("Receiver accepted the manifest");

  ProgressMeter meter("Sending", manifest.total_bytes(), options_.meter_width, options_.show_progress);
  auto progress = meter_callback(meter);
  for(const auto& item : items) {
    try {
      auto source = open_entry_source(item.source, item.entry.is_directory, logger_.get());
      send_entry(*connection_, item.entry, *source, options_.compression_level, progress, logger_.get());
    } catch(TransferError& e) {
      if(e.entry().empty()) e.set_entry(item.entry.relative_path);
      logger_->error("Failed sending {}: {}", item.entry.relative_path, e.what());
      connection_->close();
      throw;
    } catch(const std::runtime_error& e) {
      logger_->error("Failed sending {}: {}", item.entry.relative_path, e.what());
      connection_->close();
      throw FileSystemError(e.what(), item.entry.relative_path);
    } catch(const std::exception& e) {
      logger_->error("Failed sending {}: {}", item.entry.relative_path, e.what());
      connection_->close();
      throw;
    }
  }
  meter.finish();

  await_completion(*connection_);
  logger_->info("Transfer complete: {} entries, {}", items.size(), format_size(manifest.total_bytes()));
}

ReceiverSession::ReceiverSession(std::shared_ptr<Connection> connection,
                                 fs::path destination_root,
                                 std::shared_ptr<Logger> logger,
                                 SessionOptions options)
  : connection_(std::move(connection)),
    destination_root_(std::move(destination_root)),
    logger_(std::move(logger)),
    options_(options) {}

Manifest ReceiverSession::run() {
  std::error_code ec;
  if(!fs::is_directory(destination_root_, ec)) {
    throw ConfigError("Destination is not a directory: " + destination_root_.string());
  }

  auto reject = [this](const TransferError& cause) {
    logger_->error("Rejecting transfer: {}", cause.what());
    try {
      send_ack(*connection_, false);
    } catch(const ConnectionError& e) {
      logger_->warn("Could not deliver the rejection: {}", e.what());
    }
    connection_->close();
  };

  Manifest manifest;
  try {
    manifest = receive_manifest(*connection_);
  } catch(const ProtocolError& e) {
    reject(e);
    throw;
  }
  logger_->info("Incoming manifest: {} entries ({})", manifest.entries.size(),
                format_size(manifest.total_bytes()));
  for(const auto& entry : manifest.entries) {
    logger_->debug("  {} {} {}", entry.is_directory ? "dir " : "file", entry.relative_path,
                   format_size(entry.size_bytes));
  }

  ConflictGuard guard(destination_root_);
  try {
    guard.check_all(manifest);
  } catch(const TransferError& e) {
    reject(e);
    throw;
  }
  send_ack(*connection_, true);

  std::unique_ptr<StagingArea> staging;
  try {
    staging = std::make_unique<StagingArea>(guard.target_root(), logger_.get());
  } catch(const TransferError& e) {
    logger_->error("{}", e.what());
    connection_->close();
    throw;
  }
  ProgressMeter meter("Receiving", manifest.total_bytes(), options_.meter_width, options_.show_progress);
  auto progress = meter_callback(meter);

  for(std::size_t index = 0; index < manifest.entries.size(); ++index) {
    const auto& entry = manifest.entries[index];
    try {
      if(guard.check(entry.relative_path) == ConflictStatus::Exists) {
        throw ConflictError("File already exists: " + entry.relative_path, entry.relative_path);
      }
      auto final_path = guard.resolve(entry.relative_path);
      auto sink = open_entry_sink(staging->slot(index), entry.is_directory, logger_.get());
      receive_entry(*connection_, entry, *sink, progress, logger_.get());

      if(guard.check(entry.relative_path) == ConflictStatus::Exists) {
        throw ConflictError("File appeared during transfer: " + entry.relative_path, entry.relative_path);
      }
      sink->commit(final_path);
      committed_.push_back(final_path);
      logger_->debug("Committed {}", final_path.string());
    } catch(TransferError& e) {
      if(e.entry().empty()) e.set_entry(entry.relative_path);
      logger_->error("Failed receiving {}: {}", entry.relative_path, e.what());
      connection_->close();
      if(options_.rollback_on_failure) roll_back();
      throw;
    } catch(const std::runtime_error& e) {
      logger_->error("Failed receiving {}: {}", entry.relative_path, e.what());
      connection_->close();
      if(options_.rollback_on_failure) roll_back();
      throw FileSystemError(e.what(), entry.relative_path);
    } catch(const std::exception& e) {
      logger_->error("Failed receiving {}: {}", entry.relative_path, e.what());
      connection_->close();
      if(options_.rollback_on_failure) roll_back();
      throw;
    }
  }
  meter.finish();

  send_ack(*connection_, true);
  logger_->info("Received {} entries into {}", manifest.entries.size(), guard.target_root().string());
  return manifest;
}

void ReceiverSession::roll_back() {
  for(auto it = committed_.rbegin(); it != committed_.rend(); ++it) {
    std::error_code ec;
    fs::remove_all(*it, ec);
    if(ec) {
      logger_->warn("Rollback could not remove {}: {}", it->string(), ec.message());
    } else {
      logger_->info("Rolled back {}", it->string());
    }
  }
  committed_.clear();
}
