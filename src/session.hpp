#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "manifest.hpp"
#include "sources.hpp"

class Connection;
class Logger;

struct SessionOptions {
  int compression_level = 6;
  // Remove entries this session already committed when a later one fails.
  bool rollback_on_failure = false;
  bool show_progress = false;
  std::size_t meter_width = 40;
};

// Single-use: one connection, one manifest, entries strictly in order.
class SenderSession {
public:
  SenderSession(std::shared_ptr<Connection> connection,
                std::shared_ptr<Logger> logger,
                SessionOptions options = {});

  // Returns once the receiver has confirmed every entry.
  void run(const std::vector<SendItem>& items);

private:
  std::shared_ptr<Connection> connection_;
  std::shared_ptr<Logger> logger_;
  SessionOptions options_;
};

class ReceiverSession {
public:
  ReceiverSession(std::shared_ptr<Connection> connection,
                  std::filesystem::path destination_root,
                  std::shared_ptr<Logger> logger,
                  SessionOptions options = {});

  // Returns the accepted manifest after every entry was verified and
  // moved into place.
  Manifest run();

  const std::vector<std::filesystem::path>& committed() const { return committed_; }

private:
  void roll_back();

  std::shared_ptr<Connection> connection_;
  std::filesystem::path destination_root_;
  std::shared_ptr<Logger> logger_;
  SessionOptions options_;
  std::vector<std::filesystem::path> committed_;
};
