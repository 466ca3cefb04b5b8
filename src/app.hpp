#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "peer_connector.hpp"
#include "session.hpp"
#include "tcp_transport.hpp"

class Logger;
class SettingsManager;

inline constexpr uint32_t kMaxChunkSize = 64u * 1024u * 1024u;

struct AppOptions {
  std::string secret;
  uint32_t chunk_size = 5u * 1024u * 1024u;
  bool chunk_size_overridden = false;
  ConnectOptions connect;
  SessionOptions session;
  TcpOptions tcp;
  std::filesystem::path dest_dir = ".";

  // Reads the secret from the environment variable named by token_env.
  // Throws ConfigError for a missing secret or out-of-range values.
  static AppOptions from_settings(const SettingsManager& settings);
};

// Sender when `paths` is non-empty, receiver otherwise. Returns the
// process exit code; TransferError propagates to the caller.
int run_transfer(const AppOptions& options,
                 const std::vector<std::string>& paths,
                 Transport& transport,
                 const std::shared_ptr<Logger>& logger);
