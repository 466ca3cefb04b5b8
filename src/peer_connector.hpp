#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "identity.hpp"
#include "transport.hpp"

class Logger;

struct ConnectOptions {
  std::chrono::milliseconds timeout_per_attempt{5000};
  std::size_t max_attempts = 30;
  std::chrono::milliseconds retry_interval{1000};
  std::chrono::milliseconds ready_poll_interval{50};
};

// Owns the local node and the live connection made through it. The
// connection is released before the node.
class PeerLink {
public:
  PeerLink() = default;
  PeerLink(std::unique_ptr<NodeHandle> node, std::shared_ptr<Connection> connection);
  ~PeerLink();

  PeerLink(PeerLink&&) = default;
  PeerLink& operator=(PeerLink&&) = default;

  const std::shared_ptr<Connection>& connection() const { return connection_; }

  void close();

private:
  std::unique_ptr<NodeHandle> node_;
  std::shared_ptr<Connection> connection_;
};

class PeerConnector {
public:
  PeerConnector(Transport& transport, std::shared_ptr<Logger> logger);

  // Makes exactly options.max_attempts dials at most, each bounded by
  // timeout_per_attempt, sleeping retry_interval in between. Throws
  // ConnectionError once they are all spent.
  PeerLink connect(const Seed& local_seed,
                   const std::string& remote_identity,
                   const ConnectOptions& options);

private:
  bool wait_until_ready(Connection& connection, const ConnectOptions& options) const;

  Transport& transport_;
  std::shared_ptr<Logger> logger_;
};
