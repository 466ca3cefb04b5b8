#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "identity.hpp"

using Bytes = std::vector<char>;

// A live, message-oriented link to one peer. Message boundaries are
// preserved: every recv() yields exactly one sent message. Failures are
// reported through the futures as ConnectionError (or ProtocolError for
// a malformed frame).
class Connection {
public:
  virtual ~Connection() = default;

  virtual bool is_ready() const = 0;
  virtual std::future<void> send(Bytes message) = 0;
  virtual std::future<Bytes> recv() = 0;
  virtual void close() = 0;
  virtual std::string remote_identity() const = 0;
};

class NodeHandle {
public:
  virtual ~NodeHandle() = default;

  virtual std::string identity() const = 0;
  // One dial attempt. Throws ConnectionError when no link to
  // `remote_identity` could be made within `timeout`.
  virtual std::shared_ptr<Connection> connect(const std::string& remote_identity,
                                              std::chrono::milliseconds timeout) = 0;
  virtual void close() = 0;
};

class Transport {
public:
  virtual ~Transport() = default;

  virtual std::unique_ptr<NodeHandle> make_node(const Seed& seed) = 0;
};

// Blocking helpers used by the protocol layers. Both wait for the
// transport future to resolve and map a broken future to ConnectionError.
void send_message(Connection& connection, Bytes message);
Bytes receive_message(Connection& connection);
