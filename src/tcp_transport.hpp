#pragma once

#include <asio.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "transport.hpp"

class Logger;
class TcpConnection;

// Largest accepted frame payload; a bigger length prefix is a ProtocolError.
inline constexpr uint32_t kMaxFrameSize = 256u * 1024u * 1024u;

struct TcpOptions {
  std::string listen_ip = "0.0.0.0";
  int listen_port = 47800;      // -1 disables listening, 0 picks a free port
  std::string peer_address;     // host:port to dial; empty waits for an inbound peer
};

class TcpTransport : public Transport {
public:
  TcpTransport(TcpOptions options, std::shared_ptr<Logger> logger);

  std::unique_ptr<NodeHandle> make_node(const Seed& seed) override;

private:
  TcpOptions options_;
  std::shared_ptr<Logger> logger_;
};

// One local endpoint. Runs an io_context on a background thread; an
// inbound socket or a dialled one becomes a Connection only after both
// sides proved their identity by signing the other's nonce.
class TcpNode : public NodeHandle {
public:
  TcpNode(const Seed& seed, TcpOptions options, std::shared_ptr<Logger> logger);
  ~TcpNode() override;

  std::string identity() const override { return identity_; }
  std::shared_ptr<Connection> connect(const std::string& remote_identity,
                                      std::chrono::milliseconds timeout) override;
  void close() override;

  // Bound port when listening, 0 otherwise.
  uint16_t listen_port() const { return listen_port_; }

private:
  using tcp = asio::ip::tcp;
  using Deadline = std::chrono::steady_clock::time_point;

  void start_accept();
  tcp::socket dial(Deadline deadline);
  bool next_inbound(tcp::socket& out, Deadline deadline);
  std::shared_ptr<Connection> authenticate(tcp::socket socket,
                                           const std::string& remote_identity,
                                           Deadline deadline);
  void write_line(tcp::socket& socket, const std::string& line, Deadline deadline);
  std::string read_line(tcp::socket& socket, asio::streambuf& buffer, Deadline deadline);
  std::size_t await(std::future<std::size_t>& pending, tcp::socket& socket,
                    Deadline deadline, const char* what);

  Seed seed_;
  std::string identity_;
  TcpOptions options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  uint16_t listen_port_ = 0;

  std::mutex inbound_mutex_;
  std::condition_variable inbound_cv_;
  std::deque<tcp::socket> inbound_;

  std::mutex connections_mutex_;
  std::vector<std::weak_ptr<TcpConnection>> connections_;

  std::atomic<bool> closed_{false};
  std::thread io_thread_;
};
