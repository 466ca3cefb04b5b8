#include "tcp_transport.hpp"

#include <nlohmann/json.hpp>
#include <openssl/rand.h>

#include <array>
#include <optional>
#include <stdexcept>
#include <system_error>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

using json = nlohmann::json;
using tcp = asio::ip::tcp;

namespace {

constexpr std::size_t kMaxHandshakeLine = 4096;
constexpr std::size_t kReadChunkSize = 64 * 1024;
constexpr const char* kProofContext = "peersend-hello-v1";

std::string make_nonce() {
  std::array<unsigned char, 32> nonce{};
  if(RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    throw ConnectionError("Unable to generate a handshake nonce");
  }
  return hex_from_bytes(nonce.data(), nonce.size());
}

// What a node signs to prove it owns `signer`: the nonce the other side
// picked, bound to both identities.
std::string proof_message(const std::string& nonce, const std::string& signer, const std::string& verifier) {
  return std::string(kProofContext) + ":" + nonce + ":" + signer + ":" + verifier;
}

std::string describe_endpoint(const tcp::socket& socket) {
  std::error_code ec;
  auto endpoint = socket.remote_endpoint(ec);
  if(ec) return "<unknown>";
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

std::string encode_frame(const Bytes& message) {
  auto size = static_cast<uint32_t>(message.size());
  std::string frame;
  frame.reserve(4 + message.size());
  frame.push_back(static_cast<char>((size >> 24) & 0xff));
  frame.push_back(static_cast<char>((size >> 16) & 0xff));
  frame.push_back(static_cast<char>((size >> 8) & 0xff));
  frame.push_back(static_cast<char>(size & 0xff));
  frame.append(message.begin(), message.end());
  return frame;
}

uint32_t decode_frame_size(const std::string& buffer) {
  auto byte = [&](std::size_t i) { return static_cast<uint32_t>(static_cast<unsigned char>(buffer[i])); };
  return (byte(0) << 24) | (byte(1) << 16) | (byte(2) << 8) | byte(3);
}

} // namespace

// Framed link over an authenticated socket. All socket work happens on
// the node's io thread; callers only post into it and wait on futures.
class TcpConnection : public Connection, public std::enable_shared_from_this<TcpConnection> {
public:
  TcpConnection(asio::io_context& io,
                tcp::socket socket,
                std::string remote_identity,
                std::string leftover,
                std::shared_ptr<Logger> logger)
    : io_(io),
      socket_(std::move(socket)),
      remote_identity_(std::move(remote_identity)),
      logger_(std::move(logger)),
      inbox_(std::move(leftover)) {}

  bool is_ready() const override { return ready_.load(); }
  std::string remote_identity() const override { return remote_identity_; }

  std::future<void> send(Bytes message) override {
    auto promise = std::make_shared<std::promise<void>>();
    auto pending = promise->get_future();
    if(message.size() > kMaxFrameSize) {
      promise->set_exception(std::make_exception_ptr(
        ProtocolError("Message of " + std::to_string(message.size()) + " bytes exceeds the frame limit")));
      return pending;
    }
    auto frame = encode_frame(message);
    asio::post(io_, [self = shared_from_this(), frame = std::move(frame), promise]() mutable {
      if(!self->ready_) {
        promise->set_exception(std::make_exception_ptr(ConnectionError("Connection closed")));
        return;
      }
      bool idle = self->write_queue_.empty();
      self->write_queue_.push_back(Outgoing{std::move(frame), std::move(*promise)});
      if(idle) self->do_write();
    });
    return pending;
  }

  std::future<Bytes> recv() override {
    auto promise = std::make_shared<std::promise<Bytes>>();
    auto pending = promise->get_future();
    asio::post(io_, [self = shared_from_this(), promise]() mutable {
      if(self->pending_recv_) {
        promise->set_exception(std::make_exception_ptr(std::logic_error("recv() already outstanding")));
        return;
      }
      self->pending_recv_.emplace(std::move(*promise));
      self->try_deliver();
      if(!self->pending_recv_) return;
      if(!self->ready_) {
        self->pending_recv_->set_exception(std::make_exception_ptr(ConnectionError("Connection closed")));
        self->pending_recv_.reset();
        return;
      }
      if(!self->reading_) self->do_read();
    });
    return pending;
  }

  void close() override {
    ready_ = false;
    asio::post(io_, [self = shared_from_this()]() {
      self->fail_all(std::make_exception_ptr(ConnectionError("Connection closed")));
    });
  }

  // Only called by the node once its io thread has stopped.
  void shutdown_now() {
    fail_all(std::make_exception_ptr(ConnectionError("Node closed")));
  }

private:
  struct Outgoing {
    std::string frame;
    std::promise<void> done;
  };

  void do_write() {
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front().frame),
      [this, self](std::error_code ec, std::size_t) {
        if(ec) {
          if(ready_) logger_->debug("Connection write error: {}", ec.message());
          fail_all(std::make_exception_ptr(ConnectionError("Connection write error: " + ec.message())));
          return;
        }
        write_queue_.front().done.set_value();
        write_queue_.pop_front();
        if(!write_queue_.empty()) do_write();
      });
  }

  void do_read() {
    reading_ = true;
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(read_chunk_),
      [this, self](std::error_code ec, std::size_t bytes) {
        reading_ = false;
        if(ec) {
          auto reason = ec == asio::error::eof
            ? std::string("Peer closed the connection")
            : "Connection read error: " + ec.message();
          fail_all(std::make_exception_ptr(ConnectionError(reason)));
          return;
        }
        inbox_.append(read_chunk_.data(), bytes);
        try_deliver();
        if(pending_recv_ && ready_) do_read();
      });
  }

  void try_deliver() {
    if(!pending_recv_ || inbox_.size() < 4) return;
    auto size = decode_frame_size(inbox_);
    if(size > kMaxFrameSize) {
      pending_recv_->set_exception(std::make_exception_ptr(
        ProtocolError("Incoming frame of " + std::to_string(size) + " bytes exceeds the frame limit")));
      pending_recv_.reset();
      fail_all(std::make_exception_ptr(ConnectionError("Connection dropped after an oversized frame")));
      return;
    }
    if(inbox_.size() < 4 + static_cast<std::size_t>(size)) return;
    Bytes message(inbox_.begin() + 4, inbox_.begin() + 4 + size);
    inbox_.erase(0, 4 + static_cast<std::size_t>(size));
    auto promise = std::move(*pending_recv_);
    pending_recv_.reset();
    promise.set_value(std::move(message));
  }

  void fail_all(std::exception_ptr error) {
    ready_ = false;
    std::error_code ec;
    socket_.close(ec);
    if(pending_recv_) {
      // Frames that arrived before the failure are still delivered.
      try_deliver();
      if(pending_recv_) {
        pending_recv_->set_exception(error);
        pending_recv_.reset();
      }
    }
    while(!write_queue_.empty()) {
      write_queue_.front().done.set_exception(error);
      write_queue_.pop_front();
    }
  }

  asio::io_context& io_;
  tcp::socket socket_;
  const std::string remote_identity_;
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> ready_{true};
  std::deque<Outgoing> write_queue_;
  std::string inbox_;
  std::optional<std::promise<Bytes>> pending_recv_;
  std::array<char, kReadChunkSize> read_chunk_{};
  bool reading_ = false;
};

TcpTransport::TcpTransport(TcpOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)), logger_(std::move(logger)) {}

std::unique_ptr<NodeHandle> TcpTransport::make_node(const Seed& seed) {
  return std::make_unique<TcpNode>(seed, options_, logger_);
}

TcpNode::TcpNode(const Seed& seed, TcpOptions options, std::shared_ptr<Logger> logger)
  : seed_(seed),
    identity_(node_identity(seed)),
    options_(std::move(options)),
    logger_(std::move(logger)),
    work_(asio::make_work_guard(io_)) {
  if(options_.peer_address.empty() && options_.listen_port >= 0) {
    if(options_.listen_port > 65535) {
      throw ConfigError("Invalid listen_port " + std::to_string(options_.listen_port));
    }
    std::error_code ec;
    auto address = asio::ip::make_address(options_.listen_ip, ec);
    if(ec) {
      throw ConfigError("Invalid listen_ip '" + options_.listen_ip + "': " + ec.message());
    }
    tcp::endpoint endpoint(address, static_cast<uint16_t>(options_.listen_port));
    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    try {
      acceptor_->open(endpoint.protocol());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(endpoint);
      acceptor_->listen();
    } catch(const std::system_error& e) {
      throw ConnectionError("Cannot listen on " + options_.listen_ip + ":" +
                            std::to_string(options_.listen_port) + ": " + e.code().message());
    }
    listen_port_ = acceptor_->local_endpoint().port();
    logger_->info("Listening on {}:{}", options_.listen_ip, listen_port_);
    start_accept();
  }
  io_thread_ = std::thread([this]() { io_.run(); });
}

TcpNode::~TcpNode() {
  close();
}

void TcpNode::start_accept() {
  acceptor_->async_accept([this](std::error_code ec, tcp::socket socket) {
    if(closed_ || ec == asio::error::operation_aborted) return;
    if(ec) {
      logger_->warn("Accept error: {}", ec.message());
    } else {
      logger_->debug("Accepted connection from {}", describe_endpoint(socket));
      std::lock_guard lock(inbound_mutex_);
      inbound_.push_back(std::move(socket));
      inbound_cv_.notify_all();
    }
    start_accept();
  });
}

std::shared_ptr<Connection> TcpNode::connect(const std::string& remote_identity,
                                             std::chrono::milliseconds timeout) {
  if(closed_) throw ConnectionError("Node is closed");
  auto deadline = std::chrono::steady_clock::now() + timeout;

  if(!options_.peer_address.empty()) {
    auto socket = dial(deadline);
    return authenticate(std::move(socket), remote_identity, deadline);
  }
  if(!acceptor_) {
    throw ConfigError("Node has neither a peer_address to dial nor a listening port");
  }
  while(true) {
    tcp::socket socket(io_);
    if(!next_inbound(socket, deadline)) {
      throw ConnectionError("No peer connected within " + std::to_string(timeout.count()) + " ms");
    }
    auto endpoint = describe_endpoint(socket);
    try {
      return authenticate(std::move(socket), remote_identity, deadline);
    } catch(const ConnectionError& e) {
      logger_->warn("Dropped inbound connection from {}: {}", endpoint, e.what());
    }
  }
}

tcp::socket TcpNode::dial(Deadline deadline) {
  auto colon = options_.peer_address.rfind(':');
  if(colon == std::string::npos || colon == 0 || colon + 1 == options_.peer_address.size()) {
    throw ConfigError("peer_address must be host:port (got '" + options_.peer_address + "')");
  }
  auto host = options_.peer_address.substr(0, colon);
  auto port = options_.peer_address.substr(colon + 1);
  if(host.size() > 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }

  tcp::resolver resolver(io_);
  std::error_code ec;
  auto endpoints = resolver.resolve(host, port, ec);
  if(ec) {
    throw ConnectionError("Resolve failed for " + options_.peer_address + ": " + ec.message());
  }

  tcp::socket socket(io_);
  auto promise = std::make_shared<std::promise<std::size_t>>();
  auto pending = promise->get_future();
  asio::post(io_, [&socket, endpoints, promise]() {
    asio::async_connect(socket, endpoints, [promise](std::error_code ec, const tcp::endpoint&) {
      if(ec) {
        promise->set_exception(std::make_exception_ptr(std::system_error(ec)));
      } else {
        promise->set_value(0);
      }
    });
  });
  await(pending, socket, deadline, "Connect");
  logger_->debug("Connected to {}", describe_endpoint(socket));
  return socket;
}

bool TcpNode::next_inbound(tcp::socket& out, Deadline deadline) {
  std::unique_lock lock(inbound_mutex_);
  if(!inbound_cv_.wait_until(lock, deadline, [this]() { return closed_ || !inbound_.empty(); })) {
    return false;
  }
  if(closed_) return false;
  out = std::move(inbound_.front());
  inbound_.pop_front();
  return true;
}

std::shared_ptr<Connection> TcpNode::authenticate(tcp::socket socket,
                                                  const std::string& remote_identity,
                                                  Deadline deadline) {
  auto nonce = make_nonce();
  json hello{{"type", "hello"}, {"node_id", identity_}, {"nonce", nonce}};
  write_line(socket, hello.dump(), deadline);

  asio::streambuf buffer(kMaxHandshakeLine);
  json peer_hello;
  try {
    peer_hello = json::parse(read_line(socket, buffer, deadline));
  } catch(const json::parse_error& e) {
    throw ConnectionError(std::string("Malformed hello: ") + e.what());
  }
  if(!peer_hello.is_object() || peer_hello.value("type", "") != "hello" ||
     !peer_hello.contains("node_id") || !peer_hello["node_id"].is_string() ||
     !peer_hello.contains("nonce") || !peer_hello["nonce"].is_string() ||
     !is_lower_hex(peer_hello["nonce"].get<std::string>(), 64)) {
    throw ConnectionError("Malformed hello from peer");
  }
  auto peer_id = peer_hello["node_id"].get<std::string>();
  if(peer_id != remote_identity) {
    throw ConnectionError("Unexpected peer identity " + peer_id.substr(0, 12) + " (expected " +
                          remote_identity.substr(0, 12) + ")");
  }

  auto signature = sign_with_seed(seed_, proof_message(peer_hello["nonce"].get<std::string>(),
                                                       identity_, remote_identity));
  json proof{{"type", "proof"}, {"signature", hex_from_bytes(signature)}};
  write_line(socket, proof.dump(), deadline);

  json peer_proof;
  try {
    peer_proof = json::parse(read_line(socket, buffer, deadline));
  } catch(const json::parse_error& e) {
    throw ConnectionError(std::string("Malformed proof: ") + e.what());
  }
  if(!peer_proof.is_object() || peer_proof.value("type", "") != "proof" ||
     !peer_proof.contains("signature") || !peer_proof["signature"].is_string()) {
    throw ConnectionError("Malformed proof from peer");
  }
  auto peer_signature = bytes_from_hex(peer_proof["signature"].get<std::string>());
  if(!peer_signature ||
     !verify_identity_signature(remote_identity, proof_message(nonce, remote_identity, identity_),
                                *peer_signature)) {
    throw ConnectionError("Peer failed to prove identity " + remote_identity.substr(0, 12));
  }

  std::string leftover(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
  logger_->debug("Authenticated peer {} at {}", remote_identity.substr(0, 12), describe_endpoint(socket));
  auto connection = std::make_shared<TcpConnection>(io_, std::move(socket), remote_identity,
                                                    std::move(leftover), logger_);
  std::lock_guard lock(connections_mutex_);
  connections_.push_back(connection);
  return connection;
}

void TcpNode::write_line(tcp::socket& socket, const std::string& line, Deadline deadline) {
  auto payload = std::make_shared<std::string>(line + "\n");
  auto promise = std::make_shared<std::promise<std::size_t>>();
  auto pending = promise->get_future();
  asio::post(io_, [&socket, payload, promise]() {
    asio::async_write(socket, asio::buffer(*payload), [payload, promise](std::error_code ec, std::size_t n) {
      if(ec) {
        promise->set_exception(std::make_exception_ptr(std::system_error(ec)));
      } else {
        promise->set_value(n);
      }
    });
  });
  await(pending, socket, deadline, "Handshake write");
}

std::string TcpNode::read_line(tcp::socket& socket, asio::streambuf& buffer, Deadline deadline) {
  auto promise = std::make_shared<std::promise<std::size_t>>();
  auto pending = promise->get_future();
  asio::post(io_, [&socket, &buffer, promise]() {
    asio::async_read_until(socket, buffer, '\n', [promise](std::error_code ec, std::size_t n) {
      if(ec) {
        promise->set_exception(std::make_exception_ptr(std::system_error(ec)));
      } else {
        promise->set_value(n);
      }
    });
  });
  auto length = await(pending, socket, deadline, "Handshake read");
  auto begin = asio::buffers_begin(buffer.data());
  std::string line(begin, begin + static_cast<std::ptrdiff_t>(length - 1));
  buffer.consume(length);
  return line;
}

std::size_t TcpNode::await(std::future<std::size_t>& pending, tcp::socket& socket,
                           Deadline deadline, const char* what) {
  if(pending.wait_until(deadline) != std::future_status::ready) {
    std::promise<void> closed;
    auto closed_future = closed.get_future();
    asio::post(io_, [&socket, &closed]() {
      std::error_code ec;
      socket.close(ec);
      closed.set_value();
    });
    closed_future.wait();
    pending.wait();
    throw ConnectionError(std::string(what) + " timed out");
  }
  try {
    return pending.get();
  } catch(const std::system_error& e) {
    throw ConnectionError(std::string(what) + " failed: " + e.code().message());
  } catch(const std::future_error& e) {
    throw ConnectionError(std::string(what) + " abandoned: " + e.what());
  }
}

void TcpNode::close() {
  if(closed_.exchange(true)) return;
  inbound_cv_.notify_all();

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) io_thread_.join();

  // With the io thread gone, close everything from here and run the
  // context once more so aborted handlers release their connections.
  io_.restart();
  std::error_code ec;
  if(acceptor_) acceptor_->close(ec);
  {
    std::lock_guard lock(inbound_mutex_);
    for(auto& socket : inbound_) socket.close(ec);
    inbound_.clear();
  }
  {
    std::lock_guard lock(connections_mutex_);
    for(auto& weak : connections_) {
      if(auto connection = weak.lock()) connection->shutdown_now();
    }
    connections_.clear();
  }
  io_.run();
  logger_->debug("Node {} closed", identity_.substr(0, 12));
}
