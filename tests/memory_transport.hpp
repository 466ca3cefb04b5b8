#pragma once

#include "errors.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace peersend::test {

// One direction of an in-memory link.
struct MemoryPipe {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<Bytes> queue;
  bool closed = false;

  void close() {
    std::lock_guard lock(mutex);
    closed = true;
    cv.notify_all();
  }
};

using TamperHook = std::function<void(const std::string& sender_identity, std::size_t message_index, Bytes& message)>;

class MemoryConnection : public Connection {
public:
  MemoryConnection(std::string local_identity,
                   std::string remote_identity,
                   std::shared_ptr<MemoryPipe> inbox,
                   std::shared_ptr<MemoryPipe> outbox,
                   TamperHook tamper)
    : local_identity_(std::move(local_identity)),
      remote_identity_(std::move(remote_identity)),
      inbox_(std::move(inbox)),
      outbox_(std::move(outbox)),
      tamper_(std::move(tamper)) {}

  ~MemoryConnection() override { close(); }

  bool is_ready() const override { return !*closed_; }
  std::string remote_identity() const override { return remote_identity_; }

  std::future<void> send(Bytes message) override {
    std::promise<void> promise;
    auto pending = promise.get_future();
    if(tamper_) tamper_(local_identity_, sent_++, message);
    {
      std::lock_guard lock(outbox_->mutex);
      if(*closed_ || outbox_->closed) {
        promise.set_exception(std::make_exception_ptr(ConnectionError("Connection closed")));
        return pending;
      }
      outbox_->queue.push_back(std::move(message));
      outbox_->cv.notify_all();
    }
    promise.set_value();
    return pending;
  }

  std::future<Bytes> recv() override {
    auto inbox = inbox_;
    auto closed = closed_;
    return std::async(std::launch::deferred, [inbox, closed]() {
      std::unique_lock lock(inbox->mutex);
      inbox->cv.wait(lock, [&]() { return !inbox->queue.empty() || inbox->closed; });
      if(*closed) throw ConnectionError("Connection closed");
      if(inbox->queue.empty()) throw ConnectionError("Peer closed the connection");
      auto message = std::move(inbox->queue.front());
      inbox->queue.pop_front();
      return message;
    });
  }

  void close() override {
    if(closed_->exchange(true)) return;
    inbox_->close();
    outbox_->close();
  }

private:
  std::string local_identity_;
  std::string remote_identity_;
  std::shared_ptr<MemoryPipe> inbox_;
  std::shared_ptr<MemoryPipe> outbox_;
  TamperHook tamper_;
  std::size_t sent_ = 0;
  std::shared_ptr<std::atomic<bool>> closed_ = std::make_shared<std::atomic<bool>>(false);
};

inline std::pair<std::shared_ptr<MemoryConnection>, std::shared_ptr<MemoryConnection>>
make_connection_pair(const std::string& a, const std::string& b, TamperHook tamper = {}) {
  auto a_to_b = std::make_shared<MemoryPipe>();
  auto b_to_a = std::make_shared<MemoryPipe>();
  return {std::make_shared<MemoryConnection>(a, b, b_to_a, a_to_b, tamper),
          std::make_shared<MemoryConnection>(b, a, a_to_b, b_to_a, tamper)};
}

// Rendezvous between nodes: A connecting to B pairs with B connecting to
// A. Counts every dial so retry behaviour can be checked.
class MemoryNetwork : public Transport, public std::enable_shared_from_this<MemoryNetwork> {
public:
  std::unique_ptr<NodeHandle> make_node(const Seed& seed) override;

  void set_tamper(TamperHook hook) {
    std::lock_guard lock(mutex_);
    tamper_ = std::move(hook);
  }

  std::size_t dial_count(const std::string& identity) const {
    std::lock_guard lock(mutex_);
    auto it = dials_.find(identity);
    return it == dials_.end() ? 0 : it->second;
  }

  std::shared_ptr<Connection> rendezvous(const std::string& local,
                                         const std::string& remote,
                                         std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    ++dials_[local];
    auto reverse = waiting_.find({remote, local});
    if(reverse != waiting_.end()) {
      auto [mine, theirs] = make_connection_pair(local, remote, tamper_);
      reverse->second->connection = theirs;
      waiting_.erase(reverse);
      cv_.notify_all();
      return mine;
    }
    auto slot = std::make_shared<Slot>();
    waiting_[{local, remote}] = slot;
    bool paired = cv_.wait_for(lock, timeout, [&]() { return slot->connection != nullptr; });
    if(!paired) {
      auto it = waiting_.find({local, remote});
      if(it != waiting_.end() && it->second == slot) waiting_.erase(it);
      throw ConnectionError("No peer " + remote.substr(0, 12) + " within timeout");
    }
    return slot->connection;
  }

private:
  struct Slot {
    std::shared_ptr<Connection> connection;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::pair<std::string, std::string>, std::shared_ptr<Slot>> waiting_;
  std::map<std::string, std::size_t> dials_;
  TamperHook tamper_;
};

class MemoryNode : public NodeHandle {
public:
  MemoryNode(std::shared_ptr<MemoryNetwork> network, std::string identity)
    : network_(std::move(network)), identity_(std::move(identity)) {}

  std::string identity() const override { return identity_; }

  std::shared_ptr<Connection> connect(const std::string& remote_identity,
                                      std::chrono::milliseconds timeout) override {
    if(closed_) throw ConnectionError("Node is closed");
    return network_->rendezvous(identity_, remote_identity, timeout);
  }

  void close() override { closed_ = true; }

private:
  std::shared_ptr<MemoryNetwork> network_;
  std::string identity_;
  std::atomic<bool> closed_{false};
};

inline std::unique_ptr<NodeHandle> MemoryNetwork::make_node(const Seed& seed) {
  return std::make_unique<MemoryNode>(shared_from_this(), node_identity(seed));
}

} // namespace peersend::test
