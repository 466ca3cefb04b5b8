#include "peer_connector.hpp"

#include <thread>

#include "errors.hpp"
#include "log.hpp"

namespace {

std::string short_id(const std::string& identity) {
  return identity.size() > 12 ? identity.substr(0, 12) : identity;
}

} // namespace

PeerLink::PeerLink(std::unique_ptr<NodeHandle> node,
                   std::shared_ptr<Connection> connection)
  : node_(std::move(node)), connection_(std::move(connection)) {}

PeerLink::~PeerLink() {
  close();
}

void PeerLink::close() {
  if(connection_) {
    connection_->close();
    connection_.reset();
  }
  if(node_) {
    node_->close();
    node_.reset();
  }
}

PeerConnector::PeerConnector(Transport& transport, std::shared_ptr<Logger> logger)
  : transport_(transport), logger_(std::move(logger)) {}

PeerLink PeerConnector::connect(const Seed& local_seed,
                                const std::string& remote_identity,
                                const ConnectOptions& options) {
  if(options.max_attempts == 0) {
    throw ConfigError("connect_attempts must be at least 1");
  }

  auto node = transport_.make_node(local_seed);
  logger_->info("Local node {}; connecting to {}", short_id(node->identity()), short_id(remote_identity));

  for(std::size_t attempt = 1; attempt <= options.max_attempts; ++attempt) {
    try {
      auto connection = node->connect(remote_identity, options.timeout_per_attempt);
      if(wait_until_ready(*connection, options)) {
        logger_->info("Connected to peer {} (attempt {}/{})", short_id(remote_identity), attempt,
                      options.max_attempts);
        return PeerLink(std::move(node), std::move(connection));
      }
      connection->close();
      logger_->warn("Connection attempt {}/{}: link not ready within {} ms", attempt,
                    options.max_attempts, options.timeout_per_attempt.count());
    } catch(const ConnectionError& e) {
      logger_->warn("Connection attempt {}/{} failed: {}", attempt, options.max_attempts, e.what());
    }
    if(attempt < options.max_attempts) {
      std::this_thread::sleep_for(options.retry_interval);
    }
  }

  node->close();
  throw ConnectionError("Failed to connect to peer " + short_id(remote_identity) + " after " +
                        std::to_string(options.max_attempts) + " attempts");
}

bool PeerConnector::wait_until_ready(Connection& connection, const ConnectOptions& options) const {
  auto deadline = std::chrono::steady_clock::now() + options.timeout_per_attempt;
  while(!connection.is_ready()) {
    if(std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(options.ready_poll_interval);
  }
  return true;
}
