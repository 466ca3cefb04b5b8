#include "app.hpp"

#include <cstdlib>

#include "errors.hpp"
#include "identity.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sources.hpp"
#include "utils.hpp"

AppOptions AppOptions::from_settings(const SettingsManager& settings) {
  AppOptions options;

  auto env_name = settings.get<std::string>("token_env");
  const char* secret = env_name.empty() ? nullptr : std::getenv(env_name.c_str());
  if(!secret || !*secret) {
    throw ConfigError("Shared secret missing: set the " + (env_name.empty() ? std::string("token_env") : env_name) +
                      " environment variable");
  }
  options.secret = secret;

  uint64_t chunk_size = 0;
  try {
    chunk_size = settings.get_size("chunk_size");
  } catch(const std::invalid_argument& e) {
    throw ConfigError(std::string("Invalid chunk_size: ") + e.what());
  }
  if(chunk_size == 0 || chunk_size > kMaxChunkSize) {
    throw ConfigError("chunk_size must be between 1 byte and " + format_size(kMaxChunkSize));
  }
  options.chunk_size = static_cast<uint32_t>(chunk_size);
  options.chunk_size_overridden = !settings.is_default("chunk_size");

  options.session.compression_level = settings.get<int>("compression_level");
  options.session.rollback_on_failure = settings.get<bool>("rollback_on_failure");
  options.session.show_progress = settings.get<bool>("transfer_progress");
  options.session.meter_width = static_cast<std::size_t>(settings.get<int>("progress_meter_size"));

  options.connect.max_attempts = static_cast<std::size_t>(settings.get<int>("connect_attempts"));
  options.connect.timeout_per_attempt = std::chrono::milliseconds(settings.get<int>("connect_timeout_ms"));
  options.connect.retry_interval = std::chrono::milliseconds(settings.get<int>("retry_interval_ms"));

  options.tcp.listen_ip = settings.get<std::string>("listen_ip");
  options.tcp.listen_port = settings.get<int>("listen_port");
  options.tcp.peer_address = settings.get<std::string>("peer_address");

  options.dest_dir = settings.get<std::string>("dest_dir");
  return options;
}

int run_transfer(const AppOptions& options,
                 const std::vector<std::string>& paths,
                 Transport& transport,
                 const std::shared_ptr<Logger>& logger) {
  const Role role = paths.empty() ? Role::Receiver : Role::Sender;
  auto identities = peer_identities(options.secret);
  auto seed = derive_seed(options.secret, role);
  logger->info("Running as {}", role_name(role));

  if(role == Role::Sender) {
    // Sources are measured before connecting.
    auto items = prepare_send_items(paths, options.chunk_size, logger.get());
    PeerConnector connector(transport, logger);
    auto link = connector.connect(seed, identities.for_role(Role::Receiver), options.connect);
    SenderSession session(link.connection(), logger, options.session);
    session.run(items);
    link.close();
    logger->print("Sent {} item(s)", items.size());
    return 0;
  }

  if(options.chunk_size_overridden) {
    logger->warn("chunk_size is decided by the sender; the receiver ignores it");
  }
  PeerConnector connector(transport, logger);
  auto link = connector.connect(seed, identities.for_role(Role::Sender), options.connect);
  ReceiverSession session(link.connection(), options.dest_dir, logger, options.session);
  auto manifest = session.run();
  link.close();
  logger->print("Received {} item(s) into {}", manifest.entries.size(), options.dest_dir.string());
  return 0;
}
