#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>

#include "app.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "tcp_transport.hpp"

int main(int argc, char** argv){
  init(false);
  auto logger = std::make_shared<Logger>("peersend");
  try {
    SettingsManager settings;
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "peersend.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "peersend");
    std::vector<std::string> paths;
    try {
      paths = parser.parse(argc, argv, settings);
    } catch(const ConfigError& e) {
      logger->print_err("{}", e.what());
      parser.usage(settings);
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage(settings);
      return 0;
    }

    init(settings.get<bool>("verbose"));
    for(const auto& key : settings.keys()) {
      logger->debug("setting {} = {}", key, settings.value_as_string(key));
    }

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    auto options = AppOptions::from_settings(settings);
    TcpTransport transport(options.tcp, logger);
    return run_transfer(options, paths, transport, logger);
  } catch(const TransferError& e) {
    if(e.entry().empty()) {
      logger->print_err("error [{}]: {}", e.kind(), e.what());
    } else {
      logger->print_err("error [{}] {}: {}", e.kind(), e.entry(), e.what());
    }
    return 1;
  } catch(const std::exception& e) {
    logger->error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
