#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>

#include "errors.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

namespace {

bool looks_like_option(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?');
}

void apply(SettingsManager& settings, const SettingSpec& spec, const std::string& token, const std::string& value) {
  std::string error;
  if(!settings.set_from_string(spec.key, value, error)) {
    throw ConfigError("Invalid value for option '" + token + "': " + error);
  }
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name)
  : process_name_(std::move(process_name)) {}

std::vector<std::string> CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::vector<std::string> paths;
  bool options_done = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(options_done) {
      paths.push_back(token);
      continue;
    }
    if(token == "--") {
      options_done = true;
      continue;
    }

    // Returns false for a short token that names no setting.
    auto handle_option = [&](const std::string& key_token, bool long_form) {
      const auto* spec = settings.find(key_token);
      if(!spec) {
        if(long_form) throw ConfigError("Unknown option --" + key_token);
        return false;
      }
      if(spec->type == SettingType::Bool) {
        bool explicit_value = i + 1 < args.size() && !looks_like_option(args[i + 1]) &&
                              SettingsManager::parse_bool(args[i + 1]).has_value();
        apply(settings, *spec, key_token, explicit_value ? args[++i] : "true");
        return true;
      }
      if(i + 1 >= args.size()) {
        throw ConfigError("Missing value for option '" + key_token + "'");
      }
      apply(settings, *spec, key_token, args[++i]);
      return true;
    };

    if(token.rfind("--", 0) == 0) {
      auto key = token.substr(2);
      auto eq = key.find('=');
      if(eq == std::string::npos) {
        handle_option(key, true);
        continue;
      }
      const auto* spec = settings.find(key.substr(0, eq));
      if(!spec) throw ConfigError("Unknown option --" + key.substr(0, eq));
      apply(settings, *spec, key.substr(0, eq), key.substr(eq + 1));
      continue;
    }

    if(token.size() > 1 && token[0] == '-' && handle_option(token.substr(1), false)) continue;
    // An unrecognised short token is treated as a path ("-notes.txt").
    paths.push_back(token);
  }
  return paths;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  print_out(nullptr, "{} - send files and directories to a peer sharing the same secret", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} [options] <path>...   send the given files/directories", process_name_);
  print_out(nullptr, "  {} [options]             receive into --dest_dir", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& spec : settings.specs()) {
    std::string hint = spec.type == SettingType::Bool ? "[true|false]"
                                                      : std::string("<") + setting_type_name(spec.type) + ">";
    std::ostringstream aliases;
    for(std::size_t i = 0; i < spec.aliases.size(); ++i) {
      aliases << (i == 0 ? " (alias: " : ", ") << "-" << spec.aliases[i];
    }
    if(!spec.aliases.empty()) aliases << ")";
    auto fallback = spec.default_value.is_string() ? spec.default_value.get<std::string>()
                                                   : spec.default_value.dump();
    print_out(nullptr, "  --{} {:<12} {}{} (default: {})", spec.key, hint, spec.description, aliases.str(),
              fallback.empty() ? "none" : fallback);
  }
  print_out(nullptr, "");
  print_out(nullptr, "The shared secret is read from the environment variable named by --token_env.");
}
