#pragma once

#include <string>
#include <vector>

class SettingsManager;

// Maps "--key value", "--key=value", "--flag" and "-alias" tokens onto
// settings; every other token is a path to send. "--" ends option parsing.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "peersend");

  // Throws ConfigError on an unknown option or an invalid value.
  std::vector<std::string> parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  std::string process_name_;
};
