#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every option the tool understands. "min"/"max" bound integer settings;
// non-persistent settings are never written by --save.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","chunk_size"},          {"aliases", {"chunk","cs"}},     {"type","size"},   {"default","5m"},      {"description","Sender window size (e.g. 64k, 5m, 1g)"}},
  {{"key","compression_level"},   {"aliases", {"level","z"}},      {"type","int"},    {"default",6},         {"min",0},  {"max",9},       {"description","zlib compression level"}},
  {{"key","connect_attempts"},    {"aliases", {"attempts","ca"}},  {"type","int"},    {"default",30},        {"min",1},  {"max",100000},  {"description","Connection attempts before giving up"}},
  {{"key","connect_timeout_ms"},  {"aliases", {"timeout","ct"}},   {"type","int"},    {"default",5000},      {"min",1},  {"max",3600000}, {"description","Timeout of one connection attempt"}},
  {{"key","retry_interval_ms"},   {"aliases", {"retry","ri"}},     {"type","int"},    {"default",1000},      {"min",0},  {"max",3600000}, {"description","Pause between connection attempts"}},
  {{"key","listen_ip"},           {"aliases", {"li"}},             {"type","string"}, {"default","0.0.0.0"}, {"description","Interface to bind while waiting for the peer"}},
  {{"key","listen_port"},         {"aliases", {"lp"}},             {"type","int"},    {"default",47800},     {"min",-1}, {"max",65535},   {"description","TCP port to listen on (-1 disables, 0 picks one)"}},
  {{"key","peer_address"},        {"aliases", {"peer","pa"}},      {"type","string"}, {"default",""},        {"description","Peer host:port to dial; empty waits for the peer"}},
  {{"key","dest_dir"},            {"aliases", {"dest","d"}},       {"type","string"}, {"default","."},       {"description","Receiver destination directory"}},
  {{"key","rollback_on_failure"}, {"aliases", {"rollback","rb"}},  {"type","bool"},   {"default",false},     {"description","Remove entries already received when the session fails"}},
  {{"key","token_env"},           {"aliases", {"te"}},             {"type","string"}, {"default","PEERSEND_TOKEN"}, {"description","Environment variable holding the shared secret"}},
  {{"key","verbose"},             {"aliases", {"v"}},              {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}},
  {{"key","transfer_progress"},   {"aliases", {"progress","tp"}},  {"type","bool"},   {"default",true},      {"description","Show the progress meter during transfers"}},
  {{"key","progress_meter_size"}, {"aliases", {"meter","meter_size","pms"}}, {"type","int"}, {"default",40}, {"min",1}, {"max",400}, {"description","Width of the progress bar in characters"}},
  {{"key","help"},                {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},        {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType { Bool, Int, Size, String };

struct SettingSpec {
  std::string key;
  std::vector<std::string> aliases;   // lowercase
  SettingType type = SettingType::String;
  nlohmann::json default_value;
  std::optional<int> min;
  std::optional<int> max;
  std::string description;
  bool persistent = true;
};

const char* setting_type_name(SettingType type);

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!values_.contains(key)) throw std::runtime_error("Unknown setting: " + key);
    return values_.at(key).get<T>();
  }

  // Byte count of a "size" setting ("5m" -> 5242880).
  uint64_t get_size(const std::string& key) const;
  bool is_default(const std::string& key) const;

  // Parses `value` according to the setting's type and bounds. On failure
  // the stored value is unchanged and `error` says why.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  // Missing file is not an error; invalid entries are reported and skipped.
  bool load();
  bool save() const;
  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { path_override_ = path; }

  bool help_requested() const { return get<bool>("help"); }
  bool save_requested() const { return get<bool>("save"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;

  // Looks a key or alias up case-insensitively.
  const SettingSpec* find(const std::string& token) const;
  const std::vector<SettingSpec>& specs() const { return specs_; }

  static std::optional<bool> parse_bool(const std::string& text);

private:
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);

  std::vector<SettingSpec> specs_;
  nlohmann::json values_;
  std::filesystem::path path_override_;
};
