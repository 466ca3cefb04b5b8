#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "log.hpp"
#include "utils.hpp"

namespace {

std::string lowered(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string trimmed(const std::string& value) {
  auto first = std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); });
  auto last = std::find_if(value.rbegin(), value.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base();
  return first < last ? std::string(first, last) : std::string();
}

SettingType type_from_name(const std::string& name) {
  if(name == "bool") return SettingType::Bool;
  if(name == "int") return SettingType::Int;
  if(name == "size") return SettingType::Size;
  if(name == "string") return SettingType::String;
  throw std::invalid_argument("Unknown setting type '" + name + "'");
}

std::vector<SettingSpec> parse_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> specs;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      spec.aliases.push_back(lowered(alias));
    }
    spec.type = type_from_name(entry.at("type").get<std::string>());
    spec.default_value = entry.at("default");
    if(entry.contains("min")) spec.min = entry.at("min").get<int>();
    if(entry.contains("max")) spec.max = entry.at("max").get<int>();
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    specs.push_back(std::move(spec));
  }
  return specs;
}

} // namespace

const char* setting_type_name(SettingType type) {
  switch(type) {
    case SettingType::Bool: return "bool";
    case SettingType::Int: return "int";
    case SettingType::Size: return "size";
    case SettingType::String: return "string";
  }
  return "?";
}

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specs_(parse_specs(specification)), values_(nlohmann::json::object()) {
  for(const auto& spec : specs_) values_[spec.key] = spec.default_value;
}

const SettingSpec* SettingsManager::find(const std::string& token) const {
  auto name = lowered(token);
  for(const auto& spec : specs_) {
    if(name == lowered(spec.key)) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), name) != spec.aliases.end()) return &spec;
  }
  return nullptr;
}

uint64_t SettingsManager::get_size(const std::string& key) const {
  return parse_size(get<std::string>(key));
}

bool SettingsManager::is_default(const std::string& key) const {
  const auto* spec = find(key);
  return spec && values_.at(spec->key) == spec->default_value;
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  for(const auto& spec : specs_) out.push_back(spec.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!values_.contains(key)) return "<unknown>";
  const auto& value = values_.at(key);
  if(value.is_string()) return value.get<std::string>();
  return value.dump();
}

std::optional<bool> SettingsManager::parse_bool(const std::string& text) {
  auto v = lowered(trimmed(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* spec = find(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto clean = trimmed(value);
  switch(spec->type) {
    case SettingType::Bool: {
      auto flag = parse_bool(clean);
      if(!flag) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      return store(*spec, *flag, error);
    }
    case SettingType::Int: {
      std::size_t used = 0;
      int number = 0;
      try {
        number = std::stoi(clean, &used);
      } catch(const std::logic_error&) {
        used = 0;
      }
      if(used == 0 || used != clean.size()) {
        error = "expected integer, got '" + clean + "'";
        return false;
      }
      return store(*spec, number, error);
    }
    case SettingType::Size:
    case SettingType::String:
      return store(*spec, clean, error);
  }
  error = "unsupported type";
  return false;
}

bool SettingsManager::store(const SettingSpec& spec, const nlohmann::json& value, std::string& error) {
  switch(spec.type) {
    case SettingType::Bool:
      if(!value.is_boolean()) {
        error = "expected boolean";
        return false;
      }
      break;
    case SettingType::Int: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      auto number = value.get<int64_t>();
      if((spec.min && number < *spec.min) || (spec.max && number > *spec.max)) {
        error = "must be between " + std::to_string(spec.min.value_or(INT32_MIN)) + " and " +
                std::to_string(spec.max.value_or(INT32_MAX));
        return false;
      }
      break;
    }
    case SettingType::Size:
      if(value.is_number_unsigned()) {
        values_[spec.key] = std::to_string(value.get<uint64_t>());
        return true;
      }
      if(!value.is_string()) {
        error = "expected size (e.g. 64k, 5m)";
        return false;
      }
      try {
        parse_size(value.get<std::string>());
      } catch(const std::invalid_argument& e) {
        error = e.what();
        return false;
      }
      break;
    case SettingType::String:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      break;
  }
  values_[spec.key] = value;
  return true;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!path_override_.empty()) return path_override_;
  return std::filesystem::current_path() / ".config" / "peersend.json";
}

bool SettingsManager::load() {
  auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;

  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::parse_error& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: expected a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find(item.key());
    if(!spec || !spec->persistent) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

bool SettingsManager::save() const {
  auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(spec.persistent) doc[spec.key] = values_.at(spec.key);
  }
  out << doc.dump(2);
  return static_cast<bool>(out);
}
