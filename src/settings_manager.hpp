#pragma once

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","enabled"},                  {"aliases", {"e","on"}},            {"type","bool"},   {"default",false},       {"description","Take part in LAN discovery and sync"}, {"persistent", true}},
  {{"key","nickname"},                 {"aliases", {"n","nick"}},          {"type","string"}, {"default",""},          {"description","Name shown to other peers"}, {"persistent", true}},
  {{"key","show_nickname"},            {"aliases", {"sn"}},                {"type","bool"},   {"default",true},        {"description","Include the nickname in discovery answers"}, {"persistent", true}},
  {{"key","visibility"},               {"aliases", {"vis"}},               {"type","enum"},   {"default","invisible"}, {"choices", {"invisible","friends_only","authorized_only","everyone"}},
                                                                                                                     {"description","Who may see this peer on the network"}, {"persistent", true}},
  {{"key","discovery_port"},           {"aliases", {"dp","port"}},         {"type","int"},    {"default",19847},       {"min",1}, {"max",65505}, {"description","UDP discovery port (+10/+20/+30 tried when busy)"}, {"persistent", true}},
  {{"key","blocked_peers"},            {"aliases", {"blocked"}},           {"type","json"},   {"default",nlohmann::json::array()}, {"description","Peer ids that are never answered or listed"}, {"persistent", true}},
  {{"key","max_concurrent_transfers"}, {"aliases", {"mct","parallel"}},    {"type","int"},    {"default",3},           {"min",1}, {"max",64}, {"description","Transfers allowed to run at once"}, {"persistent", true}},
  {{"key","app_version"},              {"aliases", {"av"}},                {"type","string"}, {"default",""},          {"description","Version advertised in discovery (empty = build version)"}, {"persistent", true}},
  {{"key","data_dir"},                 {"aliases", {"dd","data"}},         {"type","string"}, {"default",""},          {"description","Directory for invites, watches and history (empty = cwd)"}, {"persistent", false}},
  {{"key","verbose"},                  {"aliases", {"v"}},                 {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                     {"aliases", {"h","?"}},             {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                     {"aliases", {"persist"}},           {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  std::string describe(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    std::vector<std::string> choices;
    std::optional<int> min;
    std::optional<int> max;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> specs_;
  std::filesystem::path settings_path_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", nlohmann::json::array())) {
      spec.aliases.push_back(to_lower(alias.get<std::string>()));
    }
    spec.type = entry.at("type").get<std::string>();
    if(entry.contains("choices")) {
      spec.choices = entry.at("choices").get<std::vector<std::string>>();
    }
    if(entry.contains("min")) spec.min = entry.at("min").get<int>();
    if(entry.contains("max")) spec.max = entry.at("max").get<int>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  auto lowered = to_lower(token);
  for(const auto& spec : specs_) {
    if(lowered == to_lower(spec.key)) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(specs_.size());
  for(const auto& spec : specs_) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::string SettingsManager::describe(const std::string& key) const {
  const auto* spec = find_spec(key);
  if(!spec) return std::string();
  if(spec->choices.empty()) return spec->description;
  std::string out = spec->description + " (";
  for(std::size_t i = 0; i < spec->choices.size(); ++i) {
    if(i > 0) out += "|";
    out += spec->choices[i];
  }
  return out + ")";
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

inline bool SettingsManager::store(const SettingSpec& spec,
                                   const nlohmann::json& value,
                                   std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      int parsed = value.get<int>();
      if((spec.min && parsed < *spec.min) || (spec.max && parsed > *spec.max)) {
        error = "expected a value between " + std::to_string(spec.min.value_or(INT_MIN)) +
                " and " + std::to_string(spec.max.value_or(INT_MAX));
        return false;
      }
      settings_[spec.key] = parsed;
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  if(spec.type == "enum") {
    if(!value.is_string()) {
      error = "expected one of the listed choices";
      return false;
    }
    auto lowered = to_lower(value.get<std::string>());
    if(std::find(spec.choices.begin(), spec.choices.end(), lowered) == spec.choices.end()) {
      error = "unsupported value '" + value.get<std::string>() + "'";
      return false;
    }
    settings_[spec.key] = lowered;
    return true;
  }
  if(spec.type == "json") {
    settings_[spec.key] = value;
    return true;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  auto clean = trim(value);
  if(spec.type == "bool") {
    auto v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t used = 0;
      int parsed = std::stoi(clean, &used);
      if(used != clean.size()) {
        error = "expected integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string" || spec.type == "enum") {
    return clean;
  }
  if(spec.type == "json") {
    try {
      return nlohmann::json::parse(clean);
    } catch(const nlohmann::json::exception& e) {
      error = e.what();
      return {};
    }
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
