#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","role"},                   {"aliases", {"r"}},                {"type","string"}, {"default","receiver"}, {"choices", {"receiver","sender"}},          {"description","receiver (advertises) or sender (browses)"}, {"persistent", true}},
  {{"key","device_name"},            {"aliases", {"name","dn"}},        {"type","string"}, {"default",""},                  {"description","Identity announced to peers (random when empty)"}, {"persistent", true}},
  {{"key","service_type"},           {"aliases", {"service","st"}},     {"type","string"}, {"default","mediabeam"},         {"description","Service type shared by advertiser and browser"}, {"persistent", true}},
  {{"key","listen_ip"},              {"aliases", {"li"}},               {"type","string"}, {"default","0.0.0.0"},           {"description","Interface/IP the session listener binds"}, {"persistent", true}},
  {{"key","listen_port"},            {"aliases", {"lp"}},               {"type","int"},    {"default",0}, {"min",0}, {"max",65535},                   {"description","TCP session port (0 = ephemeral)"}, {"persistent", true}},
  {{"key","discovery_port"},         {"aliases", {"dp"}},               {"type","int"},    {"default",47800}, {"min",0}, {"max",65535},               {"description","UDP port beacons are sent to and received on"}, {"persistent", true}},
  {{"key","discovery_target"},       {"aliases", {"dt"}},               {"type","string"}, {"default","255.255.255.255"},   {"description","Beacon destination address"}, {"persistent", true}},
  {{"key","beacon_interval_ms"},     {"aliases", {"bim"}},              {"type","int"},    {"default",1000}, {"min",50},                {"description","Milliseconds between discovery beacons"}, {"persistent", true}},
  {{"key","peer_timeout_ms"},        {"aliases", {"ptm"}},              {"type","int"},    {"default",5000}, {"min",100},                {"description","Milliseconds of beacon silence before a peer is lost"}, {"persistent", true}},
  {{"key","invite_context"},         {"aliases", {"ic"}},               {"type","string"}, {"default","Sender-Connection"}, {"description","Context string sent with invitations"}, {"persistent", true}},
  {{"key","accept_context_marker"},  {"aliases", {"acm"}},              {"type","string"}, {"default","Sender"},            {"description","Invitations whose context contains this are accepted"}, {"persistent", true}},
  {{"key","auto_invite_marker"},     {"aliases", {"aim"}},              {"type","string"}, {"default","TV"},                {"description","Browser auto-invites peers whose identity contains this"}, {"persistent", true}},
  {{"key","invite_timeout_ms"},      {"aliases", {"itm"}},              {"type","int"},    {"default",10000}, {"min",100},               {"description","Milliseconds to wait for an invitation response"}, {"persistent", true}},
  {{"key","retry_max"},              {"aliases", {"rm"}},               {"type","int"},    {"default",3}, {"min",0},                   {"description","Reconnection attempts before giving up"}, {"persistent", true}},
  {{"key","retry_base_delay_ms"},    {"aliases", {"rbd"}},              {"type","int"},    {"default",2000}, {"min",0},                {"description","Base reconnection delay, multiplied by the attempt"}, {"persistent", true}},
  {{"key","discovery_retry_ms"},     {"aliases", {"drm"}},              {"type","int"},    {"default",5000}, {"min",0},                {"description","Delay before retrying a failed discovery start"}, {"persistent", true}},
  {{"key","discovery_busy_retry_ms"},{"aliases", {"dbr"}},              {"type","int"},    {"default",10000}, {"min",0},               {"description","Retry delay when the discovery socket is busy"}, {"persistent", true}},
  {{"key","progress_settle_ms"},     {"aliases", {"psm"}},              {"type","int"},    {"default",1000}, {"min",0},                {"description","Delay between 100% progress and the settled event"}, {"persistent", true}},
  {{"key","modal_drain_delay_ms"},   {"aliases", {"mdd"}},              {"type","int"},    {"default",300}, {"min",0},                 {"description","Delay before draining the queue after a modal closes"}, {"persistent", true}},
  {{"key","video_transport"},        {"aliases", {"vt"}},               {"type","string"}, {"default","resource"}, {"choices", {"resource","stream"}},          {"description","How videos are sent: resource or stream"}, {"persistent", true}},
  {{"key","stream_chunk_size"},      {"aliases", {"scs"}},              {"type","int"},    {"default",65536}, {"min",1024}, {"max",524288},               {"description","Payload bytes per streamed video chunk"}, {"persistent", true}},
  {{"key","cache_capacity"},         {"aliases", {"cc"}},               {"type","int"},    {"default",10}, {"min",1},                  {"description","Decoded assets kept in memory"}, {"persistent", true}},
  {{"key","preload_window"},         {"aliases", {"pw"}},               {"type","int"},    {"default",5}, {"min",0},                   {"description","Items preloaded at start and around the current item"}, {"persistent", true}},
  {{"key","preload_workers"},        {"aliases", {"pwk"}},              {"type","int"},    {"default",2}, {"min",1}, {"max",64},                   {"description","Worker threads for preloads and persistence"}, {"persistent", true}},
  {{"key","memory_poll_ms"},         {"aliases", {"mpm"}},              {"type","int"},    {"default",5000}, {"min",0},                {"description","Milliseconds between memory pressure samples (0 = off)"}, {"persistent", true}},
  {{"key","memory_warning_ratio"},   {"aliases", {"mwr"}},              {"type","float"},  {"default",0.85}, {"min",0}, {"max",1},                {"description","Used memory ratio that raises a warning"}, {"persistent", true}},
  {{"key","memory_critical_ratio"},  {"aliases", {"mcr"}},              {"type","float"},  {"default",0.95}, {"min",0}, {"max",1},                {"description","Used memory ratio that is critical"}, {"persistent", true}},
  {{"key","media_dir"},              {"aliases", {"md","dir"}},         {"type","string"}, {"default","media"},             {"description","Directory holding received media"}, {"persistent", true}},
  {{"key","keep_recent"},            {"aliases", {"kr"}},               {"type","int"},    {"default",0}, {"min",0},                   {"description","Received items kept at start, oldest removed first (0 = keep all)"}, {"persistent", true}},
  {{"key","verbose"},                {"aliases", {"v"}},                {"type","bool"},   {"default",false},               {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                   {"aliases", {"h","?"}},            {"type","bool"},   {"default",false},               {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                   {"aliases", {"persist"}},          {"type","bool"},   {"default",false},               {"description","Persist current settings to disk"}, {"persistent", false}}
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

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  // Startup checks that span several settings; throws std::runtime_error.
  void validate() const;

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::vector<std::string> choices;
    std::optional<double> min;
    std::optional<double> max;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const std::vector<SettingSpec>& setting_specs() const { return setting_specs_; }

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  static bool check_range(const SettingSpec& spec, double value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;


  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    if(entry.contains("choices")) {
      spec.choices = entry.at("choices").get<std::vector<std::string>>();
    }
    if(entry.contains("min")) spec.min = entry.at("min").get<double>();
    if(entry.contains("max")) spec.max = entry.at("max").get<double>();
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
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
  out.reserve(setting_specs().size());
  for(const auto& spec : setting_specs()) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const std::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return true;
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs()) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
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
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    if(!check_range(spec, value.get<double>(), error)) return false;
    settings_[spec.key] = value.get<int>();
    return true;
  }
  if(spec.type == "float") {
    if(!value.is_number()) {
      error = "expected number";
      return false;
    }
    if(!check_range(spec, value.get<double>(), error)) return false;
    settings_[spec.key] = value.get<double>();
    return true;
  }
  if(spec.type == "string") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    auto text = value.get<std::string>();
    if(!spec.choices.empty() &&
       std::find(spec.choices.begin(), spec.choices.end(), to_lower(text)) == spec.choices.end()) {
      error = "expected one of";
      for(const auto& choice : spec.choices) error += " " + choice;
      return false;
    }
    settings_[spec.key] = spec.choices.empty() ? text : to_lower(text);
    return true;
  }
  if(spec.type == "json") {
    settings_[spec.key] = value;
    return true;
  }
  error = "unknown type";
  return false;
}

inline bool SettingsManager::check_range(const SettingSpec& spec, double value, std::string& error) {
  if(spec.min && value < *spec.min) {
    error = fmt::format("must be at least {}", *spec.min);
    return false;
  }
  if(spec.max && value > *spec.max) {
    error = fmt::format("must be at most {}", *spec.max);
    return false;
  }
  return true;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                             const std::string& value,
                                                             std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      return std::stoi(clean);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "float") {
    try {
      return std::stod(clean);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  if(spec.type == "json") {
    try {
      return nlohmann::json::parse(clean);
    } catch(const std::exception& e) {
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
  return convert_and_store(*spec, parsed, error);
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
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

inline void SettingsManager::validate() const {
  double warning = settings_.at("memory_warning_ratio").get<double>();
  double critical = settings_.at("memory_critical_ratio").get<double>();
  if(warning >= critical) {
    throw std::runtime_error(fmt::format(
      "memory_warning_ratio ({}) must be below memory_critical_ratio ({})", warning, critical));
  }
  if(settings_.at("service_type").get<std::string>().empty()) {
    throw std::runtime_error("service_type must not be empty");
  }
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
