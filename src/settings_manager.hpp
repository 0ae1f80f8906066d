#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

inline constexpr const char* kSettingsEnvPrefix = "TARPULL_";

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","source_id"},              {"aliases", {"source","uid"}},      {"type","string"}, {"default",""},       {"description","Source identity (first path level under remote_root)"}, {"persistent", false}},
  {{"key","item_id"},                {"aliases", {"item"}},              {"type","string"}, {"default",""},       {"description","Item identity (directory to transfer)"}, {"persistent", false}},
  {{"key","remote_root"},            {"aliases", {"rr"}},                {"type","string"}, {"default","/storage/emulated/0/Android/data/tv.danmaku.bili/download"}, {"description","Remote directory holding <source>/<item>"}, {"persistent", true}},
  {{"key","remote_tmp"},             {"aliases", {"rt"}},                {"type","string"}, {"default","/data/local/tmp"}, {"description","Remote scratch directory for archives"}, {"persistent", true}},
  {{"key","local_cache"},            {"aliases", {"cache","lc"}},        {"type","string"}, {"default","bili_local_cache"}, {"description","Local cache root"}, {"persistent", true}},
  {{"key","work_dir"},               {"aliases", {"wd"}},                {"type","string"}, {"default",""},       {"description","Directory for chunk parts and merged archive (empty = local_cache)"}, {"persistent", true}},
  {{"key","channel_program"},        {"aliases", {"channel","rish"}},    {"type","string"}, {"default","/bin/sh"}, {"description","Exec channel binary; reads one command on stdin"}, {"persistent", true}},
  {{"key","channel_args"},           {"aliases", {"ca"}},                {"type","json"},   {"default",nlohmann::json::array()}, {"description","Extra arguments for the channel binary (JSON array)"}, {"persistent", true}},
  {{"key","channel_app_id"},         {"aliases", {"app_id"}},            {"type","string"}, {"default",""},       {"description","RISH_APPLICATION_ID exported to the channel"}, {"persistent", true}},
  {{"key","channel_timeout_retries"},{"aliases", {"ctr"}},               {"type","int"},    {"default",2},        {"description","Re-issues of a timed-out channel command"}, {"persistent", true}},
  {{"key","chunk_size"},             {"aliases", {"cs"}},                {"type","size"},   {"default",10485760}, {"description","Chunk size in bytes (K/M/G suffixes allowed)"}, {"persistent", true}},
  {{"key","overlap"},                {"aliases", {"ov"}},                {"type","size"},   {"default",1024},     {"description","Bytes shared by consecutive chunks"}, {"persistent", true}},
  {{"key","block_size"},             {"aliases", {"bs"}},                {"type","size"},   {"default",1024},     {"description","dd block size"}, {"persistent", true}},
  {{"key","chunk_retries"},          {"aliases", {"cr"}},                {"type","int"},    {"default",5},        {"description","Attempts per chunk"}, {"persistent", true}},
  {{"key","chunk_backoff_ms"},       {"aliases", {"cb"}},                {"type","int"},    {"default",2000},     {"description","First per-chunk retry delay"}, {"persistent", true}},
  {{"key","chunk_backoff_max_ms"},   {"aliases", {"cbm"}},               {"type","int"},    {"default",60000},    {"description","Per-chunk retry delay cap"}, {"persistent", true}},
  {{"key","task_retries"},           {"aliases", {"tr","retries"}},      {"type","int"},    {"default",5},        {"description","Whole-pipeline attempts"}, {"persistent", true}},
  {{"key","task_backoff_ms"},        {"aliases", {"tb"}},                {"type","int"},    {"default",5000},     {"description","First whole-pipeline retry delay"}, {"persistent", true}},
  {{"key","task_backoff_max_ms"},    {"aliases", {"tbm"}},               {"type","int"},    {"default",120000},   {"description","Whole-pipeline retry delay cap"}, {"persistent", true}},
  {{"key","size_query_retries"},     {"aliases", {"sqr"}},               {"type","int"},    {"default",3},        {"description","Attempts to read the remote archive size"}, {"persistent", true}},
  {{"key","size_query_delay_ms"},    {"aliases", {"sqd"}},               {"type","int"},    {"default",1000},     {"description","Delay between size queries"}, {"persistent", true}},
  {{"key","probe_timeout_s"},        {"aliases", {"pto"}},               {"type","int"},    {"default",10},       {"description","Timeout for test/rm/stat commands"}, {"persistent", true}},
  {{"key","pack_timeout_s"},         {"aliases", {"pkt"}},               {"type","int"},    {"default",300},      {"description","Timeout for the remote tar command"}, {"persistent", true}},
  {{"key","fetch_timeout_s"},        {"aliases", {"fto"}},               {"type","int"},    {"default",60},       {"description","Minimum timeout for one chunk read"}, {"persistent", true}},
  {{"key","checksum_timeout_s"},     {"aliases", {"cto"}},               {"type","int"},    {"default",60},       {"description","Timeout for the remote md5sum"}, {"persistent", true}},
  {{"key","cleanup"},                {"aliases", {"clean"}},             {"type","bool"},   {"default",true},     {"description","Remove the remote archive when the task ends"}, {"persistent", true}},
  {{"key","cache_marker"},           {"aliases", {"marker"}},            {"type","string"}, {"default","entry.json"}, {"description","File whose presence marks a complete cache entry"}, {"persistent", true}},
  {{"key","cache_media_extensions"}, {"aliases", {"media"}},             {"type","json"},   {"default",nlohmann::json::array({".m4s",".mp4",".blv",".m4a"})}, {"description","Media extensions that also mark a cache entry"}, {"persistent", true}},
  {{"key","transfer_progress"},      {"aliases", {"progress","tp"}},     {"type","bool"},   {"default",true},     {"description","Show a progress meter while fetching"}, {"persistent", true}},
  {{"key","verbose"},                {"aliases", {"v"}},                 {"type","bool"},   {"default",false},    {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},               {"aliases", {"lf"}},                {"type","string"}, {"default",""},       {"description","Also write logs to this file"}, {"persistent", true}},
  {{"key","config"},                 {"aliases", {"c"}},                 {"type","string"}, {"default",""},       {"description","Settings file to load instead of .config/tarpull.json"}, {"persistent", false}},
  {{"key","help"},                   {"aliases", {"h","?"}},             {"type","bool"},   {"default",false},    {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                   {"aliases", {"persist"}},           {"type","bool"},   {"default",false},    {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Parses "1048576", "512K", "10M", "10MiB", "1G". Throws std::invalid_argument.
inline uint64_t parse_size(const std::string& text) {
  std::string clean = to_lower(trim_copy(text));
  if(clean.empty()) throw std::invalid_argument("empty size");
  std::size_t digits = 0;
  while(digits < clean.size() && std::isdigit(static_cast<unsigned char>(clean[digits]))) ++digits;
  if(digits == 0) throw std::invalid_argument("size must start with a number");
  uint64_t value = std::stoull(clean.substr(0, digits));
  std::string suffix = trim_copy(clean.substr(digits));
  uint64_t multiplier = 1;
  if(suffix.empty() || suffix == "b") {
    multiplier = 1;
  } else if(suffix == "k" || suffix == "kb" || suffix == "kib") {
    multiplier = 1024ULL;
  } else if(suffix == "m" || suffix == "mb" || suffix == "mib") {
    multiplier = 1024ULL * 1024;
  } else if(suffix == "g" || suffix == "gb" || suffix == "gib") {
    multiplier = 1024ULL * 1024 * 1024;
  } else {
    throw std::invalid_argument("unknown size suffix '" + suffix + "'");
  }
  return value * multiplier;
}

enum class SettingType { Bool, Int, Size, String, Json };

namespace settings_detail {

inline SettingType type_from_name(const std::string& name) {
  if(name == "bool") return SettingType::Bool;
  if(name == "int") return SettingType::Int;
  if(name == "size") return SettingType::Size;
  if(name == "string") return SettingType::String;
  if(name == "json") return SettingType::Json;
  throw std::invalid_argument("unknown setting type '" + name + "'");
}

inline bool word_to_bool(const std::string& text) {
  const auto word = to_lower(trim_copy(text));
  if(word == "true" || word == "1" || word == "on" || word == "yes") return true;
  if(word == "false" || word == "0" || word == "off" || word == "no") return false;
  throw std::invalid_argument("expected boolean (true|false|on|off)");
}

inline int text_to_int(const std::string& text) {
  std::size_t consumed = 0;
  const int value = std::stoi(text, &consumed);
  if(consumed != text.size()) throw std::invalid_argument("trailing characters after integer");
  return value;
}

// Text from argv or the environment, turned into JSON of the declared type.
inline nlohmann::json coerce_text(SettingType type, const std::string& text) {
  const auto clean = trim_copy(text);
  switch(type) {
    case SettingType::Bool: return word_to_bool(clean);
    case SettingType::Int: return text_to_int(clean);
    case SettingType::Size: return parse_size(clean);
    case SettingType::String: return clean;
    case SettingType::Json: return nlohmann::json::parse(clean);
  }
  throw std::invalid_argument("unsupported type");
}

// JSON from a settings file, checked against the declared type.
inline nlohmann::json coerce_json(SettingType type, const nlohmann::json& value) {
  switch(type) {
    case SettingType::Bool:
      if(value.is_boolean()) return value;
      if(value.is_number_integer()) return value.get<int64_t>() != 0;
      throw std::invalid_argument("expected boolean");
    case SettingType::Int:
      if(value.is_number_integer()) return value.get<int>();
      throw std::invalid_argument("expected integer");
    case SettingType::Size:
      if(value.is_string()) return parse_size(value.get<std::string>());
      if(value.is_number_integer() && value.get<int64_t>() >= 0) return value.get<uint64_t>();
      throw std::invalid_argument("expected byte count");
    case SettingType::String:
      if(value.is_string()) return value;
      throw std::invalid_argument("expected string");
    case SettingType::Json:
      return value;
  }
  throw std::invalid_argument("unsupported type");
}

} // namespace settings_detail

// Typed settings declared by a JSON table (key, aliases, type, default, persistent).
// Layering: defaults, then the settings file, then TARPULL_* variables, then argv.
class SettingsManager {
public:
  SettingsManager() : SettingsManager(SETTINGS_SPECIFICATION) {}
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    const auto found = values_.find(key);
    if(found == values_.end()) throw std::runtime_error("Unknown setting: " + key);
    return found->get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  // Both return false and describe the problem in error instead of throwing.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load() { return load_from_file(settings_path()); }
  bool save() const { return save_to_file(settings_path()); }
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  // Applies <prefix><KEY> variables (upper-cased key). Returns the number applied.
  std::size_t apply_environment(const std::string& prefix = kSettingsEnvPrefix);

  bool save_requested() const { return flag("save"); }
  bool help_requested() const { return flag("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { path_override_ = path; }

private:
  struct Declared {
    std::string key;
    SettingType type = SettingType::String;
    bool persistent = true;
  };

  const Declared* lookup(const std::string& token) const;
  bool flag(const std::string& key) const { return has(key) && values_.at(key).get<bool>(); }
  nlohmann::json persistent_values() const;
  void merge_document(const nlohmann::json& doc, const std::string& origin);

  template<typename Coerce>
  bool store(const std::string& key, std::string& error, Coerce coerce);

  std::vector<Declared> declared_;
  // lower-cased key or alias -> index into declared_
  std::map<std::string, std::size_t> names_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path path_override_;
};

inline SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    Declared declared;
    declared.key = entry.at("key").get<std::string>();
    declared.type = settings_detail::type_from_name(entry.at("type").get<std::string>());
    declared.persistent = entry.value("persistent", true);

    const std::size_t index = declared_.size();
    names_[to_lower(declared.key)] = index;
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      names_.emplace(to_lower(alias), index);
    }
    values_[declared.key] = entry.at("default");
    declared_.push_back(std::move(declared));
  }
}

inline const SettingsManager::Declared* SettingsManager::lookup(const std::string& token) const {
  const auto found = names_.find(to_lower(token));
  return found == names_.end() ? nullptr : &declared_[found->second];
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  const auto* declared = lookup(token);
  if(!declared) return std::nullopt;
  return declared->key;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* declared = lookup(key);
  return declared && declared->type == SettingType::Bool;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!path_override_.empty()) return path_override_;
  return std::filesystem::current_path() / ".config" / "tarpull.json";
}

template<typename Coerce>
inline bool SettingsManager::store(const std::string& key, std::string& error, Coerce coerce) {
  error.clear();
  const auto* declared = lookup(key);
  if(!declared) {
    error = "unknown setting";
    return false;
  }
  try {
    values_[declared->key] = coerce(declared->type);
    return true;
  } catch(const std::exception& e) {
    // std::stoi and nlohmann::json::parse report through their own exception types
    error = e.what();
    return false;
  }
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  return store(key, error, [&](SettingType type){ return settings_detail::coerce_text(type, value); });
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  return store(key, error, [&](SettingType type){ return settings_detail::coerce_json(type, value); });
}

inline void SettingsManager::merge_document(const nlohmann::json& doc, const std::string& origin) {
  if(!doc.is_object()) {
    print_err("Ignoring {}: expected a JSON object", origin);
    return;
  }
  for(const auto& item : doc.items()) {
    std::string error;
    if(!lookup(item.key())) {
      print_err("Ignoring unknown setting '{}' in {}", item.key(), origin);
    } else if(!set_from_json(item.key(), item.value(), error)) {
      print_err("Ignoring invalid setting '{}' in {}: {}", item.key(), origin, error);
    }
  }
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(path.empty() || !in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err("Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  merge_document(doc, path.string());
  return true;
}

inline nlohmann::json SettingsManager::persistent_values() const {
  auto doc = nlohmann::json::object();
  for(const auto& declared : declared_) {
    if(declared.persistent) doc[declared.key] = values_.at(declared.key);
  }
  return doc;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  if(path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  out << persistent_values().dump(2);
  if(!out) {
    print_err("Unable to write {}", path.string());
    return false;
  }
  return true;
}

inline std::size_t SettingsManager::apply_environment(const std::string& prefix) {
  std::size_t applied = 0;
  for(const auto& declared : declared_) {
    std::string variable = prefix;
    for(char ch : declared.key) variable.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    const char* raw = std::getenv(variable.c_str());
    if(!raw) continue;
    std::string error;
    if(set_from_string(declared.key, raw, error)) {
      ++applied;
    } else {
      print_err("Ignoring {}: {}", variable, error);
    }
  }
  return applied;
}
