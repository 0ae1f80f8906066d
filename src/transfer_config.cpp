#include "transfer_config.hpp"

#include <stdexcept>

#include "settings_manager.hpp"

namespace {

std::chrono::milliseconds millis_setting(const SettingsManager& settings, const std::string& key) {
  int value = settings.get<int>(key);
  if(value < 0) throw std::invalid_argument(key + " must not be negative");
  return std::chrono::milliseconds(value);
}

std::chrono::seconds seconds_setting(const SettingsManager& settings, const std::string& key) {
  int value = settings.get<int>(key);
  if(value <= 0) throw std::invalid_argument(key + " must be positive");
  return std::chrono::seconds(value);
}

std::size_t attempts_setting(const SettingsManager& settings, const std::string& key) {
  int value = settings.get<int>(key);
  if(value < 1) throw std::invalid_argument(key + " must be at least 1");
  return static_cast<std::size_t>(value);
}

} // namespace

void validate_transfer_config(const TransferConfig& config) {
  if(config.remote_root.empty()) throw std::invalid_argument("remote_root must not be empty");
  if(config.remote_tmp.empty()) throw std::invalid_argument("remote_tmp must not be empty");
  if(config.local_cache.empty()) throw std::invalid_argument("local_cache must not be empty");
  if(config.chunk_size == 0) throw std::invalid_argument("chunk_size must be positive");
  if(config.block_size == 0) throw std::invalid_argument("block_size must be positive");
  if(config.overlap >= config.chunk_size) {
    throw std::invalid_argument("overlap (" + std::to_string(config.overlap) +
                                ") must be smaller than chunk_size (" +
                                std::to_string(config.chunk_size) + ")");
  }
  if(config.chunk_retry.max_attempts == 0) throw std::invalid_argument("chunk_retries must be at least 1");
  if(config.task_retry.max_attempts == 0) throw std::invalid_argument("task_retries must be at least 1");
  if(config.size_query_retry.max_attempts == 0) throw std::invalid_argument("size_query_retries must be at least 1");
}

TransferConfig load_transfer_config(const SettingsManager& settings) {
  TransferConfig config;
  config.remote_root = settings.get<std::string>("remote_root");
  config.remote_tmp = settings.get<std::string>("remote_tmp");
  config.local_cache = settings.get<std::string>("local_cache");
  config.work_dir = settings.get<std::string>("work_dir");

  config.chunk_size = settings.get<uint64_t>("chunk_size");
  config.overlap = settings.get<uint64_t>("overlap");
  config.block_size = settings.get<uint64_t>("block_size");

  config.chunk_retry.max_attempts = attempts_setting(settings, "chunk_retries");
  config.chunk_retry.base_delay = millis_setting(settings, "chunk_backoff_ms");
  config.chunk_retry.max_delay = millis_setting(settings, "chunk_backoff_max_ms");

  config.task_retry.max_attempts = attempts_setting(settings, "task_retries");
  config.task_retry.base_delay = millis_setting(settings, "task_backoff_ms");
  config.task_retry.max_delay = millis_setting(settings, "task_backoff_max_ms");

  config.size_query_retry.max_attempts = attempts_setting(settings, "size_query_retries");
  config.size_query_retry.base_delay = millis_setting(settings, "size_query_delay_ms");
  config.size_query_retry.max_delay = config.size_query_retry.base_delay;

  config.probe_timeout = seconds_setting(settings, "probe_timeout_s");
  config.pack_timeout = seconds_setting(settings, "pack_timeout_s");
  config.fetch_timeout = seconds_setting(settings, "fetch_timeout_s");
  config.checksum_timeout = seconds_setting(settings, "checksum_timeout_s");

  config.cleanup_remote = settings.get<bool>("cleanup");
  config.cache_marker = settings.get<std::string>("cache_marker");

  const auto extensions = settings.get<nlohmann::json>("cache_media_extensions");
  if(!extensions.is_array()) throw std::invalid_argument("cache_media_extensions must be a JSON array");
  config.cache_media_extensions.clear();
  for(const auto& ext : extensions) {
    if(!ext.is_string()) throw std::invalid_argument("cache_media_extensions entries must be strings");
    config.cache_media_extensions.push_back(ext.get<std::string>());
  }

  validate_transfer_config(config);
  return config;
}
