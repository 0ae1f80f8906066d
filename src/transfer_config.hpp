#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "backoff.hpp"
#include "chunk_planner.hpp"

class SettingsManager;

// Everything one TransferEngine needs; passed by value, never shared mutable state.
struct TransferConfig {
  std::string remote_root = "/storage/emulated/0/Android/data/tv.danmaku.bili/download";
  std::string remote_tmp = "/data/local/tmp";
  std::filesystem::path local_cache = "bili_local_cache";
  std::filesystem::path work_dir;  // empty = local_cache

  uint64_t chunk_size = kDefaultChunkSize;
  uint64_t overlap = kDefaultOverlap;
  uint64_t block_size = kDefaultBlockSize;

  BackoffPolicy chunk_retry{5, std::chrono::milliseconds(2000), std::chrono::milliseconds(60000)};
  BackoffPolicy task_retry{5, std::chrono::milliseconds(5000), std::chrono::milliseconds(120000)};
  // fixed delay: base == max
  BackoffPolicy size_query_retry{3, std::chrono::milliseconds(1000), std::chrono::milliseconds(1000)};

  std::chrono::seconds probe_timeout{10};
  std::chrono::seconds pack_timeout{300};
  std::chrono::seconds fetch_timeout{60};
  std::chrono::seconds checksum_timeout{60};

  bool cleanup_remote = true;

  std::string cache_marker = "entry.json";
  std::vector<std::string> cache_media_extensions{".m4s", ".mp4", ".blv", ".m4a"};
};

// Throws std::invalid_argument describing the first invalid field.
void validate_transfer_config(const TransferConfig& config);

// Builds and validates a TransferConfig from the settings table.
TransferConfig load_transfer_config(const SettingsManager& settings);
