#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

struct TransferConfig;

// One (source, item) transfer request and every path it touches.
struct TransferTask {
  std::string source_id;
  std::string item_id;

  std::string remote_parent;   // <remote_root>/<source>
  std::string remote_source;   // <remote_root>/<source>/<item>
  std::string remote_archive;  // <remote_tmp>/<source>_<item>.tar

  std::filesystem::path local_target;   // <local_cache>/<source>/<item>
  std::filesystem::path local_archive;  // <work_dir>/<source>_<item>.tar

  std::string key() const { return source_id + "/" + item_id; }
  std::filesystem::path part_path(std::size_t index) const;
};

// Throws std::invalid_argument for identities that cannot be placed inside a
// single-quoted shell word or that would escape their parent directory.
TransferTask make_transfer_task(const TransferConfig& config,
                                const std::string& source_id,
                                const std::string& item_id);

void validate_identity(const std::string& label, const std::string& value);
