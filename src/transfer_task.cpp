#include "transfer_task.hpp"

#include <stdexcept>

#include "transfer_config.hpp"

namespace {

std::string join_remote(const std::string& base, const std::string& name) {
  if(base.empty()) return name;
  if(base.back() == '/') return base + name;
  return base + "/" + name;
}

}

std::filesystem::path TransferTask::part_path(std::size_t index) const {
  return std::filesystem::path(local_archive.string() + ".part" + std::to_string(index));
}

void validate_identity(const std::string& label, const std::string& value) {
  if(value.empty()) {
    throw std::invalid_argument(label + " must not be empty");
  }
  if(value == "." || value == "..") {
    throw std::invalid_argument(label + " '" + value + "' is not a directory name");
  }
  for(char ch : value) {
    if(ch == '/' || ch == '\'' || ch == '\n' || ch == '\0') {
      throw std::invalid_argument(label + " '" + value + "' contains an unsupported character");
    }
  }
}

TransferTask make_transfer_task(const TransferConfig& config,
                                const std::string& source_id,
                                const std::string& item_id) {
  validate_identity("source id", source_id);
  validate_identity("item id", item_id);

  TransferTask task;
  task.source_id = source_id;
  task.item_id = item_id;
  task.remote_parent = join_remote(config.remote_root, source_id);
  task.remote_source = join_remote(task.remote_parent, item_id);
  const std::string archive_name = source_id + "_" + item_id + ".tar";
  task.remote_archive = join_remote(config.remote_tmp, archive_name);

  task.local_target = config.local_cache / source_id / item_id;
  const auto work_dir = config.work_dir.empty() ? config.local_cache : config.work_dir;
  task.local_archive = work_dir / archive_name;
  return task;
}
