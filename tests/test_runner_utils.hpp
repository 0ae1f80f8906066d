#pragma once

#include "exec_channel.hpp"
#include "log.hpp"
#include "transfer_config.hpp"
#include "transfer_engine.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tarpull::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  // Holds the engine's logger, so the capture may outlive the engine.
  void attach(TransferEngine& engine, const std::string& label = std::string()) {
    attach(engine.logger(), label);
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  Logger::Listener make_listener(const std::string& label) {
    return [this, label](void*,
                         const std::string& channel,
                         spdlog::level::level_enum,
                         const std::string& message) {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!label.empty()) {
        lines_.emplace_back(label + ": " + message);
      } else {
        lines_.emplace_back(channel + ": " + message);
      }
      return false;
    };
  }

  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
  explicit ScratchDir(const std::string& name)
    : path_(std::filesystem::temp_directory_path() / "tarpull_test_runner" / name) {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string& child) const { return path_ / child; }

private:
  std::filesystem::path path_;
};

inline std::string random_bytes(std::size_t size, uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string data(size, '\0');
  for(auto& ch : data) ch = static_cast<char>(dist(rng));
  return data;
}

inline void write_file(const std::filesystem::path& path, const std::string& data) {
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  if(!out) throw std::runtime_error("cannot write " + path.string());
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) throw std::runtime_error("cannot read " + path.string());
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Relative path -> content for every regular file below root.
inline std::vector<std::pair<std::string, std::string>> snapshot_tree(const std::filesystem::path& root) {
  std::vector<std::pair<std::string, std::string>> files;
  for(const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
    if(!entry.is_regular_file()) continue;
    files.emplace_back(std::filesystem::relative(entry.path(), root).generic_string(),
                       read_file(entry.path()));
  }
  std::sort(files.begin(), files.end());
  return files;
}

inline std::size_t count_files_with_prefix(const std::filesystem::path& dir, const std::string& prefix) {
  std::size_t count = 0;
  std::error_code ec;
  if(!std::filesystem::is_directory(dir, ec)) return 0;
  for(const auto& entry : std::filesystem::directory_iterator(dir)) {
    if(entry.path().filename().string().rfind(prefix, 0) == 0) ++count;
  }
  return count;
}

// Writes a tar archive with the given (name, content) regular-file members.
inline void write_tar(const std::filesystem::path& path,
                      const std::vector<std::pair<std::string, std::string>>& members) {
  struct archive* a = archive_write_new();
  if(!a) throw std::runtime_error("archive_write_new failed");
  archive_write_set_format_pax_restricted(a);
  if(archive_write_open_filename(a, path.c_str()) != ARCHIVE_OK) {
    std::string msg = archive_error_string(a) ? archive_error_string(a) : "(null)";
    archive_write_free(a);
    throw std::runtime_error("archive_write_open_filename failed: " + msg);
  }
  for(const auto& member : members) {
    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, member.first.c_str());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_size(entry, static_cast<la_int64_t>(member.second.size()));
    if(archive_write_header(a, entry) != ARCHIVE_OK) {
      std::string msg = archive_error_string(a) ? archive_error_string(a) : "(null)";
      archive_entry_free(entry);
      archive_write_free(a);
      throw std::runtime_error("archive_write_header failed: " + msg);
    }
    if(!member.second.empty()) {
      archive_write_data(a, member.second.data(), member.second.size());
    }
    archive_entry_free(entry);
  }
  archive_write_close(a);
  archive_write_free(a);
}

// Records every command and lets a test override or rewrite results.
class FaultInjectingChannel : public ExecChannel {
public:
  // Returning a value replaces the real call.
  using Override = std::function<std::optional<ExecResult>(const std::string& command)>;
  using Mutator = std::function<void(const std::string& command, ExecResult& result)>;

  explicit FaultInjectingChannel(std::shared_ptr<ExecChannel> inner)
    : inner_(std::move(inner)) {}

  void set_override(Override override_fn) { override_ = std::move(override_fn); }
  void set_mutator(Mutator mutator) { mutator_ = std::move(mutator); }

  ExecResult exec(const std::string& command, std::chrono::seconds timeout) override {
    commands_.push_back(command);
    if(override_) {
      if(auto replaced = override_(command)) return *replaced;
    }
    auto result = inner_->exec(command, timeout);
    if(mutator_) mutator_(command, result);
    return result;
  }

  const std::vector<std::string>& commands() const { return commands_; }
  std::size_t call_count() const { return commands_.size(); }
  std::size_t count_prefix(const std::string& prefix) const {
    return static_cast<std::size_t>(std::count_if(commands_.begin(), commands_.end(),
      [&](const std::string& command){ return command.rfind(prefix, 0) == 0; }));
  }
  void reset_log() { commands_.clear(); }

private:
  std::shared_ptr<ExecChannel> inner_;
  Override override_;
  Mutator mutator_;
  std::vector<std::string> commands_;
};

inline ExecResult failed_result(int exit_code = 1) {
  ExecResult result;
  result.exit_code = exit_code;
  result.err = "injected failure";
  return result;
}

inline ExecResult timed_out_result() {
  ExecResult result;
  result.exit_code = -1;
  result.timed_out = true;
  return result;
}

// Sleep that returns immediately and remembers what it was asked for.
class RecordingSleep {
public:
  SleepFunction function() {
    return [this](std::chrono::milliseconds delay){ delays_.push_back(delay); };
  }
  const std::vector<std::chrono::milliseconds>& delays() const { return delays_; }

private:
  std::vector<std::chrono::milliseconds> delays_;
};

inline std::shared_ptr<ProcessExecChannel> make_shell_channel() {
  return std::make_shared<ProcessExecChannel>(ProcessExecChannel::Options{});
}

// Remote and local roots inside one scratch dir, sized for small fixtures.
inline TransferConfig make_test_config(const std::filesystem::path& root) {
  TransferConfig config;
  config.remote_root = (root / "remote").string();
  config.remote_tmp = (root / "remote_tmp").string();
  config.local_cache = root / "cache";
  config.chunk_size = 64 * 1024;
  config.overlap = 1000;
  config.block_size = 1024;
  std::error_code ec;
  std::filesystem::create_directories(root / "remote", ec);
  std::filesystem::create_directories(root / "remote_tmp", ec);
  return config;
}

// <remote_root>/<source>/<item> with a marker and a couple of media files.
inline std::filesystem::path make_remote_item(const TransferConfig& config,
                                              const std::string& source_id,
                                              const std::string& item_id,
                                              std::size_t media_bytes,
                                              uint32_t seed) {
  auto dir = std::filesystem::path(config.remote_root) / source_id / item_id;
  write_file(dir / "entry.json", "{\"title\":\"fixture " + item_id + "\"}");
  write_file(dir / "80" / "video.m4s", random_bytes(media_bytes, seed));
  write_file(dir / "80" / "audio.m4s", random_bytes(media_bytes / 3 + 17, seed + 1));
  write_file(dir / "80" / "index.json", "{}");
  return dir;
}

} // namespace tarpull::test
