#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "backoff.hpp"
#include "exec_channel.hpp"
#include "log.hpp"

struct TransferTask;

struct RemoteArchive {
  std::string path;
  uint64_t size = 0;
};

// Packs <remote_parent>/<item> into a tar file on the remote side and reads
// back its size.
class RemoteArchivePreparer {
public:
  struct Options {
    std::chrono::seconds probe_timeout{10};
    std::chrono::seconds pack_timeout{300};
    BackoffPolicy size_query_retry{3, std::chrono::milliseconds(1000), std::chrono::milliseconds(1000)};
  };

  RemoteArchivePreparer(std::shared_ptr<ExecChannel> channel,
                        Options options,
                        SleepFunction sleep = SleepFunction(),
                        std::shared_ptr<Logger> logger = nullptr);

  // Throws TransferError (SourceNotFound, PackFailed, SizeQueryFailed).
  RemoteArchive prepare(const TransferTask& task);

  // Best effort; false when rm did not succeed.
  bool remove(const std::string& archive_path);

private:
  std::optional<uint64_t> query_size(const std::string& archive_path);

  std::shared_ptr<ExecChannel> channel_;
  Options options_;
  SleepFunction sleep_;
  std::shared_ptr<Logger> logger_;
};

// Parses the first token of `stat -c %s` output.
std::optional<uint64_t> parse_size_output(const std::string& output);
