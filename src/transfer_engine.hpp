#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "archive_extractor.hpp"
#include "backoff.hpp"
#include "chunk_assembler.hpp"
#include "chunk_fetcher.hpp"
#include "exec_channel.hpp"
#include "integrity_checker.hpp"
#include "local_cache.hpp"
#include "log.hpp"
#include "remote_archive.hpp"
#include "transfer_config.hpp"
#include "transfer_error.hpp"

struct TransferTask;

struct TransferFailure {
  TransferErrorKind kind = TransferErrorKind::PackFailed;
  TransferStage stage = TransferStage::Packing;
  std::size_t attempt = 0;
  std::string message;
};

struct TransferOutcome {
  bool success = false;
  bool cache_hit = false;
  std::size_t attempts = 0;
  uint64_t archive_size = 0;
  std::string digest;
  IntegrityStatus integrity = IntegrityStatus::Skipped;
  std::filesystem::path local_path;
  std::optional<TransferFailure> failure; // last error when !success
};

// Drives one (source, item) transfer through
// CacheCheck -> Packing -> Fetching -> Assembling -> Verifying -> Extracting -> Done,
// retrying whole attempts with exponential backoff. Not shared across threads.
class TransferEngine {
public:
  struct Options {
    SleepFunction sleep;             // empty = real sleep
    ChunkProgressCallback progress;  // called after every chunk
    std::string logger_name = "transfer";
  };

  TransferEngine(std::shared_ptr<ExecChannel> channel, TransferConfig config, Options options);
  TransferEngine(std::shared_ptr<ExecChannel> channel, TransferConfig config);

  // Never throws TransferError; failures are reported in the outcome.
  // ChannelUnavailable propagates. Invalid identities throw std::invalid_argument.
  TransferOutcome download_and_extract(const std::string& source_id, const std::string& item_id);

  // Cache probe only; never touches the channel.
  bool is_cached(const std::string& source_id, const std::string& item_id) const;

  // True when the channel echoes the probe token back.
  bool probe_channel();

  std::optional<std::filesystem::path> local_path(const std::string& source_id,
                                                  const std::string& item_id) const;

  const TransferConfig& config() const { return config_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

private:
  void run_attempt(const TransferTask& task, TransferStage& stage, TransferOutcome& outcome);

  TransferConfig config_;
  Options options_;
  std::shared_ptr<ExecChannel> channel_;
  std::shared_ptr<Logger> logger_;
  LocalCache cache_;
  RemoteArchivePreparer preparer_;
  ChunkFetcher fetcher_;
  ChunkAssembler assembler_;
  IntegrityChecker checker_;
  ArchiveExtractor extractor_;
};
