#include "transfer_engine.hpp"

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <vector>

#include "chunk_planner.hpp"
#include "protocol.hpp"
#include "transfer_task.hpp"
#include "utils.hpp"

namespace {

RemoteArchivePreparer::Options preparer_options(const TransferConfig& config) {
  RemoteArchivePreparer::Options options;
  options.probe_timeout = config.probe_timeout;
  options.pack_timeout = config.pack_timeout;
  options.size_query_retry = config.size_query_retry;
  return options;
}

ChunkFetchConfig fetch_config(const TransferConfig& config) {
  ChunkFetchConfig fetch;
  fetch.block_size = config.block_size;
  fetch.retry = config.chunk_retry;
  fetch.min_timeout = config.fetch_timeout;
  return fetch;
}

TransferConfig validated(TransferConfig config) {
  validate_transfer_config(config);
  return config;
}

std::shared_ptr<ExecChannel> require_channel(std::shared_ptr<ExecChannel> channel) {
  if(!channel) throw std::invalid_argument("TransferEngine requires a channel");
  return channel;
}

// Removes everything one attempt may leave behind: chunk parts, the merged
// archive and (optionally) the remote archive. Runs on every exit path.
class AttemptArtifacts {
public:
  AttemptArtifacts(const TransferTask& task,
                   RemoteArchivePreparer& preparer,
                   bool cleanup_remote,
                   Logger* logger)
    : task_(task),
      preparer_(preparer),
      cleanup_remote_(cleanup_remote),
      logger_(logger) {}

  AttemptArtifacts(const AttemptArtifacts&) = delete;
  AttemptArtifacts& operator=(const AttemptArtifacts&) = delete;

  // Cleanup failures are reported, never rethrown.
  ~AttemptArtifacts() {
    try {
      remove_local();
    } catch(const std::exception& e) {
      report("local cleanup failed", e);
    }
    if(!cleanup_remote_) return;
    try {
      if(!preparer_.remove(task_.remote_archive)) {
        log_warn(logger_, "remote archive {} may be left behind", task_.remote_archive);
      }
    } catch(const ChannelUnavailable& e) {
      report("remote cleanup skipped", e);
    } catch(const std::exception& e) {
      report("remote cleanup failed", e);
    }
  }

private:
  void report(const char* what, const std::exception& e) const noexcept {
    try {
      log_warn(logger_, "{}: {}", what, e.what());
    } catch(const std::exception& log_failure) {
      std::fprintf(stderr, "%s: %s (logging failed: %s)\n", what, e.what(), log_failure.what());
    }
  }

  void remove_local() {
    std::error_code ec;
    const auto dir = task_.local_archive.has_parent_path()
      ? task_.local_archive.parent_path()
      : std::filesystem::path(".");
    const auto part_prefix = task_.local_archive.filename().string() + ".part";
    std::vector<std::filesystem::path> parts;
    std::filesystem::directory_iterator it(dir, ec);
    if(!ec) {
      for(; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if(ec) break;
        if(it->path().filename().string().rfind(part_prefix, 0) == 0) parts.push_back(it->path());
      }
    }
    for(const auto& part : parts) {
      if(!std::filesystem::remove(part, ec) && ec) {
        log_warn(logger_, "cannot remove {}: {}", part.string(), ec.message());
      }
    }
    if(!std::filesystem::remove(task_.local_archive, ec) && ec) {
      log_warn(logger_, "cannot remove {}: {}", task_.local_archive.string(), ec.message());
    }
  }

  const TransferTask& task_;
  RemoteArchivePreparer& preparer_;
  bool cleanup_remote_;
  Logger* logger_;
};

} // namespace

TransferEngine::TransferEngine(std::shared_ptr<ExecChannel> channel, TransferConfig config)
  : TransferEngine(std::move(channel), std::move(config), Options()) {}

TransferEngine::TransferEngine(std::shared_ptr<ExecChannel> channel, TransferConfig config, Options options)
  : config_(validated(std::move(config))),
    options_(std::move(options)),
    channel_(require_channel(std::move(channel))),
    logger_(std::make_shared<Logger>(options_.logger_name)),
    cache_(config_.local_cache, config_.cache_marker, config_.cache_media_extensions),
    preparer_(channel_, preparer_options(config_), options_.sleep, logger_),
    fetcher_(channel_, fetch_config(config_), options_.sleep, logger_),
    assembler_(logger_),
    checker_(channel_, config_.checksum_timeout, logger_),
    extractor_(logger_) {
  if(!options_.sleep) options_.sleep = default_sleep;
}

bool TransferEngine::probe_channel() {
  auto result = channel_->exec(make_channel_probe_command(), config_.probe_timeout);
  if(!result.ok()) {
    logger_->warn("channel probe failed: {}", result.timed_out
                  ? std::string("timed out")
                  : "exit code " + std::to_string(result.exit_code) + " " + trim_copy(result.err));
    return false;
  }
  if(trim_copy(result.out) != kChannelProbeToken) {
    logger_->warn("channel probe answered '{}'", trim_copy(result.out));
    return false;
  }
  logger_->debug("channel probe ok");
  return true;
}

bool TransferEngine::is_cached(const std::string& source_id, const std::string& item_id) const {
  validate_identity("source id", source_id);
  validate_identity("item id", item_id);
  return cache_.has_entry(source_id, item_id);
}

std::optional<std::filesystem::path> TransferEngine::local_path(const std::string& source_id,
                                                                const std::string& item_id) const {
  validate_identity("source id", source_id);
  validate_identity("item id", item_id);
  return cache_.local_path(source_id, item_id);
}

void TransferEngine::run_attempt(const TransferTask& task, TransferStage& stage, TransferOutcome& outcome) {
  AttemptArtifacts artifacts(task, preparer_, config_.cleanup_remote, logger_.get());

  stage = TransferStage::Packing;
  auto archive = preparer_.prepare(task);
  outcome.archive_size = archive.size;

  stage = TransferStage::Fetching;
  const auto specs = plan_chunks(archive.size, config_.chunk_size, config_.overlap, config_.block_size);
  fetcher_.fetch_all(task, archive, specs, options_.progress);

  stage = TransferStage::Assembling;
  const auto local_archive = assembler_.assemble(task, specs, archive.size);

  stage = TransferStage::Verifying;
  auto integrity = checker_.verify(archive.path, local_archive);
  outcome.integrity = integrity.status;
  outcome.digest = integrity.local_digest;
  if(integrity.status == IntegrityStatus::Skipped) {
    logger_->warn("remote checksum unavailable for {}, continuing unverified", task.key());
  }

  stage = TransferStage::Extracting;
  extractor_.extract(local_archive, task.local_target);

  stage = TransferStage::Done;
}

TransferOutcome TransferEngine::download_and_extract(const std::string& source_id, const std::string& item_id) {
  const auto task = make_transfer_task(config_, source_id, item_id);
  TransferOutcome outcome;

  if(cache_.has_entry(source_id, item_id)) {
    logger_->info("{} already cached at {}", task.key(), task.local_target.string());
    outcome.success = true;
    outcome.cache_hit = true;
    outcome.local_path = task.local_target;
    return outcome;
  }

  const auto& policy = config_.task_retry;
  for(std::size_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    if(attempt > 1) {
      auto delay = policy.delay_before_retry(attempt - 1);
      logger_->warn("retrying {} in {} (attempt {}/{})", task.key(),
                    format_duration_compact(delay), attempt, policy.max_attempts);
      options_.sleep(delay);
    }

    outcome.attempts = attempt;
    outcome.archive_size = 0;
    outcome.digest.clear();
    outcome.integrity = IntegrityStatus::Skipped;
    TransferStage stage = TransferStage::CacheCheck;
    logger_->info("transfer {} attempt {}/{}", task.key(), attempt, policy.max_attempts);
    try {
      run_attempt(task, stage, outcome);
    } catch(TransferError& e) {
      e.set_attempt(attempt);
      logger_->error("attempt {}/{} failed at {} ({}): {}", attempt, policy.max_attempts,
                     to_string(e.stage()), to_string(e.kind()), e.what());
      outcome.failure = TransferFailure{e.kind(), e.stage(), attempt, e.what()};
      continue;
    } catch(const std::filesystem::filesystem_error& e) {
      logger_->error("attempt {}/{} failed at {}: {}", attempt, policy.max_attempts, to_string(stage), e.what());
      outcome.failure = TransferFailure{TransferErrorKind::LocalIoFailed, stage, attempt, e.what()};
      continue;
    }

    outcome.success = true;
    outcome.failure.reset();
    outcome.local_path = task.local_target;
    logger_->info("transfer {} done in {} attempt(s): {} ({})", task.key(), attempt,
                  format_size(outcome.archive_size),
                  outcome.integrity == IntegrityStatus::Verified ? "md5 " + outcome.digest : std::string("unverified"));
    return outcome;
  }

  logger_->error("transfer {} failed after {} attempt(s)", task.key(), policy.max_attempts);
  return outcome;
}

LogListenerHandle TransferEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void TransferEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}
