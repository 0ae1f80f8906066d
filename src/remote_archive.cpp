#include "remote_archive.hpp"

#include <cctype>
#include <stdexcept>

#include "protocol.hpp"
#include "transfer_error.hpp"
#include "transfer_task.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kStderrExcerpt = 200;

std::string excerpt(const std::string& text) {
  auto clean = trim_copy(text);
  if(clean.size() > kStderrExcerpt) clean.resize(kStderrExcerpt);
  return clean;
}

std::string describe(const ExecResult& result) {
  if(result.timed_out) return "timed out";
  auto detail = excerpt(result.err);
  if(detail.empty()) return "exit code " + std::to_string(result.exit_code);
  return "exit code " + std::to_string(result.exit_code) + ": " + detail;
}

} // namespace

std::optional<uint64_t> parse_size_output(const std::string& output) {
  auto clean = trim_copy(output);
  std::size_t digits = 0;
  while(digits < clean.size() && std::isdigit(static_cast<unsigned char>(clean[digits]))) ++digits;
  if(digits == 0) return std::nullopt;
  if(digits < clean.size() && !std::isspace(static_cast<unsigned char>(clean[digits]))) return std::nullopt;
  try {
    return static_cast<uint64_t>(std::stoull(clean.substr(0, digits)));
  } catch(const std::out_of_range&) {
    return std::nullopt;
  }
}

RemoteArchivePreparer::RemoteArchivePreparer(std::shared_ptr<ExecChannel> channel,
                                             Options options,
                                             SleepFunction sleep,
                                             std::shared_ptr<Logger> logger)
  : channel_(std::move(channel)),
    options_(options),
    sleep_(sleep ? std::move(sleep) : SleepFunction(default_sleep)),
    logger_(std::move(logger)) {
  if(!channel_) throw std::invalid_argument("RemoteArchivePreparer requires a channel");
  if(options_.size_query_retry.max_attempts == 0) options_.size_query_retry.max_attempts = 1;
}

RemoteArchive RemoteArchivePreparer::prepare(const TransferTask& task) {
  auto probe = channel_->exec(make_source_probe_command(task.remote_source), options_.probe_timeout);
  if(!probe.ok()) {
    throw TransferError(TransferErrorKind::SourceNotFound, TransferStage::Packing,
                        "remote source " + task.remote_source + " is not a directory (" +
                        describe(probe) + ")");
  }

  if(!remove(task.remote_archive)) {
    log_debug(logger_.get(), "stale archive removal failed for {}, packing anyway", task.remote_archive);
  }

  log_info(logger_.get(), "packing {} into {}", task.remote_source, task.remote_archive);
  auto pack = channel_->exec(make_pack_command(task.remote_parent, task.remote_archive, task.item_id),
                             options_.pack_timeout);
  if(!pack.ok()) {
    throw TransferError(TransferErrorKind::PackFailed, TransferStage::Packing,
                        "tar failed for " + task.remote_source + " (" + describe(pack) + ")");
  }

  auto size = query_size(task.remote_archive);
  if(!size) {
    throw TransferError(TransferErrorKind::SizeQueryFailed, TransferStage::Packing,
                        "could not read the size of " + task.remote_archive + " after " +
                        std::to_string(options_.size_query_retry.max_attempts) + " attempts");
  }
  if(*size == 0) {
    throw TransferError(TransferErrorKind::PackFailed, TransferStage::Packing,
                        "remote archive " + task.remote_archive + " is empty");
  }

  log_info(logger_.get(), "remote archive ready: {} ({})", task.remote_archive, format_size(*size));
  return RemoteArchive{task.remote_archive, *size};
}

std::optional<uint64_t> RemoteArchivePreparer::query_size(const std::string& archive_path) {
  const auto& policy = options_.size_query_retry;
  const auto command = make_size_command(archive_path);
  for(std::size_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    if(attempt > 1) sleep_(policy.delay_before_retry(attempt - 1));
    auto result = channel_->exec(command, options_.probe_timeout);
    if(result.ok()) {
      if(auto size = parse_size_output(result.out)) return size;
      log_warn(logger_.get(), "size query {}/{}: unparsable output '{}'",
               attempt, policy.max_attempts, excerpt(result.out));
    } else {
      log_warn(logger_.get(), "size query {}/{}: {}", attempt, policy.max_attempts, describe(result));
    }
  }
  return std::nullopt;
}

bool RemoteArchivePreparer::remove(const std::string& archive_path) {
  auto result = channel_->exec(make_remove_command(archive_path), options_.probe_timeout);
  if(!result.ok()) {
    log_warn(logger_.get(), "rm -f {} failed: {}", archive_path, describe(result));
    return false;
  }
  return true;
}
