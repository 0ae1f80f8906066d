#include "chunk_fetcher.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

#include "base64.h"

#include "protocol.hpp"
#include "remote_archive.hpp"
#include "transfer_error.hpp"
#include "transfer_task.hpp"
#include "utils.hpp"

namespace {

constexpr uint64_t kTimeoutSliceBytes = 10ULL * 1024 * 1024;
constexpr std::chrono::seconds kTimeoutPerSlice{60};

bool is_base64_char(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '/';
}

} // namespace

const char* to_string(FetchStatus status) {
  switch(status) {
    case FetchStatus::Ok: return "ok";
    case FetchStatus::ChannelFailed: return "channel failed";
    case FetchStatus::DecodeFailed: return "decode failed";
    case FetchStatus::ShortRead: return "short read";
  }
  return "unknown";
}

bool decode_base64_text(const std::string& text, std::string& out) {
  std::string compact;
  compact.reserve(text.size());
  for(char ch : text) {
    if(std::isspace(static_cast<unsigned char>(ch))) continue;
    compact.push_back(ch);
  }
  out.clear();
  if(compact.empty()) return true;
  if(compact.size() % 4 != 0) return false;

  std::size_t padding = 0;
  while(padding < 2 && compact[compact.size() - 1 - padding] == '=') ++padding;
  for(std::size_t i = 0; i < compact.size() - padding; ++i) {
    if(!is_base64_char(compact[i])) return false;
  }

  try {
    out = base64_decode(compact);
  } catch(const std::runtime_error&) {
    out.clear();
    return false;
  }
  return out.size() == compact.size() / 4 * 3 - padding;
}

std::chrono::seconds chunk_timeout(const ChunkSpec& spec,
                                   uint64_t block_size,
                                   std::chrono::seconds min_timeout) {
  const uint64_t requested = spec.count_blocks * block_size;
  const uint64_t slices = requested / kTimeoutSliceBytes + (requested % kTimeoutSliceBytes != 0 ? 1 : 0);
  const auto scaled = kTimeoutPerSlice * static_cast<long long>(slices);
  return scaled > min_timeout ? scaled : min_timeout;
}

ChunkFetcher::ChunkFetcher(std::shared_ptr<ExecChannel> channel,
                           ChunkFetchConfig config,
                           SleepFunction sleep,
                           std::shared_ptr<Logger> logger)
  : channel_(std::move(channel)),
    config_(config),
    sleep_(sleep ? std::move(sleep) : SleepFunction(default_sleep)),
    logger_(std::move(logger)) {
  if(!channel_) throw std::invalid_argument("ChunkFetcher requires a channel");
  if(config_.block_size == 0) throw std::invalid_argument("block size must be positive");
  if(config_.retry.max_attempts == 0) config_.retry.max_attempts = 1;
}

FetchAttempt ChunkFetcher::fetch_once(const std::string& archive_path, const ChunkSpec& spec) {
  FetchAttempt attempt;
  if(spec.trim_length == 0) {
    attempt.status = FetchStatus::Ok;
    return attempt;
  }

  auto result = channel_->exec(make_fetch_command(archive_path, config_.block_size, spec),
                               chunk_timeout(spec, config_.block_size, config_.min_timeout));
  if(!result.ok()) {
    attempt.status = FetchStatus::ChannelFailed;
    attempt.detail = result.timed_out
      ? std::string("timed out")
      : "exit code " + std::to_string(result.exit_code);
    return attempt;
  }

  std::string decoded;
  if(!decode_base64_text(result.out, decoded)) {
    attempt.status = FetchStatus::DecodeFailed;
    attempt.detail = "invalid base64 (" + std::to_string(result.out.size()) + " chars)";
    return attempt;
  }

  const uint64_t needed = spec.lead_offset + spec.trim_length;
  if(decoded.size() < needed) {
    attempt.status = FetchStatus::ShortRead;
    attempt.detail = "got " + std::to_string(decoded.size()) + " of " + std::to_string(needed) + " bytes";
    return attempt;
  }

  attempt.status = FetchStatus::Ok;
  attempt.data = decoded.substr(static_cast<std::size_t>(spec.lead_offset),
                                static_cast<std::size_t>(spec.trim_length));
  return attempt;
}

void ChunkFetcher::fetch_chunk(const TransferTask& task, const RemoteArchive& archive, const ChunkSpec& spec) {
  const auto& policy = config_.retry;
  FetchAttempt attempt;
  for(std::size_t n = 1; n <= policy.max_attempts; ++n) {
    if(n > 1) {
      auto delay = policy.delay_before_retry(n - 1);
      log_warn(logger_.get(), "chunk {} attempt {}/{} failed ({}: {}), retrying in {}ms",
               spec.index, n - 1, policy.max_attempts, to_string(attempt.status), attempt.detail,
               delay.count());
      sleep_(delay);
    }
    attempt = fetch_once(archive.path, spec);
    if(attempt.status == FetchStatus::Ok) {
      write_part(task, spec, attempt.data);
      log_debug(logger_.get(), "chunk {} ok: {} bytes from offset {}", spec.index, spec.trim_length, spec.start);
      return;
    }
  }
  log_error(logger_.get(), "chunk {} failed {} times, last: {} {}",
            spec.index, policy.max_attempts, to_string(attempt.status), attempt.detail);
  throw TransferError(TransferErrorKind::ChunkFetchExhausted, TransferStage::Fetching,
                      "chunk " + std::to_string(spec.index) + " failed after " +
                      std::to_string(policy.max_attempts) + " attempts (" +
                      to_string(attempt.status) + ": " + attempt.detail + ")");
}

void ChunkFetcher::fetch_all(const TransferTask& task,
                             const RemoteArchive& archive,
                             const std::vector<ChunkSpec>& specs,
                             const ChunkProgressCallback& progress) {
  log_info(logger_.get(), "fetching {} in {} chunk(s)", format_size(archive.size), specs.size());
  uint64_t fetched = 0;
  for(const auto& spec : specs) {
    fetch_chunk(task, archive, spec);
    fetched = spec.end();
    if(progress) progress(spec.index, specs.size(), fetched, archive.size);
  }
}

void ChunkFetcher::write_part(const TransferTask& task, const ChunkSpec& spec, const std::string& data) {
  const auto path = task.part_path(spec.index);
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if(out) out.write(data.data(), static_cast<std::streamsize>(data.size()));
  if(!out) {
    throw TransferError(TransferErrorKind::LocalIoFailed, TransferStage::Fetching,
                        "cannot write chunk part " + path.string());
  }
}
