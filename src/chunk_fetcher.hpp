#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "backoff.hpp"
#include "chunk_planner.hpp"
#include "exec_channel.hpp"
#include "log.hpp"

struct RemoteArchive;
struct TransferTask;

enum class FetchStatus {
  Ok,
  ChannelFailed,
  DecodeFailed,
  ShortRead
};

const char* to_string(FetchStatus status);

// Result of one read attempt. data holds exactly trim_length bytes when status is Ok.
struct FetchAttempt {
  FetchStatus status = FetchStatus::ChannelFailed;
  std::string data;
  std::string detail;
};

struct ChunkFetchConfig {
  uint64_t block_size = kDefaultBlockSize;
  BackoffPolicy retry{5, std::chrono::milliseconds(2000), std::chrono::milliseconds(60000)};
  std::chrono::seconds min_timeout{60};
};

// (chunk index, chunk count, bytes fetched so far, archive size)
using ChunkProgressCallback = std::function<void(std::size_t index,
                                                 std::size_t count,
                                                 uint64_t fetched_bytes,
                                                 uint64_t archive_size)>;

// Strips ASCII whitespace and decodes padded standard base64. False on any
// character outside the alphabet or bad padding.
bool decode_base64_text(const std::string& text, std::string& out);

// Channel timeout for one chunk: at least min_timeout, plus 60 s per 10 MiB requested.
std::chrono::seconds chunk_timeout(const ChunkSpec& spec,
                                   uint64_t block_size,
                                   std::chrono::seconds min_timeout);

// Sequentially retrieves every planned chunk into task.part_path(index).
class ChunkFetcher {
public:
  ChunkFetcher(std::shared_ptr<ExecChannel> channel,
               ChunkFetchConfig config,
               SleepFunction sleep = SleepFunction(),
               std::shared_ptr<Logger> logger = nullptr);

  // Single attempt, no retry, nothing written.
  FetchAttempt fetch_once(const std::string& archive_path, const ChunkSpec& spec);

  // Retries the same spec until Ok or the ceiling; throws TransferError
  // (ChunkFetchExhausted, LocalIoFailed).
  void fetch_chunk(const TransferTask& task, const RemoteArchive& archive, const ChunkSpec& spec);

  void fetch_all(const TransferTask& task,
                 const RemoteArchive& archive,
                 const std::vector<ChunkSpec>& specs,
                 const ChunkProgressCallback& progress = ChunkProgressCallback());

private:
  void write_part(const TransferTask& task, const ChunkSpec& spec, const std::string& data);

  std::shared_ptr<ExecChannel> channel_;
  ChunkFetchConfig config_;
  SleepFunction sleep_;
  std::shared_ptr<Logger> logger_;
};
