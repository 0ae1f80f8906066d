#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

enum class TransferStage {
  CacheCheck,
  Packing,
  Fetching,
  Assembling,
  Verifying,
  Extracting,
  Done
};

enum class TransferErrorKind {
  SourceNotFound,
  PackFailed,
  SizeQueryFailed,
  ChunkFetchExhausted,
  OverlapMismatch,
  SizeMismatch,
  ChecksumMismatch,
  ExtractionFailed,
  LocalIoFailed
};

const char* to_string(TransferStage stage);
const char* to_string(TransferErrorKind kind);

// Fatal for the current attempt; the engine discards artifacts and retries from Packing.
class TransferError : public std::runtime_error {
public:
  TransferError(TransferErrorKind kind, TransferStage stage, const std::string& message);

  TransferErrorKind kind() const { return kind_; }
  TransferStage stage() const { return stage_; }

  // 1-based; 0 until the engine stamps it.
  std::size_t attempt() const { return attempt_; }
  void set_attempt(std::size_t attempt) { attempt_ = attempt; }

private:
  TransferErrorKind kind_;
  TransferStage stage_;
  std::size_t attempt_ = 0;
};

// The exec binary itself cannot be run. Never retried at any level.
class ChannelUnavailable : public std::runtime_error {
public:
  explicit ChannelUnavailable(const std::string& message)
    : std::runtime_error(message) {}
};
