#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "exec_channel.hpp"
#include "log.hpp"

enum class IntegrityStatus {
  Verified,
  Skipped
};

struct IntegrityResult {
  IntegrityStatus status = IntegrityStatus::Skipped;
  std::string local_digest;
  std::string remote_digest; // empty when skipped
};

// First whitespace token of md5sum output, lower-cased, when it is 32 hex digits.
std::optional<std::string> parse_md5sum_output(const std::string& output);

// Compares the remote md5sum of the archive with the local file's MD5.
class IntegrityChecker {
public:
  IntegrityChecker(std::shared_ptr<ExecChannel> channel,
                   std::chrono::seconds timeout,
                   std::shared_ptr<Logger> logger = nullptr);

  // Skipped when the remote digest is unavailable. Throws TransferError
  // (ChecksumMismatch, LocalIoFailed).
  IntegrityResult verify(const std::string& remote_archive, const std::filesystem::path& local_archive);

private:
  std::optional<std::string> remote_digest(const std::string& remote_archive);

  std::shared_ptr<ExecChannel> channel_;
  std::chrono::seconds timeout_;
  std::shared_ptr<Logger> logger_;
};
