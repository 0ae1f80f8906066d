#include "integrity_checker.hpp"

#include <sstream>
#include <stdexcept>

#include "protocol.hpp"
#include "transfer_error.hpp"
#include "utils.hpp"

std::optional<std::string> parse_md5sum_output(const std::string& output) {
  std::istringstream stream(output);
  std::string token;
  if(!(stream >> token)) return std::nullopt;
  token = to_lower(token);
  if(!is_md5_hex(token)) return std::nullopt;
  return token;
}

IntegrityChecker::IntegrityChecker(std::shared_ptr<ExecChannel> channel,
                                   std::chrono::seconds timeout,
                                   std::shared_ptr<Logger> logger)
  : channel_(std::move(channel)),
    timeout_(timeout),
    logger_(std::move(logger)) {
  if(!channel_) throw std::invalid_argument("IntegrityChecker requires a channel");
}

std::optional<std::string> IntegrityChecker::remote_digest(const std::string& remote_archive) {
  auto result = channel_->exec(make_checksum_command(remote_archive), timeout_);
  if(result.timed_out) {
    log_warn(logger_.get(), "md5sum timed out, checksum skipped");
    return std::nullopt;
  }
  if(result.exit_code != 0) {
    log_warn(logger_.get(), "md5sum exited {}, checksum skipped: {}", result.exit_code, trim_copy(result.err));
    return std::nullopt;
  }
  auto digest = parse_md5sum_output(result.out);
  if(!digest) {
    log_warn(logger_.get(), "unrecognised md5sum output '{}', checksum skipped", trim_copy(result.out));
  }
  return digest;
}

IntegrityResult IntegrityChecker::verify(const std::string& remote_archive,
                                         const std::filesystem::path& local_archive) {
  IntegrityResult result;
  auto remote = remote_digest(remote_archive);

  auto local = md5_file_hex(local_archive);
  if(!local) {
    throw TransferError(TransferErrorKind::LocalIoFailed, TransferStage::Verifying,
                        "cannot read " + local_archive.string() + " for hashing");
  }
  result.local_digest = *local;

  if(!remote) {
    result.status = IntegrityStatus::Skipped;
    return result;
  }
  result.remote_digest = *remote;
  if(result.remote_digest != result.local_digest) {
    log_error(logger_.get(), "checksum mismatch: remote {} local {}", result.remote_digest, result.local_digest);
    throw TransferError(TransferErrorKind::ChecksumMismatch, TransferStage::Verifying,
                        "md5 mismatch (remote " + result.remote_digest + ", local " +
                        result.local_digest + ")");
  }
  result.status = IntegrityStatus::Verified;
  log_info(logger_.get(), "checksum verified: {}", result.local_digest);
  return result;
}
