#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "backoff.hpp"
#include "log.hpp"

struct ExecResult {
  int exit_code = -1;
  std::string out;
  std::string err;
  bool timed_out = false;

  bool ok() const { return !timed_out && exit_code == 0; }
};

// Runs one shell command per call. A call is a single attempt: timeouts and
// non-zero exits come back in the result, and only an unusable channel throws
// (ChannelUnavailable).
class ExecChannel {
public:
  virtual ~ExecChannel() = default;
  virtual ExecResult exec(const std::string& command, std::chrono::seconds timeout) = 0;
};

// Spawns `program args...`, writes the command to its stdin and collects
// stdout/stderr until the process exits or the deadline passes. Works with
// /bin/sh as well as with rish-style relays that read a command from stdin.
class ProcessExecChannel : public ExecChannel {
public:
  struct Options {
    std::string program = "/bin/sh";
    std::vector<std::string> args;
    // exported to the child as RISH_APPLICATION_ID when non-empty
    std::string app_id;
  };

  explicit ProcessExecChannel(Options options, std::shared_ptr<Logger> logger = nullptr);

  ExecResult exec(const std::string& command, std::chrono::seconds timeout) override;

  const Options& options() const { return options_; }

private:
  Options options_;
  std::shared_ptr<Logger> logger_;
};

// Re-issues commands whose call timed out. Every other result, failures
// included, is handed back unchanged.
class RetryingExecChannel : public ExecChannel {
public:
  RetryingExecChannel(std::shared_ptr<ExecChannel> inner,
                      BackoffPolicy policy,
                      SleepFunction sleep = SleepFunction(),
                      std::shared_ptr<Logger> logger = nullptr);

  ExecResult exec(const std::string& command, std::chrono::seconds timeout) override;

private:
  std::shared_ptr<ExecChannel> inner_;
  BackoffPolicy policy_;
  SleepFunction sleep_;
  std::shared_ptr<Logger> logger_;
};
