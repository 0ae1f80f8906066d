#include "exec_channel.hpp"

#include <asio.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "transfer_error.hpp"

extern char** environ;

namespace {

constexpr std::size_t kPipeReadSize = 64 * 1024;
constexpr std::size_t kLoggedCommandChars = 160;
constexpr std::chrono::milliseconds kReapPollInterval{20};

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if(this != &other) {
      reset();
      fd_ = other.release();
    }
    return *this;
  }
  ~UniqueFd() { reset(); }

  int get() const { return fd_; }
  int release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void reset() {
    if(fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }

private:
  int fd_ = -1;
};

struct Pipe {
  UniqueFd read_end;
  UniqueFd write_end;
};

bool open_pipe(Pipe& pipe) {
  int fds[2];
  if(::pipe2(fds, O_CLOEXEC) != 0) return false;
  pipe.read_end = UniqueFd(fds[0]);
  pipe.write_end = UniqueFd(fds[1]);
  return true;
}

void ignore_sigpipe_once() {
  static std::once_flag once;
  std::call_once(once, []{ std::signal(SIGPIPE, SIG_IGN); });
}

std::string abbreviate(const std::string& command) {
  if(command.size() <= kLoggedCommandChars) return command;
  return command.substr(0, kLoggedCommandChars) + "...";
}

// Reads one pipe to EOF, appending into sink.
class StreamPump {
public:
  StreamPump(asio::io_context& io, int fd, std::string& sink, std::function<void()> on_done)
    : descriptor_(io, fd),
      sink_(sink),
      on_done_(std::move(on_done)) {}

  void start() {
    descriptor_.async_read_some(asio::buffer(buffer_),
      [this](const asio::error_code& ec, std::size_t bytes){
        if(bytes > 0) sink_.append(buffer_.data(), bytes);
        if(ec) {
          finish();
          return;
        }
        start();
      });
  }

  void abort() {
    asio::error_code ignored;
    descriptor_.close(ignored);
  }

private:
  void finish() {
    if(done_) return;
    done_ = true;
    if(on_done_) on_done_();
  }

  asio::posix::stream_descriptor descriptor_;
  std::array<char, kPipeReadSize> buffer_{};
  std::string& sink_;
  std::function<void()> on_done_;
  bool done_ = false;
};

std::vector<std::string> build_environment(const std::string& app_id) {
  static const std::string kAppIdKey = "RISH_APPLICATION_ID=";
  std::vector<std::string> env;
  for(char** entry = environ; entry && *entry; ++entry) {
    std::string value(*entry);
    if(!app_id.empty() && value.rfind(kAppIdKey, 0) == 0) continue;
    env.push_back(std::move(value));
  }
  if(!app_id.empty()) env.push_back(kAppIdKey + app_id);
  return env;
}

int decode_wait_status(int status) {
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

void default_sleep(std::chrono::milliseconds delay) {
  if(delay.count() > 0) std::this_thread::sleep_for(delay);
}

ProcessExecChannel::ProcessExecChannel(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(std::move(logger)) {
  ignore_sigpipe_once();
}

ExecResult ProcessExecChannel::exec(const std::string& command, std::chrono::seconds timeout) {
  if(options_.program.empty() || ::access(options_.program.c_str(), X_OK) != 0) {
    throw ChannelUnavailable("exec channel program '" + options_.program +
                             "' is not runnable: " + std::strerror(errno));
  }

  ExecResult result;
  Pipe in_pipe, out_pipe, err_pipe;
  if(!open_pipe(in_pipe) || !open_pipe(out_pipe) || !open_pipe(err_pipe)) {
    result.err = std::string("pipe failed: ") + std::strerror(errno);
    log_warn(logger_.get(), "exec: {}", result.err);
    return result;
  }

  // everything the child needs is prepared before fork
  std::vector<std::string> arg_storage;
  arg_storage.push_back(options_.program);
  arg_storage.insert(arg_storage.end(), options_.args.begin(), options_.args.end());
  std::vector<char*> argv;
  for(auto& arg : arg_storage) argv.push_back(arg.data());
  argv.push_back(nullptr);
  auto env_storage = build_environment(options_.app_id);
  std::vector<char*> envp;
  for(auto& entry : env_storage) envp.push_back(entry.data());
  envp.push_back(nullptr);

  pid_t pid = ::fork();
  if(pid < 0) {
    result.err = std::string("fork failed: ") + std::strerror(errno);
    log_warn(logger_.get(), "exec: {}", result.err);
    return result;
  }
  if(pid == 0) {
    // own process group so a timeout can kill the whole pipeline
    ::setpgid(0, 0);
    ::dup2(in_pipe.read_end.get(), STDIN_FILENO);
    ::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
    ::dup2(err_pipe.write_end.get(), STDERR_FILENO);
    ::execve(options_.program.c_str(), argv.data(), envp.data());
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  in_pipe.read_end.reset();
  out_pipe.write_end.reset();
  err_pipe.write_end.reset();

  log_debug(logger_.get(), "exec[{}]: {}", pid, abbreviate(command));

  asio::io_context io;
  asio::steady_timer deadline(io);
  asio::steady_timer reap_timer(io);
  int status = 0;
  bool reaped = false;

  // Output EOF is not the end of the child; the deadline stays armed until it is reaped.
  std::function<void()> poll_child = [&]{
    pid_t waited = ::waitpid(pid, &status, WNOHANG);
    if(waited == pid || (waited < 0 && errno != EINTR)) {
      reaped = waited == pid;
      deadline.cancel();
      return;
    }
    reap_timer.expires_after(kReapPollInterval);
    reap_timer.async_wait([&](const asio::error_code& ec){
      if(!ec) poll_child();
    });
  };

  std::size_t open_streams = 2;
  auto stream_done = [&]{
    if(--open_streams == 0) poll_child();
  };
  StreamPump out_pump(io, out_pipe.read_end.release(), result.out, stream_done);
  StreamPump err_pump(io, err_pipe.read_end.release(), result.err, stream_done);

  asio::posix::stream_descriptor stdin_pipe(io, in_pipe.write_end.release());
  asio::async_write(stdin_pipe, asio::buffer(command),
    [&](const asio::error_code& ec, std::size_t){
      if(ec) log_debug(logger_.get(), "exec[{}]: stdin write failed: {}", pid, ec.message());
      asio::error_code ignored;
      stdin_pipe.close(ignored);
    });

  out_pump.start();
  err_pump.start();

  deadline.expires_after(timeout.count() > 0 ? timeout : std::chrono::seconds(1));
  deadline.async_wait([&](const asio::error_code& ec){
    if(ec == asio::error::operation_aborted || reaped) return;
    result.timed_out = true;
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    reap_timer.cancel();
    out_pump.abort();
    err_pump.abort();
    asio::error_code ignored;
    stdin_pipe.close(ignored);
  });

  io.run();

  pid_t waited = reaped ? pid : -1;
  while(!reaped) {
    waited = ::waitpid(pid, &status, 0);
    if(waited == pid || errno != EINTR) break;
  }

  if(result.timed_out) {
    result.exit_code = -1;
    log_warn(logger_.get(), "exec[{}]: timed out after {}s: {}", pid, timeout.count(), abbreviate(command));
  } else if(waited == pid) {
    result.exit_code = decode_wait_status(status);
    log_debug(logger_.get(), "exec[{}]: rc={} out={}B err={}B", pid, result.exit_code,
              result.out.size(), result.err.size());
  } else {
    result.exit_code = -1;
    result.err += std::string("waitpid failed: ") + std::strerror(errno);
  }
  return result;
}

RetryingExecChannel::RetryingExecChannel(std::shared_ptr<ExecChannel> inner,
                                         BackoffPolicy policy,
                                         SleepFunction sleep,
                                         std::shared_ptr<Logger> logger)
  : inner_(std::move(inner)),
    policy_(policy),
    sleep_(sleep ? std::move(sleep) : SleepFunction(default_sleep)),
    logger_(std::move(logger)) {
  if(!inner_) throw std::invalid_argument("RetryingExecChannel requires an inner channel");
  if(policy_.max_attempts == 0) policy_.max_attempts = 1;
}

ExecResult RetryingExecChannel::exec(const std::string& command, std::chrono::seconds timeout) {
  ExecResult result;
  for(std::size_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    if(attempt > 1) {
      auto delay = policy_.delay_before_retry(attempt - 1);
      log_warn(logger_.get(), "channel timeout, retrying in {}ms ({}/{})",
               delay.count(), attempt, policy_.max_attempts);
      sleep_(delay);
    }
    result = inner_->exec(command, timeout);
    if(!result.timed_out) return result;
  }
  return result;
}
