#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kPlainPattern = "%v";

struct Sinks {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
};

Sinks g_sinks;
std::mutex g_sinks_mutex;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name,
                                                    bool to_stderr,
                                                    const char* pattern) {
  spdlog::sink_ptr sink;
  if(to_stderr) {
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

void ensure_loggers_locked() {
  if(g_sinks.info) return;
  g_sinks.info = make_console_logger("tarpull.info", false, kStampedPattern);
  g_sinks.error = make_console_logger("tarpull.error", true, kStampedPattern);
  g_sinks.print = make_console_logger("tarpull.print", false, kPlainPattern);
  g_sinks.print_err = make_console_logger("tarpull.print_err", true, kPlainPattern);

  g_sinks.info->flush_on(spdlog::level::warn);
  g_sinks.error->flush_on(spdlog::level::err);
  g_sinks.print->flush_on(spdlog::level::info);
  g_sinks.print_err->flush_on(spdlog::level::err);
}

void attach_file_sink_locked(const std::string& log_file) {
  if(log_file.empty() || g_sinks.file) return;
  g_sinks.file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  g_sinks.file->set_pattern(kStampedPattern);
  g_sinks.file->set_level(spdlog::level::trace);
  // the file records every channel, including plain user output
  for(auto* logger : {&g_sinks.info, &g_sinks.error, &g_sinks.print, &g_sinks.print_err}) {
    (*logger)->sinks().push_back(g_sinks.file);
  }
}

spdlog::logger* sink_for_locked(LogChannel channel) {
  switch(channel) {
    case LogChannel::Print: return g_sinks.print.get();
    case LogChannel::PrintErr: return g_sinks.print_err.get();
    case LogChannel::Error: return g_sinks.error.get();
    case LogChannel::Debug:
    case LogChannel::Info:
    case LogChannel::Warn: return g_sinks.info.get();
  }
  return g_sinks.info.get();
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Info: return spdlog::level::info;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error: return spdlog::level::err;
    case LogChannel::Print: return spdlog::level::info;
    case LogChannel::PrintErr: return spdlog::level::err;
  }
  return spdlog::level::info;
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
      handled = true;
    }
  }
  return handled;
}

void init(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  ensure_loggers_locked();
  attach_file_sink_locked(log_file);

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_sinks.info->set_level(level);
  g_sinks.error->set_level(spdlog::level::info);
  g_sinks.print->set_level(spdlog::level::info);
  g_sinks.print_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_sinks.info);
  spdlog::set_level(level);
}

void Logger::write(LogChannel channel, const std::string& message) {
  const std::string channel_name = name_.empty()
    ? std::string(to_string(channel))
    : name_ + ":" + to_string(channel);
  if(dispatch(channel_name, level_of(channel), message)) return;
  detail::emit_to_default(channel, name_, message);
}

namespace detail {

void emit_to_default(LogChannel channel, const std::string& source, const std::string& message) {
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    ensure_loggers_locked();
    sink = sink_for_locked(channel);
  }
  if(!sink) return;
  // plain output stays unprefixed
  if(source.empty() || channel == LogChannel::Print || channel == LogChannel::PrintErr) {
    sink->log(level_of(channel), message);
  } else {
    sink->log(level_of(channel), fmt::format("[{}] {}", source, message));
  }
}

} // namespace detail
