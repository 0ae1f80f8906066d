#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Configures the process-wide sinks. An empty log_file keeps console output only.
void init(bool verbose = false, const std::string& log_file = std::string());
void set_log_passthrough(bool enabled);
bool log_passthrough();

enum class LogChannel {
  Debug,
  Info,
  Warn,
  Error,
  Print,    // plain user-facing output on stdout
  PrintErr  // plain user-facing errors on stderr
};

const char* to_string(LogChannel channel);
spdlog::level::level_enum level_of(LogChannel channel);

using LogListenerHandle = std::size_t;

namespace detail {
// Console/file output for a message no listener claimed. Silent while passthrough is off.
void emit_to_default(LogChannel channel, const std::string& source, const std::string& message);
} // namespace detail

class Logger {
public:
  // Returning true from a listener marks the message handled and keeps it off the console.
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  void set_name(std::string name);
  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

  // Listeners first, then the default sinks.
  void write(LogChannel channel, const std::string& message);

private:
  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
inline void route(Logger* logger, LogChannel channel, const std::string& message) {
  if(logger) {
    logger->write(channel, message);
  } else {
    emit_to_default(channel, std::string(), message);
  }
}
} // namespace detail

// Free helpers for components that may run without a Logger.
template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
}

// Errors meant for the terminal user: no timestamp, always on stderr.
template<typename... Args>
inline void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(nullptr, LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
}
