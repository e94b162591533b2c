#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

enum class LogChannel {
  Debug,
  Info,
  Warn,
  Error,
  Print,     // console output, stdout, no prefix
  PrintErr   // console output, stderr, no prefix
};

const char* to_string(LogChannel channel);

struct LogRecord {
  std::string logger;
  LogChannel channel;
  std::string message;
};

// Sets up the stdout/stderr sinks. `verbose` lets the debug channel through.
void init(bool verbose = false);
// When off, records still reach listeners but nothing is written to the console.
void set_log_passthrough(bool enabled);

// Component logger. Diagnostic channels are written as
// "[time] [level] [name:channel] message"; the print channels are written bare.
class Logger {
public:
  using Listener = std::function<void(const LogRecord&)>;
  using ListenerHandle = std::size_t;

  explicit Logger(std::string name);

  const std::string& name() const { return name_; }

  ListenerHandle add_listener(Listener listener);
  void remove_listener(ListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

private:
  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void emit(LogChannel channel, const std::string& message);

  const std::string name_;
  std::mutex listener_mutex_;
  std::map<ListenerHandle, Listener> listeners_;
  ListenerHandle next_handle_ = 1;
};

// Unnamed logger for code without a component of its own: command line
// usage, settings file problems, process-level failures.
Logger& process_logger();
