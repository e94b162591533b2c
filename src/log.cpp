#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <memory>
#include <vector>

namespace {

constexpr const char* kDiagnosticPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kPlainPattern = "%v";

struct ConsoleSinks {
  std::shared_ptr<spdlog::logger> diagnostics;  // debug, info, warn
  std::shared_ptr<spdlog::logger> errors;
  std::shared_ptr<spdlog::logger> out;
  std::shared_ptr<spdlog::logger> err;
};

std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name,
                                                    spdlog::sink_ptr sink,
                                                    const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(spdlog::level::info);
  return logger;
}

ConsoleSinks& console_sinks() {
  static ConsoleSinks sinks = [](){
    ConsoleSinks s;
    s.diagnostics = make_console_logger("sharenode",
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), kDiagnosticPattern);
    s.errors = make_console_logger("sharenode.errors",
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), kDiagnosticPattern);
    s.out = make_console_logger("sharenode.out",
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), kPlainPattern);
    s.err = make_console_logger("sharenode.err",
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), kPlainPattern);
    s.diagnostics->set_level(spdlog::level::info);
    return s;
  }();
  return sinks;
}

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error: return spdlog::level::err;
    case LogChannel::PrintErr: return spdlog::level::err;
    default: return spdlog::level::info;
  }
}

} // namespace

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

void init(bool verbose) {
  auto& sinks = console_sinks();
  sinks.diagnostics->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::set_default_logger(sinks.diagnostics);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

Logger::ListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto handle = next_handle_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void Logger::remove_listener(ListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::emit(LogChannel channel, const std::string& message) {
  auto& sinks = console_sinks();

  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  if(!snapshot.empty()) {
    const LogRecord record{name_, channel, message};
    for(const auto& listener : snapshot) {
      try {
        listener(record);
      } catch(const std::exception& e) {
        sinks.errors->error("[log] listener for '{}' threw: {}", name_, e.what());
      }
    }
  }

  if(!g_passthrough.load()) return;

  if(channel == LogChannel::Print) {
    sinks.out->info("{}", message);
    return;
  }
  if(channel == LogChannel::PrintErr) {
    sinks.err->error("{}", message);
    return;
  }
  auto& target = (channel == LogChannel::Error) ? sinks.errors : sinks.diagnostics;
  if(name_.empty()) {
    target->log(level_of(channel), "[{}] {}", to_string(channel), message);
  } else {
    target->log(level_of(channel), "[{}:{}] {}", name_, to_string(channel), message);
  }
}

Logger& process_logger() {
  static Logger logger("");
  return logger;
}
