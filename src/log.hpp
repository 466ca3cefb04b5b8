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

enum class LogChannel { Info, Warn, Error, Debug, Print, PrintErr };

const char* channel_name(LogChannel channel);

void init(bool verbose = false);

// When disabled, messages that no listener consumed are dropped instead
// of reaching the console sinks. Test runners turn this off.
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

class Logger {
public:
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
  void clear_listeners();

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  // Unadorned user-facing output (no timestamp or level).
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

private:
  template<typename... Args>
  void log(LogChannel channel,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    std::string tagged = name_.empty()
      ? std::string(channel_name(channel))
      : name_ + ":" + channel_name(channel);
    if(dispatch(tagged, channel, formatted)) return;
    emit(channel, formatted);
  }

  bool dispatch(const std::string& tagged_channel,
                LogChannel channel,
                const std::string& message);
  void emit(LogChannel channel, const std::string& message) const;

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
spdlog::level::level_enum level_for(LogChannel channel);
void emit_to_console(LogChannel channel,
                     const std::string& prefix,
                     const std::string& message);
} // namespace detail

// Free helpers for code that may not own a Logger (settings loading, CLI).
template<typename... Args>
inline void print_out(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->print(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_console(LogChannel::Print, "", fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void print_err(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->print_err(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_console(LogChannel::PrintErr, "", fmt::format(fmt, std::forward<Args>(args)...));
  }
}
