#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_log_out;
std::shared_ptr<spdlog::logger> g_log_err;
std::shared_ptr<spdlog::logger> g_plain_out;
std::shared_ptr<spdlog::logger> g_plain_err;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_sink_logger(const std::string& name,
                                                 spdlog::sink_ptr sink,
                                                 const std::string& pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

void create_loggers() {
  std::call_once(g_create_once, [](){
    const std::string stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    g_log_out = make_sink_logger("peersend.log",
                                 std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                 stamped);
    g_log_err = make_sink_logger("peersend.error",
                                 std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                 stamped);
    g_plain_out = make_sink_logger("peersend.print",
                                   std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                   "%v");
    g_plain_err = make_sink_logger("peersend.print_err",
                                   std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                   "%v");

    g_log_out->set_level(spdlog::level::info);
    g_log_out->flush_on(spdlog::level::warn);
    g_log_err->flush_on(spdlog::level::err);
    g_plain_out->flush_on(spdlog::level::info);
    g_plain_err->flush_on(spdlog::level::err);
  });
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  create_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_log_out->set_level(level);
  spdlog::set_default_logger(g_log_out);
  spdlog::set_level(level);
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

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

bool Logger::dispatch(const std::string& tagged_channel,
                      LogChannel channel,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  const auto level = detail::level_for(channel);
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, tagged_channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_console(LogChannel::Error, name_,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(LogChannel channel, const std::string& message) const {
  detail::emit_to_console(channel, name_, message);
}

namespace detail {

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

void emit_to_console(LogChannel channel,
                     const std::string& prefix,
                     const std::string& message) {
  create_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  switch(channel) {
    case LogChannel::Print: sink = g_plain_out.get(); break;
    case LogChannel::PrintErr: sink = g_plain_err.get(); break;
    case LogChannel::Error: sink = g_log_err.get(); break;
    default: sink = g_log_out.get(); break;
  }
  if(!sink) return;

  const bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(!plain && !prefix.empty()) {
    sink->log(level_for(channel), fmt::format("[{}] {}", prefix, message));
  } else {
    sink->log(level_for(channel), message);
  }
}

} // namespace detail
