#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_event_logger;
std::shared_ptr<spdlog::logger> g_plain_logger;
std::mutex g_create_mutex;
std::atomic<bool> g_log_passthrough{true};

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_create_mutex);
  if(g_event_logger) return;

  // warnings and errors go to stderr, everything else to stdout
  auto out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  out_sink->set_level(spdlog::level::trace);
  auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  err_sink->set_level(spdlog::level::warn);

  g_event_logger = std::make_shared<spdlog::logger>(
    "mediabeam", spdlog::sinks_init_list{out_sink, err_sink});
  g_event_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  g_event_logger->flush_on(spdlog::level::warn);

  auto plain_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  g_plain_logger = std::make_shared<spdlog::logger>("mediabeam.print", plain_sink);
  g_plain_logger->set_pattern("%v");
  g_plain_logger->flush_on(spdlog::level::info);

  spdlog::register_logger(g_event_logger);
  spdlog::register_logger(g_plain_logger);
  spdlog::set_default_logger(g_event_logger);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_event_logger->set_level(level);
  g_plain_logger->set_level(spdlog::level::info);
  spdlog::set_level(level);
}

Logger::Logger() : table_(std::make_shared<ListenerTable>()) {}

Logger::Logger(std::string name)
  : name_(std::move(name)), table_(std::make_shared<ListenerTable>()) {}

Logger::Logger(std::string name, std::shared_ptr<ListenerTable> table)
  : name_(std::move(name)), table_(std::move(table)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

std::shared_ptr<Logger> Logger::child(const std::string& component) {
  std::string child_name = name_.empty() ? component : name_ + "/" + component;
  return std::shared_ptr<Logger>(new Logger(std::move(child_name), table_));
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(table_->mutex);
  const auto id = table_->next_id++;
  table_->listeners.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(table_->mutex);
  table_->listeners.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(table_->mutex);
  table_->listeners.clear();
}

std::size_t Logger::listener_count() const {
  std::lock_guard<std::mutex> lock(table_->mutex);
  return table_->listeners.size();
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(table_->mutex);
    snapshot.reserve(table_->listeners.size());
    for(const auto& entry : table_->listeners) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      if(log_passthrough()) {
        spdlog::error("log listener threw: {}", e.what());
      }
    }
  }
  return handled;
}

void Logger::emit(spdlog::level::level_enum level, const std::string& message) const {
  ensure_loggers();
  if(!log_passthrough()) return;
  if(name_.empty()) {
    g_event_logger->log(level, message);
  } else {
    g_event_logger->log(level, fmt::format("[{}] {}", name_, message));
  }
}

void Logger::emit_plain(const std::string& message) const {
  ensure_loggers();
  if(!log_passthrough()) return;
  g_plain_logger->info(message);
}
