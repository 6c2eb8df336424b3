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

void init(bool verbose = false);
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// Named component logger. Listeners see every line first; when none of them
// claims the line it goes to the shared spdlog sinks.
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

  // Child loggers share this logger's listeners under "<name>/<component>".
  std::shared_ptr<Logger> child(const std::string& component);

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    if(dispatch(name_, spdlog::level::info, formatted)) return;
    emit_plain(formatted);
  }

private:
  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  struct ListenerTable {
    std::mutex mutex;
    std::unordered_map<LogListenerHandle, ListenerBinding> listeners;
    std::atomic<LogListenerHandle> next_id{1};
  };

  Logger(std::string name, std::shared_ptr<ListenerTable> table);

  template<typename... Args>
  void log(spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    if(!spdlog::should_log(level) && listener_count() == 0) return;
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    if(dispatch(name_, level, formatted)) return;
    emit(level, formatted);
  }

  std::size_t listener_count() const;
  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);
  void emit(spdlog::level::level_enum level, const std::string& message) const;
  void emit_plain(const std::string& message) const;

  std::string name_;
  std::shared_ptr<ListenerTable> table_;
};

// For code paths that may run before a component logger exists.
template<typename... Args>
inline void log_warn(Logger* logger,
                     spdlog::format_string_t<Args...> fmt,
                     Args&&... args) {
  if(logger) {
    logger->warn(fmt, std::forward<Args>(args)...);
  } else if(log_passthrough()) {
    spdlog::warn(fmt, std::forward<Args>(args)...);
  }
}

template<typename... Args>
inline void print_out(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->print(fmt, std::forward<Args>(args)...);
  } else {
    Logger fallback;
    fallback.print(fmt, std::forward<Args>(args)...);
  }
}

template<typename... Args>
inline void print_err(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->error(fmt, std::forward<Args>(args)...);
  } else if(log_passthrough()) {
    spdlog::error(fmt, std::forward<Args>(args)...);
  }
}
