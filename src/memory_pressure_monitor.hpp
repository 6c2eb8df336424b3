#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "asset_cache.hpp"
#include "log.hpp"

struct MemInfo {
  uint64_t total_kb = 0;
  uint64_t available_kb = 0;
};

// Parses the MemTotal / MemAvailable lines of /proc/meminfo.
std::optional<MemInfo> parse_meminfo(const std::string& text);
MemoryPressure classify_pressure(const MemInfo& info, double warning_ratio, double critical_ratio);

// Samples system memory on a timer and reports level changes only.
class MemoryPressureMonitor {
public:
  struct Config {
    std::chrono::milliseconds poll_interval{5000};
    double warning_ratio = 0.85;
    double critical_ratio = 0.95;
    std::string meminfo_path = "/proc/meminfo";
  };

  using Handler = std::function<void(MemoryPressure)>;

  MemoryPressureMonitor(asio::io_context& io, Config config, std::shared_ptr<Logger> logger);
  ~MemoryPressureMonitor();

  void set_handler(Handler handler) { handler_ = std::move(handler); }
  void start();
  void stop();

  // Reads the meminfo file once; false when it cannot be read or parsed.
  bool sample();
  // Feeds a level in directly; the handler runs only when it differs from
  // the previous one.
  void report(MemoryPressure level);

  MemoryPressure level() const { return level_; }

private:
  void arm();

  Config config_;
  std::shared_ptr<Logger> logger_;
  asio::steady_timer timer_;
  Handler handler_;
  MemoryPressure level_ = MemoryPressure::Normal;
  bool running_ = false;
  bool read_failure_logged_ = false;
};
