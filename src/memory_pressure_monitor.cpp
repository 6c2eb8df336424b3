#include "memory_pressure_monitor.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

std::optional<MemInfo> parse_meminfo(const std::string& text) {
  std::istringstream in(text);
  std::string line;
  MemInfo info;
  bool have_total = false;
  bool have_available = false;
  while(std::getline(in, line)) {
    std::istringstream fields(line);
    std::string key;
    uint64_t value = 0;
    if(!(fields >> key >> value)) continue;
    if(key == "MemTotal:") {
      info.total_kb = value;
      have_total = true;
    } else if(key == "MemAvailable:") {
      info.available_kb = value;
      have_available = true;
    }
  }
  if(!have_total || !have_available || info.total_kb == 0) return std::nullopt;
  return info;
}

MemoryPressure classify_pressure(const MemInfo& info, double warning_ratio, double critical_ratio) {
  if(info.total_kb == 0) return MemoryPressure::Normal;
  double available = static_cast<double>(std::min(info.available_kb, info.total_kb));
  double used = 1.0 - available / static_cast<double>(info.total_kb);
  if(used >= critical_ratio) return MemoryPressure::Critical;
  if(used >= warning_ratio) return MemoryPressure::Warning;
  return MemoryPressure::Normal;
}

MemoryPressureMonitor::MemoryPressureMonitor(asio::io_context& io,
                                             Config config,
                                             std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("memory")),
    timer_(io) {}

MemoryPressureMonitor::~MemoryPressureMonitor() {
  stop();
}

void MemoryPressureMonitor::start() {
  if(running_) return;
  running_ = true;
  sample();
  arm();
}

void MemoryPressureMonitor::stop() {
  running_ = false;
  std::error_code ec;
  timer_.cancel(ec);
}

bool MemoryPressureMonitor::sample() {
  std::ifstream in(config_.meminfo_path);
  if(!in) {
    if(!read_failure_logged_) {
      logger_->warn("Cannot read {}, memory pressure monitoring disabled", config_.meminfo_path);
      read_failure_logged_ = true;
    }
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  auto info = parse_meminfo(buffer.str());
  if(!info) {
    logger_->debug("Unrecognised meminfo contents");
    return false;
  }
  report(classify_pressure(*info, config_.warning_ratio, config_.critical_ratio));
  return true;
}

void MemoryPressureMonitor::report(MemoryPressure level) {
  if(level == level_) return;
  auto previous = level_;
  level_ = level;
  if(level == MemoryPressure::Normal) {
    logger_->info("Memory pressure back to normal (was {})", to_string(previous));
  } else {
    logger_->warn("Memory pressure {}", to_string(level));
  }
  if(handler_) handler_(level);
}

void MemoryPressureMonitor::arm() {
  if(!running_) return;
  timer_.expires_after(config_.poll_interval);
  timer_.async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    sample();
    arm();
  });
}
