#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <deque>
#include <filesystem>
#include <string>
#include <vector>

#include "command_line_parser.hpp"
#include "event_delegate.hpp"
#include "log.hpp"
#include "media_beam_engine.hpp"
#include "settings_manager.hpp"

namespace {

// Prints engine events; on the sending side it also feeds the files given
// on the command line to the engine one at a time.
class ConsoleDelegate : public EventDelegate {
public:
  ConsoleDelegate(MediaBeamEngine& engine, std::vector<std::string> files)
    : engine_(engine), files_(files.begin(), files.end()) {}

  void on_peer_found(const Peer& peer) override {
    print_out(nullptr, "Found {}", peer.identity);
  }

  void on_peer_lost(const Peer& peer) override {
    print_out(nullptr, "Lost {}", peer.identity);
  }

  void on_connection_state_changed(const Peer& peer, bool connected) override {
    print_out(nullptr, "{} {}", connected ? "Connected to" : "Disconnected from", peer.identity);
    connected_ = connected;
    if(connected) send_next();
  }

  void on_transfer_progress(MediaKind kind, double percent) override {
    int whole = static_cast<int>(percent);
    if(whole / 10 == last_decile_) return;
    last_decile_ = whole / 10;
    print_out(nullptr, "Sending {} {}%", to_string(kind), whole);
  }

  void on_transfer_settled(MediaKind kind) override {
    print_out(nullptr, "Sent {}", to_string(kind));
    last_decile_ = -1;
    send_next();
  }

  void on_transfer_failed(MediaKind kind, const MediaError& error) override {
    print_err(nullptr, "Sending {} failed: {}", to_string(kind), error.message());
    last_decile_ = -1;
    send_next();
  }

  void on_delivery_confirmed(const Peer& peer) override {
    print_out(nullptr, "{} confirmed delivery", peer.identity);
  }

  void on_media_received(const std::string& path, MediaKind kind) override {
    print_out(nullptr, "Received {} {}", to_string(kind), path);
  }

  void on_media_queued(const std::string& path, MediaKind) override {
    print_out(nullptr, "Queued {} until move mode ends", path);
  }

  void on_move_mode_state_changed(bool enabled) override {
    print_out(nullptr, "Peer move mode {}", enabled ? "on" : "off");
  }

  void on_error(const MediaError& error) override {
    print_err(nullptr, "{}", error.message());
  }

private:
  void send_next() {
    while(connected_ && !files_.empty()) {
      auto path = files_.front();
      files_.pop_front();
      if(engine_.send_media(path)) return;
    }
  }

  MediaBeamEngine& engine_;
  std::deque<std::string> files_;
  bool connected_ = false;
  int last_decile_ = -1;
};

} // namespace

int main(int argc, char** argv){
  try {
    MediaBeamEngine::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "mediabeam");
    std::vector<std::string> files;
    try {
      files = parser.parse(argc, argv, *settings);
    } catch(const std::runtime_error& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        print_err(nullptr, "Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    MediaBeamEngine engine(settings, options);
    if(!files.empty() && settings->get<std::string>("role") != "sender") {
      log_warn(engine.logger().get(), "Ignoring {} file argument(s): only a sender transmits", files.size());
      files.clear();
    }
    ConsoleDelegate delegate(engine, files);
    engine.set_delegate(&delegate);
    engine.start();

    asio::signal_set signals(engine.io(), SIGINT, SIGTERM);
    signals.async_wait([&engine](const std::error_code& ec, int){
      if(!ec) engine.io().stop();
    });

    engine.run();
    engine.stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("mediabeam-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
