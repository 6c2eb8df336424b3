#include "fake_transport.hpp"
#include "log.hpp"
#include "peer_link.hpp"
#include "retry_coordinator.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using mediabeam::test::FakeTransport;
using mediabeam::test::RecordingDelegate;
using mediabeam::test::TestCase;
using mediabeam::test::TestContext;
using mediabeam::test::expect;
using mediabeam::test::make_peer;
using mediabeam::test::run_io_until;

namespace {

class RecordingObserver : public SessionObserver {
public:
  void on_session_connected(const Peer& peer) override { connected.push_back(peer.identity); }
  void on_session_disconnected(const Peer& peer) override { disconnected.push_back(peer.identity); }
  void on_session_data(const Peer&, const std::string& bytes) override { data.push_back(bytes); }
  void on_session_resource_started(const Peer&, const std::string& name, int64_t) override {
    started.push_back(name);
  }
  void on_session_resource_finished(const Peer&, const std::string& name,
                                    const std::string&, const std::string&) override {
    finished.push_back(name);
  }

  std::vector<std::string> connected;
  std::vector<std::string> disconnected;
  std::vector<std::string> data;
  std::vector<std::string> started;
  std::vector<std::string> finished;
};

// One PeerLink over a FakeTransport with a retry coordinator attached.
struct LinkFixture {
  explicit LinkFixture(TestContext& ctx,
                       PeerRole role = PeerRole::Browser,
                       RetryCoordinator::Config retry_config = RetryCoordinator::Config{},
                       PeerLink::Config link_config = PeerLink::Config{})
    : logger(std::make_shared<Logger>("link-test")),
      retry(io, retry_config, logger->child("retry")),
      link(io, transport, with_role(link_config, role), logger->child("peer-link")) {
    ctx.logs.attach(logger);
    link.set_delegate(&delegate);
    link.set_session_observer(&observer);
    link.set_retry_coordinator(&retry);
  }

  static PeerLink::Config with_role(PeerLink::Config config, PeerRole role) {
    config.role = role;
    return config;
  }

  asio::io_context io;
  FakeTransport transport;
  RecordingDelegate delegate;
  RecordingObserver observer;
  std::shared_ptr<Logger> logger;
  RetryCoordinator retry;
  PeerLink link;
};

RetryCoordinator::Config fast_retry(int max_retries, std::chrono::milliseconds base) {
  RetryCoordinator::Config config;
  config.max_retries = max_retries;
  config.base_delay = base;
  return config;
}

bool test_discovery_start_is_idempotent(TestContext& ctx) {
  LinkFixture f(ctx);
  f.link.start_discovery();
  f.link.start_discovery();
  f.link.start_discovery();
  bool ok = true;
  ok &= expect(ctx, f.transport.browse_starts == 1, "browsing started once");
  ok &= expect(ctx, f.transport.advertise_starts == 0, "browser never advertises");
  ok &= expect(ctx, f.link.state() == SessionState::Discovering, "state is discovering");
  ok &= expect(ctx, f.link.discovery_active(), "discovery active");

  f.link.stop_discovery();
  f.link.stop_discovery();
  ok &= expect(ctx, f.transport.browse_stops == 1, "browsing stopped once");
  ok &= expect(ctx, f.link.state() == SessionState::Idle, "back to idle");
  return ok;
}

bool test_advertiser_advertises(TestContext& ctx) {
  LinkFixture f(ctx, PeerRole::Advertiser);
  f.link.start_discovery();
  f.link.start_discovery();
  bool ok = true;
  ok &= expect(ctx, f.transport.advertise_starts == 1, "advertising started once");
  ok &= expect(ctx, f.transport.browse_starts == 0, "advertiser never browses");
  return ok;
}

bool test_discovery_failure_retries(TestContext& ctx) {
  PeerLink::Config config;
  config.discovery_retry = 20ms;
  config.discovery_busy_retry = 80ms;
  LinkFixture f(ctx, PeerRole::Browser, RetryCoordinator::Config{}, config);
  f.link.start_discovery();
  f.transport.discovery_fails("socket error", false);

  bool ok = true;
  ok &= expect(ctx, !f.link.discovery_active(), "discovery inactive after failure");
  ok &= expect(ctx, f.delegate.has_error(MediaErrorCode::ConnectionFailed), "failure reported");
  ok &= expect(ctx, run_io_until(f.io, [&]{ return f.transport.browse_starts == 2; }, 1s),
               "discovery restarted after the retry delay");

  auto before = std::chrono::steady_clock::now();
  f.transport.discovery_fails("address in use", true);
  ok &= expect(ctx, run_io_until(f.io, [&]{ return f.transport.browse_starts == 3; }, 1s),
               "discovery restarted after the busy delay");
  ok &= expect(ctx, std::chrono::steady_clock::now() - before >= 70ms, "busy delay is the longer one");
  return ok;
}

bool test_discovery_retry_skipped_when_stopped(TestContext& ctx) {
  PeerLink::Config config;
  config.discovery_retry = 10ms;
  LinkFixture f(ctx, PeerRole::Browser, RetryCoordinator::Config{}, config);
  f.link.start_discovery();
  f.transport.discovery_fails("socket error", false);
  f.link.stop_discovery();
  mediabeam::test::run_io_for(f.io, 60ms);
  return expect(ctx, f.transport.browse_starts == 1, "no restart after stop");
}

bool test_retry_delays_grow_linearly(TestContext& ctx) {
  asio::io_context io;
  auto logger = std::make_shared<Logger>("retry-test");
  ctx.logs.attach(logger);
  RetryCoordinator retry(io, fast_retry(3, 2000ms), logger);
  int gave_up = 0;
  retry.set_give_up_handler([&](const Peer&){ ++gave_up; });
  auto peer = make_peer("Kitchen TV");

  bool ok = true;
  ok &= expect(ctx, retry.schedule_reconnect(peer) && retry.last_delay() == 2000ms, "first delay 2s");
  ok &= expect(ctx, retry.schedule_reconnect(peer) && retry.last_delay() == 4000ms, "second delay 4s");
  ok &= expect(ctx, retry.schedule_reconnect(peer) && retry.last_delay() == 6000ms, "third delay 6s");
  ok &= expect(ctx, !retry.schedule_reconnect(peer), "fourth attempt refused");
  ok &= expect(ctx, gave_up == 1, "give-up handler ran once");
  ok &= expect(ctx, retry.attempt() == 0 && !retry.pending(), "counter reset after giving up");

  retry.schedule_reconnect(peer);
  retry.schedule_reconnect(peer);
  retry.on_connected();
  ok &= expect(ctx, retry.attempt() == 0 && !retry.pending(), "connect resets the counter");
  ok &= expect(ctx, retry.schedule_reconnect(peer) && retry.last_delay() == 2000ms, "delay back to 2s");
  retry.cancel();
  return ok;
}

bool test_reconnects_after_unexpected_drop(TestContext& ctx) {
  LinkFixture f(ctx, PeerRole::Browser, fast_retry(3, 10ms));
  auto tv = make_peer("Living Room TV");
  f.link.start_discovery();
  f.transport.peer_appears(tv);
  f.transport.connect(tv);

  bool ok = true;
  ok &= expect(ctx, f.link.connected(), "connected");
  f.transport.drop(tv);
  ok &= expect(ctx, f.link.state() == SessionState::Discovering, "searching again after drop");
  ok &= expect(ctx, f.retry.pending() && f.retry.attempt() == 1, "reconnect scheduled");
  ok &= expect(ctx, f.observer.disconnected.size() == 1, "observer told about the drop");
  ok &= expect(ctx, run_io_until(f.io, [&]{ return f.transport.invites.size() == 2; }, 1s),
               "re-invited the selected peer");
  ok &= expect(ctx, f.link.state() == SessionState::Connecting, "connecting");

  f.transport.connect(tv);
  ok &= expect(ctx, f.link.connected(), "reconnected");
  ok &= expect(ctx, f.retry.attempt() == 0, "retry counter reset on connect");
  ok &= expect(ctx, f.delegate.connected_count() == 2, "two connected events");
  return ok;
}

bool test_give_up_clears_selection(TestContext& ctx) {
  LinkFixture f(ctx, PeerRole::Browser, fast_retry(1, 5ms));
  auto tv = make_peer("Bedroom TV");
  f.link.start_discovery();
  f.transport.peer_appears(tv);
  f.transport.connect(tv);
  f.transport.drop(tv);

  bool ok = true;
  ok &= expect(ctx, run_io_until(f.io, [&]{ return f.transport.invites.size() == 2; }, 1s),
               "one reconnect attempt");
  // the reconnect attempt fails as well
  f.transport.drop(tv);
  ok &= expect(ctx, !f.link.selected_peer().has_value(), "selection cleared after giving up");
  ok &= expect(ctx, !f.retry.pending(), "nothing scheduled");
  ok &= expect(ctx, f.link.state() == SessionState::Discovering, "still searching");

  // a later sighting is a fresh auto-invite
  f.transport.peer_disappears(tv);
  f.transport.peer_appears(tv);
  ok &= expect(ctx, f.transport.invites.size() == 3, "fresh auto-invite after give-up");
  return ok;
}

bool test_explicit_disconnect_does_not_reconnect(TestContext& ctx) {
  LinkFixture f(ctx, PeerRole::Browser, fast_retry(3, 5ms));
  auto tv = make_peer("Office TV");
  f.link.start_discovery();
  f.transport.peer_appears(tv);
  f.transport.connect(tv);
  f.link.disconnect();

  bool ok = true;
  ok &= expect(ctx, f.transport.disconnect_calls == 1, "transport disconnected");
  ok &= expect(ctx, !f.link.connected(), "not connected");
  ok &= expect(ctx, !f.retry.pending(), "no reconnect scheduled");
  mediabeam::test::run_io_for(f.io, 40ms);
  ok &= expect(ctx, f.transport.invites.size() == 1, "no further invites");
  return ok;
}

// Scenario A: the browser sees a TV, invites it on its own and ends up with
// exactly one connected event.
bool test_scenario_auto_invite_connects_once(TestContext& ctx) {
  LinkFixture f(ctx);
  auto phone = make_peer("Anna's Phone");
  auto tv = make_peer("Living Room TV");
  auto other_tv = make_peer("Guest TV");

  f.link.start_discovery();
  f.transport.peer_appears(phone);
  bool ok = true;
  ok &= expect(ctx, f.transport.invites.empty(), "no invite for a non-TV peer");

  f.transport.peer_appears(tv);
  f.transport.peer_appears(tv);
  ok &= expect(ctx, f.transport.invites.size() == 1, "exactly one invite");
  ok &= expect(ctx, !f.transport.invites.empty() && f.transport.invites[0].second == "Sender-Connection",
               "invite carries the sender context");
  ok &= expect(ctx, f.link.state() == SessionState::Connecting, "connecting");

  f.transport.connect(tv);
  f.transport.connect(tv);
  ok &= expect(ctx, f.link.connected(), "connected");
  ok &= expect(ctx, f.delegate.connected_count() == 1, "one connected event");
  ok &= expect(ctx, f.observer.connected.size() == 1, "one session start");
  ok &= expect(ctx, f.transport.browse_stops == 1, "browsing stops while connected");

  f.transport.peer_appears(other_tv);
  ok &= expect(ctx, f.transport.invites.size() == 1, "no invite while a peer is selected");
  f.link.invite(other_tv);
  ok &= expect(ctx, f.transport.invites.size() == 1, "explicit invite ignored while connected");
  ok &= expect(ctx, f.delegate.peers_found.size() == 3, "each peer reported once");
  return ok;
}

bool test_invitation_rules(TestContext& ctx) {
  LinkFixture f(ctx, PeerRole::Advertiser);
  f.link.start_discovery();
  auto sender = make_peer("Sender Phone", PeerRole::Browser);
  auto stranger = make_peer("Laptop", PeerRole::Browser);

  bool ok = true;
  auto wrong_context = f.transport.invited_by(stranger, "Printer-Setup");
  ok &= expect(ctx, wrong_context && !*wrong_context, "unexpected context declined");

  auto accepted = f.transport.invited_by(sender, "Sender-Connection");
  ok &= expect(ctx, accepted && *accepted, "sender context accepted");
  ok &= expect(ctx, f.link.connected() && f.link.connected_peer()->identity == "Sender Phone",
               "session with the sender");

  auto second = f.transport.invited_by(stranger, "Sender-Connection");
  ok &= expect(ctx, second && !*second, "second invitation declined while connected");
  ok &= expect(ctx, f.link.connected_peer()->identity == "Sender Phone", "session unchanged");

  LinkFixture g(ctx, PeerRole::Advertiser);
  auto empty_context = g.transport.invited_by(stranger, "");
  ok &= expect(ctx, empty_context && *empty_context, "empty context accepted");
  return ok;
}

bool test_traffic_filtered_to_session_peer(TestContext& ctx) {
  LinkFixture f(ctx, PeerRole::Advertiser);
  auto sender = make_peer("Sender Phone", PeerRole::Browser);
  auto other = make_peer("Other Phone", PeerRole::Browser);
  f.transport.invited_by(sender, "Sender-Connection");

  auto dir = mediabeam::test::fresh_directory("link_filter");
  auto stray = mediabeam::test::write_file(dir / "stray.jpg", "xx");

  f.transport.deliver(sender, "IMAGE_RECEIVED");
  f.transport.deliver(other, "IMAGE_RECEIVED");
  f.transport.deliver_resource(other, "stray.jpg", stray, 2);

  bool ok = true;
  ok &= expect(ctx, f.observer.data.size() == 1, "only session data forwarded");
  ok &= expect(ctx, f.observer.finished.empty(), "foreign resource not forwarded");
  ok &= expect(ctx, !std::filesystem::exists(stray), "foreign resource file removed");

  std::string error;
  ok &= expect(ctx, f.link.send_data("hello", error), "send over session");
  f.transport.drop(other);
  ok &= expect(ctx, f.link.connected(), "drop of a non-session peer ignored");
  mediabeam::test::remove_directory(dir);
  return ok;
}

bool test_send_without_session_fails(TestContext& ctx) {
  LinkFixture f(ctx);
  std::string error;
  bool ok = true;
  ok &= expect(ctx, !f.link.send_data("hello", error) && !error.empty(), "send_data refused");
  ok &= expect(ctx, f.link.send_resource("/tmp/x.jpg", "x.jpg", nullptr, nullptr) == nullptr,
               "send_resource refused");
  ok &= expect(ctx, f.transport.sent_data.empty(), "nothing reached the transport");
  return ok;
}

bool test_failed_invite_resumes_discovery(TestContext& ctx) {
  LinkFixture f(ctx, PeerRole::Browser, fast_retry(2, 5ms));
  auto tv = make_peer("Hall TV");
  f.link.start_discovery();
  f.transport.peer_appears(tv);
  f.transport.drop(tv);

  bool ok = true;
  ok &= expect(ctx, f.link.state() == SessionState::Discovering, "searching again");
  ok &= expect(ctx, f.observer.disconnected.empty(), "no session end for a failed invite");
  ok &= expect(ctx, f.delegate.connected_count() == 0, "no connected event");
  ok &= expect(ctx, f.retry.pending(), "invite retried");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"discovery_start_is_idempotent", test_discovery_start_is_idempotent},
    {"advertiser_advertises", test_advertiser_advertises},
    {"discovery_failure_retries", test_discovery_failure_retries},
    {"discovery_retry_skipped_when_stopped", test_discovery_retry_skipped_when_stopped},
    {"retry_delays_grow_linearly", test_retry_delays_grow_linearly},
    {"reconnects_after_unexpected_drop", test_reconnects_after_unexpected_drop},
    {"give_up_clears_selection", test_give_up_clears_selection},
    {"explicit_disconnect_does_not_reconnect", test_explicit_disconnect_does_not_reconnect},
    {"scenario_auto_invite_connects_once", test_scenario_auto_invite_connects_once},
    {"invitation_rules", test_invitation_rules},
    {"traffic_filtered_to_session_peer", test_traffic_filtered_to_session_peer},
    {"send_without_session_fails", test_send_without_session_fails},
    {"failed_invite_resumes_discovery", test_failed_invite_resumes_discovery}
  };
  return mediabeam::test::run_suite("link", "LINK", tests, argc, argv);
}
