#include "asset_cache.hpp"
#include "command_line_parser.hpp"
#include "ingest_queue.hpp"
#include "log.hpp"
#include "media_library.hpp"
#include "media_probe.hpp"
#include "media_storage.hpp"
#include "memory_pressure_monitor.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "thumbnail_cache.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using mediabeam::test::RecordingDelegate;
using mediabeam::test::TestCase;
using mediabeam::test::TestContext;
using mediabeam::test::expect;
using mediabeam::test::make_mp4;
using mediabeam::test::make_png;
using mediabeam::test::run_io_for;
using mediabeam::test::run_io_until;
using mediabeam::test::wait_for_condition;
using mediabeam::test::write_file;

namespace fs = std::filesystem;

namespace {

struct IngestFixture {
  explicit IngestFixture(TestContext& ctx, std::chrono::milliseconds drain_delay = 30ms)
    : logger(std::make_shared<Logger>("ingest-test")),
      ingest(io, library, IngestQueue::Config{drain_delay}, logger) {
    ctx.logs.attach(logger);
    ingest.set_delegate(&delegate);
  }

  asio::io_context io;
  RecordingDelegate delegate;
  std::shared_ptr<Logger> logger;
  MediaLibrary library;
  IngestQueue ingest;
};

// Hands out a tiny Asset per path and counts loads. With a gate set, loads
// block until the gate opens.
class CountingLoader : public AssetLoader {
public:
  std::shared_ptr<const Asset> load(const std::string& path) override {
    if(gate_.valid()) gate_.wait();
    ++loads;
    auto asset = std::make_shared<Asset>();
    asset->path = path;
    asset->file_size = 1;
    return asset;
  }

  void close_gate() { gate_ = opener_.get_future().share(); }
  void open_gate() { opener_.set_value(); }

  std::atomic<int> loads{0};

private:
  std::promise<void> opener_;
  std::shared_future<void> gate_;
};

struct CacheFixture {
  CacheFixture(TestContext& ctx, const std::string& name, std::size_t capacity)
    : root(mediabeam::test::fresh_directory(name)),
      logger(std::make_shared<Logger>("cache-test")),
      loader(std::make_shared<CountingLoader>()),
      cache(workers, loader, AssetCache::Config{capacity}, logger) {
    ctx.logs.attach(logger);
  }

  ~CacheFixture() {
    workers.join();
    mediabeam::test::remove_directory(root);
  }

  // get() only loads files that exist.
  std::string file(const std::string& name) {
    return write_file(root / name, "x");
  }

  fs::path root;
  asio::thread_pool workers{2};
  std::shared_ptr<Logger> logger;
  std::shared_ptr<CountingLoader> loader;
  AssetCache cache;
};

std::string meminfo_text(uint64_t total_kb, uint64_t available_kb) {
  return "MemTotal:       " + std::to_string(total_kb) + " kB\n"
         "MemFree:          123456 kB\n"
         "MemAvailable:   " + std::to_string(available_kb) + " kB\n"
         "Buffers:           2048 kB\n";
}

std::string make_jpeg(uint16_t width, uint16_t height) {
  std::string out("\xFF\xD8", 2);
  // APP0 with a 14 byte body
  out += std::string("\xFF\xE0\x00\x10", 4);
  out += std::string("JFIF\0\x01\x01\x00\x00\x01\x00\x01\x00\x00", 14);
  out += std::string("\xFF\xC0\x00\x11\x08", 5);
  out.push_back(static_cast<char>(height >> 8));
  out.push_back(static_cast<char>(height & 0xff));
  out.push_back(static_cast<char>(width >> 8));
  out.push_back(static_cast<char>(width & 0xff));
  out += std::string(10, '\x01');
  out += std::string("\xFF\xD9", 2);
  return out;
}

char* arg(std::string& s) { return &s[0]; }

// Ingest ------------------------------------------------------------------

bool test_unlocked_items_go_straight_to_library(TestContext& ctx) {
  IngestFixture f(ctx);
  f.ingest.offer("/media/a.jpg", MediaKind::Image);
  f.ingest.offer("/media/b.mp4", MediaKind::Video);
  f.ingest.offer("/media/a.jpg", MediaKind::Image);

  bool ok = true;
  ok &= expect(ctx, f.library.items() == std::vector<std::string>({"/media/a.jpg", "/media/b.mp4"}),
               "arrival order kept, duplicate ignored");
  ok &= expect(ctx, f.library.current() && *f.library.current() == "/media/b.mp4", "newest item selected");
  ok &= expect(ctx, f.delegate.queued.empty(), "nothing queued");
  return ok;
}

// Scenario C: a video that arrives while the receiver is in move mode waits
// in the queue and lands in the library, selected, once move mode ends.
bool test_scenario_move_mode_queue_drains_on_exit(TestContext& ctx) {
  IngestFixture f(ctx);
  std::vector<bool> handler_calls;
  f.ingest.set_move_mode_handler([&](bool enabled){ handler_calls.push_back(enabled); });
  f.ingest.offer("/media/first.jpg", MediaKind::Image);

  f.ingest.set_move_mode(true);
  f.ingest.offer("/media/clip.mp4", MediaKind::Video);

  bool ok = true;
  ok &= expect(ctx, !f.library.contains("/media/clip.mp4"), "held back during move mode");
  ok &= expect(ctx, f.ingest.pending().size() == 1, "one pending item");
  ok &= expect(ctx, f.delegate.queued == std::vector<std::string>({"/media/clip.mp4"}), "queued event");

  f.ingest.set_move_mode(false);
  ok &= expect(ctx, f.library.items() == std::vector<std::string>({"/media/first.jpg", "/media/clip.mp4"}),
               "drained after the existing item");
  ok &= expect(ctx, f.library.current_index() == 1, "drained item selected");
  ok &= expect(ctx, f.ingest.pending().empty(), "queue empty");
  ok &= expect(ctx, f.delegate.drains.size() == 1 && f.delegate.drains[0] == std::make_pair<std::size_t, std::size_t>(1, 1),
               "drain reported with count and index");
  ok &= expect(ctx, handler_calls == std::vector<bool>({true, false}), "handler sees both changes");
  return ok;
}

bool test_drain_is_exactly_once_in_order(TestContext& ctx) {
  IngestFixture f(ctx);
  f.ingest.offer("/media/old.jpg", MediaKind::Image);
  f.ingest.set_move_mode(true);
  f.ingest.offer("/media/1.jpg", MediaKind::Image);
  f.ingest.offer("/media/old.jpg", MediaKind::Image);
  f.ingest.offer("/media/2.mp4", MediaKind::Video);
  f.ingest.offer("/media/1.jpg", MediaKind::Image);
  f.ingest.set_move_mode(true);
  f.ingest.set_move_mode(false);
  f.ingest.drain();

  bool ok = true;
  ok &= expect(ctx, f.library.items() == std::vector<std::string>({"/media/old.jpg", "/media/1.jpg", "/media/2.mp4"}),
               "queue order preserved");
  for(const auto& path : f.library.items()) {
    ok &= expect(ctx, f.library.count(path) == 1, path + " present once");
  }
  ok &= expect(ctx, f.delegate.drains.size() == 1, "a single drain");
  ok &= expect(ctx, !f.delegate.drains.empty() && f.delegate.drains[0].first == 4, "all four offers drained");
  return ok;
}

bool test_modal_close_drains_after_delay(TestContext& ctx) {
  IngestFixture f(ctx, 30ms);
  f.ingest.set_modal_open(true);
  f.ingest.offer("/media/a.jpg", MediaKind::Image);
  f.ingest.set_modal_open(false);

  bool ok = true;
  ok &= expect(ctx, f.ingest.drain_scheduled(), "drain scheduled");
  ok &= expect(ctx, !f.library.contains("/media/a.jpg"), "not drained on close");
  ok &= expect(ctx, run_io_until(f.io, [&]{ return f.library.contains("/media/a.jpg"); }, 1s),
               "drained after the delay");
  ok &= expect(ctx, !f.ingest.drain_scheduled(), "schedule cleared");
  return ok;
}

bool test_modal_close_keeps_arrival_order(TestContext& ctx) {
  IngestFixture f(ctx, 30ms);
  f.ingest.set_modal_open(true);
  f.ingest.offer("/m/a.jpg", MediaKind::Image);
  f.ingest.set_modal_open(false);
  // arrives while the drain is still pending
  f.ingest.offer("/m/b.jpg", MediaKind::Image);

  bool ok = true;
  ok &= expect(ctx, f.library.empty(), "nothing jumps the queue");
  ok &= expect(ctx, f.ingest.pending().size() == 2, "both pending");
  run_io_for(f.io, 100ms);
  ok &= expect(ctx, f.library.items() == std::vector<std::string>({"/m/a.jpg", "/m/b.jpg"}), "arrival order");
  ok &= expect(ctx, f.library.current() && *f.library.current() == "/m/b.jpg", "last arrival selected");
  ok &= expect(ctx, f.delegate.drains.size() == 1 && f.delegate.drains[0].first == 2, "one drain of both");

  f.ingest.offer("/m/c.jpg", MediaKind::Image);
  ok &= expect(ctx, f.library.size() == 3 && f.ingest.pending().empty(), "direct again once drained");
  return ok;
}

bool test_modal_reopen_cancels_drain(TestContext& ctx) {
  IngestFixture f(ctx, 40ms);
  f.ingest.set_modal_open(true);
  f.ingest.offer("/media/a.jpg", MediaKind::Image);
  f.ingest.set_modal_open(false);
  f.ingest.set_modal_open(true);
  run_io_for(f.io, 120ms);

  bool ok = true;
  ok &= expect(ctx, !f.library.contains("/media/a.jpg"), "still held while the modal is open");
  ok &= expect(ctx, f.ingest.pending().size() == 1, "still pending");
  f.ingest.set_modal_open(false);
  ok &= expect(ctx, run_io_until(f.io, [&]{ return f.library.contains("/media/a.jpg"); }, 1s),
               "drained after the final close");
  return ok;
}

bool test_move_mode_exit_with_modal_open_waits(TestContext& ctx) {
  IngestFixture f(ctx, 20ms);
  f.ingest.set_move_mode(true);
  f.ingest.set_modal_open(true);
  f.ingest.offer("/media/a.jpg", MediaKind::Image);
  f.ingest.set_move_mode(false);

  bool ok = true;
  ok &= expect(ctx, f.ingest.locked(), "still locked by the modal");
  ok &= expect(ctx, f.library.empty(), "nothing drained");
  f.ingest.set_modal_open(false);
  ok &= expect(ctx, run_io_until(f.io, [&]{ return !f.library.empty(); }, 1s), "drained after modal close");
  return ok;
}

// Library -----------------------------------------------------------------

bool test_library_operations(TestContext& ctx) {
  MediaLibrary library;
  int notifications = 0;
  library.set_change_listener([&](const MediaLibrary&){ ++notifications; });

  bool ok = true;
  ok &= expect(ctx, !library.add(""), "empty path ignored");
  ok &= expect(ctx, library.add_batch({"a", "b", "a", "c"}) == 3, "batch counts new paths");
  ok &= expect(ctx, notifications == 1, "batch notifies once");
  ok &= expect(ctx, !library.add("b"), "duplicate rejected");

  ok &= expect(ctx, library.select(1) && *library.current() == "b", "select");
  int selected = notifications;
  ok &= expect(ctx, library.select(1) && notifications == selected, "same selection does not notify");
  ok &= expect(ctx, !library.select(7), "select out of range");
  ok &= expect(ctx, library.move(1, 2), "move");
  ok &= expect(ctx, library.items() == std::vector<std::string>({"a", "c", "b"}), "order after move");
  ok &= expect(ctx, library.current() && *library.current() == "b", "selection follows the moved item");

  ok &= expect(ctx, library.previous() && *library.current() == "c", "previous");
  ok &= expect(ctx, library.next() && *library.current() == "b", "next");
  ok &= expect(ctx, !library.next(), "next stops at the end");

  ok &= expect(ctx, library.remove("a"), "remove");
  ok &= expect(ctx, library.current() && *library.current() == "b", "selection kept after removing an earlier item");
  ok &= expect(ctx, !library.remove("zzz"), "unknown path");
  ok &= expect(ctx, !library.move(0, 9), "move out of range");

  int before = notifications;
  library.clear();
  ok &= expect(ctx, library.empty() && library.current() == nullptr, "cleared");
  ok &= expect(ctx, notifications == before + 1, "clear notifies");
  return ok;
}

// Caches ------------------------------------------------------------------

bool test_asset_cache_bounded_lru(TestContext& ctx) {
  CacheFixture f(ctx, "cache_lru", 3);
  auto a = f.file("a.jpg");
  auto b = f.file("b.jpg");
  auto c = f.file("c.jpg");
  auto d = f.file("d.jpg");
  f.cache.get(a);
  f.cache.get(b);
  f.cache.get(c);
  f.cache.get(a);
  f.cache.get(d);

  bool ok = true;
  ok &= expect(ctx, f.cache.size() == 3, "size bounded by capacity");
  ok &= expect(ctx, !f.cache.contains(b), "least recently used evicted");
  ok &= expect(ctx, f.cache.contains(a) && f.cache.contains(c) && f.cache.contains(d), "others kept");
  auto entries = f.cache.entries();
  ok &= expect(ctx, !entries.empty() && entries.front().key == d, "most recent first");
  ok &= expect(ctx, f.loader->loads == 4, "hit did not reload");
  ok &= expect(ctx, !f.cache.get((f.root / "missing.jpg").string()), "missing file not cached");
  return ok;
}

bool test_asset_cache_preload_on_workers(TestContext& ctx) {
  CacheFixture f(ctx, "cache_preload", 10);
  std::vector<std::string> paths{"p0", "p1", "p2", "p3", "p4", "p5", "p6"};
  f.cache.preload_around(3, 2, paths);

  bool ok = true;
  ok &= expect(ctx, wait_for_condition([&]{ return f.cache.size() == 5 && f.cache.in_flight() == 0; }, 2s),
               "window loaded");
  ok &= expect(ctx, f.cache.contains("p1") && f.cache.contains("p5"), "window edges loaded");
  ok &= expect(ctx, !f.cache.contains("p0") && !f.cache.contains("p6"), "outside the window skipped");
  ok &= expect(ctx, !f.cache.preload("p3"), "cached key not reloaded");
  return ok;
}

bool test_asset_cache_memory_pressure(TestContext& ctx) {
  CacheFixture f(ctx, "cache_pressure", 6);
  std::vector<std::string> paths;
  for(auto name : {"a.jpg", "b.jpg", "c.jpg", "d.jpg", "e.jpg", "f.jpg"}) {
    paths.push_back(f.file(name));
    f.cache.get(paths.back());
  }

  bool ok = true;
  f.cache.handle_memory_pressure(MemoryPressure::Warning);
  ok &= expect(ctx, f.cache.capacity() == 3 && f.cache.size() == 3, "warning halves the cache");
  ok &= expect(ctx, f.cache.contains(paths[5]) && !f.cache.contains(paths[0]), "recent entries survive");

  f.cache.handle_memory_pressure(MemoryPressure::Normal);
  ok &= expect(ctx, f.cache.capacity() == 6, "normal restores capacity");

  f.cache.handle_memory_pressure(MemoryPressure::Critical);
  ok &= expect(ctx, f.cache.size() == 0, "critical empties the cache");
  return ok;
}

bool test_asset_cache_critical_discards_inflight(TestContext& ctx) {
  CacheFixture f(ctx, "cache_critical", 4);
  f.loader->close_gate();
  bool ok = true;
  ok &= expect(ctx, f.cache.preload("slow"), "preload started");
  ok &= expect(ctx, !f.cache.preload("slow"), "second preload of a loading key refused");
  f.cache.handle_memory_pressure(MemoryPressure::Critical);
  f.loader->open_gate();
  f.workers.join();
  ok &= expect(ctx, f.loader->loads == 1, "load ran");
  ok &= expect(ctx, !f.cache.contains("slow"), "stale result discarded");
  ok &= expect(ctx, f.cache.in_flight() == 0, "nothing in flight");
  return ok;
}

bool test_replaced_media_drops_cached_asset(TestContext& ctx) {
  CacheFixture f(ctx, "cache_replace", 4);
  MediaStorage storage(f.root / "media", f.logger);
  std::vector<std::string> replaced;
  storage.set_replace_listener([&](const std::string& path){
    replaced.push_back(path);
    f.cache.invalidate(path);
  });

  bool ok = true;
  ok &= expect(ctx, storage.ensure_directories(), "directories created");
  auto first = storage.move_into(write_file(f.root / "one.tmp", "old"), "beach.jpg");
  ok &= expect(ctx, first.has_value(), "first copy stored");
  ok &= expect(ctx, replaced.empty(), "a new name is not a replacement");
  if(!first) return false;
  ok &= expect(ctx, f.cache.get(*first) != nullptr && f.cache.contains(*first), "old contents cached");

  auto second = storage.move_into(write_file(f.root / "two.tmp", "new"), "beach.jpg");
  ok &= expect(ctx, second && *second == *first, "same path");
  ok &= expect(ctx, replaced == std::vector<std::string>({*first}), "replacement reported once");
  ok &= expect(ctx, !f.cache.contains(*first), "stale asset dropped");
  ok &= expect(ctx, f.cache.get(*first) != nullptr && f.loader->loads == 2, "reloaded on next get");

  // a preload still running when the file is replaced never lands
  auto other = storage.media_dir() / "pier.jpg";
  write_file(other, "x");
  f.loader->close_gate();
  ok &= expect(ctx, f.cache.preload(other.string()), "preload started");
  f.cache.invalidate(other.string());
  f.loader->open_gate();
  f.workers.join();
  ok &= expect(ctx, !f.cache.contains(other.string()), "in-flight result discarded");
  ok &= expect(ctx, f.cache.in_flight() == 0, "nothing in flight");
  return ok;
}

bool test_thumbnail_cache(TestContext& ctx) {
  ThumbnailCache cache(2);
  bool ok = true;
  ok &= expect(ctx, ThumbnailCache::key_for("/m/clip.mp4") == "/m/clip.mp4", "plain key is the path");
  ok &= expect(ctx, ThumbnailCache::key_for("/m/clip.mp4", 320, 180) == "/m/clip.mp4_320x180", "sized key");

  cache.put("a", "/t/a.png");
  cache.put("b", "/t/b.png");
  ok &= expect(ctx, cache.get("a").value_or("") == "/t/a.png", "hit");
  cache.put("c", "/t/c.png");
  ok &= expect(ctx, cache.size() == 2, "bounded");
  ok &= expect(ctx, !cache.get("b"), "least recently used evicted");

  cache.handle_memory_pressure(MemoryPressure::Warning);
  ok &= expect(ctx, cache.size() == 2, "warning keeps thumbnails");
  cache.handle_memory_pressure(MemoryPressure::Critical);
  ok &= expect(ctx, cache.size() == 0, "critical clears thumbnails");
  ok &= expect(ctx, ThumbnailCache().capacity() == 200, "default capacity");
  return ok;
}

// Memory ------------------------------------------------------------------

bool test_meminfo_parsing_and_levels(TestContext& ctx) {
  bool ok = true;
  auto info = parse_meminfo(meminfo_text(1000000, 400000));
  ok &= expect(ctx, info && info->total_kb == 1000000 && info->available_kb == 400000, "parsed");
  ok &= expect(ctx, !parse_meminfo("MemTotal: 100 kB\n"), "MemAvailable required");
  ok &= expect(ctx, !parse_meminfo("MemTotal: 0 kB\nMemAvailable: 0 kB\n"), "zero total rejected");

  MemInfo m{1000, 500};
  ok &= expect(ctx, classify_pressure(m, 0.85, 0.95) == MemoryPressure::Normal, "half used is normal");
  m.available_kb = 150;
  ok &= expect(ctx, classify_pressure(m, 0.85, 0.95) == MemoryPressure::Warning, "85% used is a warning");
  m.available_kb = 50;
  ok &= expect(ctx, classify_pressure(m, 0.85, 0.95) == MemoryPressure::Critical, "95% used is critical");
  return ok;
}

bool test_memory_monitor_reports_changes_only(TestContext& ctx) {
  auto dir = mediabeam::test::fresh_directory("media_meminfo");
  auto meminfo = dir / "meminfo";
  write_file(meminfo, meminfo_text(1000000, 500000));

  asio::io_context io;
  auto logger = std::make_shared<Logger>("memory-test");
  ctx.logs.attach(logger);
  MemoryPressureMonitor::Config config;
  config.poll_interval = 10ms;
  config.meminfo_path = meminfo.string();
  MemoryPressureMonitor monitor(io, config, logger);
  std::vector<MemoryPressure> seen;
  monitor.set_handler([&](MemoryPressure level){ seen.push_back(level); });

  bool ok = true;
  ok &= expect(ctx, monitor.sample() && seen.empty(), "normal start is silent");
  write_file(meminfo, meminfo_text(1000000, 100000));
  ok &= expect(ctx, monitor.sample() && monitor.sample(), "samples read");
  ok &= expect(ctx, seen == std::vector<MemoryPressure>({MemoryPressure::Warning}), "warning reported once");

  monitor.start();
  write_file(meminfo, meminfo_text(1000000, 10000));
  ok &= expect(ctx, run_io_until(io, [&]{ return seen.size() == 2; }, 1s), "timer picks up critical");
  ok &= expect(ctx, seen.size() == 2 && seen[1] == MemoryPressure::Critical, "critical reported");
  monitor.stop();

  mediabeam::test::remove_directory(dir);
  ok &= expect(ctx, !monitor.sample(), "unreadable file");
  return ok;
}

// Probe and storage -------------------------------------------------------

bool test_media_probe(TestContext& ctx) {
  auto dir = mediabeam::test::fresh_directory("media_probe");
  auto png = write_file(dir / "a.png", make_png(800, 600));
  auto jpg = write_file(dir / "b.jpg", make_jpeg(4032, 3024));
  auto mp4 = write_file(dir / "c.mp4", make_mp4(42, 3));
  auto junk = write_file(dir / "d.jpg", "not an image");

  bool ok = true;
  auto png_info = probe_image(png);
  ok &= expect(ctx, png_info && png_info->width == 800 && png_info->height == 600, "png size");
  auto jpg_info = probe_image(jpg);
  ok &= expect(ctx, jpg_info && jpg_info->width == 4032 && jpg_info->height == 3024, "jpeg size");
  ok &= expect(ctx, !probe_image(junk), "junk rejected");

  auto video = probe_video(mp4);
  ok &= expect(ctx, video && video->duration_seconds && *video->duration_seconds == 42.0, "mp4 duration");
  ok &= expect(ctx, video && video->track_count == 3, "mp4 tracks");
  ok &= expect(ctx, !probe_video(png), "png is not a video");

  ok &= expect(ctx, aspect_fit(4000, 3000, 1920, 1080) == std::make_pair<uint32_t, uint32_t>(1440, 1080),
               "landscape fits height");
  ok &= expect(ctx, aspect_fit(100, 50, 1920, 1080) == std::make_pair<uint32_t, uint32_t>(100, 50),
               "small images are not enlarged");

  ProbeAssetLoader loader;
  auto asset = loader.load(jpg);
  ok &= expect(ctx, asset && asset->kind == MediaKind::Image && asset->target_height == 1080,
               "loader fills image facts");
  ok &= expect(ctx, !loader.load((dir / "missing.png").string()), "missing file");
  mediabeam::test::remove_directory(dir);
  return ok;
}

bool test_media_storage(TestContext& ctx) {
  auto dir = mediabeam::test::fresh_directory("media_storage");
  auto logger = std::make_shared<Logger>("storage-test");
  ctx.logs.attach(logger);
  MediaStorage storage(dir / "media", logger);

  bool ok = true;
  ok &= expect(ctx, storage.ensure_directories(), "directories created");
  ok &= expect(ctx, fs::is_directory(storage.thumbnails_dir()) && fs::is_directory(storage.inbox_dir()),
               "thumbnails and inbox exist");

  auto first = storage.save_bytes("abc", MediaKind::Image);
  auto second = storage.save_bytes("abcd", MediaKind::Video);
  ok &= expect(ctx, first && second && *first != *second, "unique names");
  ok &= expect(ctx, first && fs::path(*first).extension() == ".jpg", "image extension");
  ok &= expect(ctx, second && fs::path(*second).extension() == ".mp4", "video extension");
  auto attrs = second ? storage.attributes_of_item(*second) : std::nullopt;
  ok &= expect(ctx, attrs && attrs->size == 4, "size attribute");

  auto incoming = write_file(dir / "download.tmp", "new");
  write_file(storage.media_dir() / "beach.jpg", "old");
  auto moved = storage.move_into(incoming, "beach.jpg");
  ok &= expect(ctx, moved && mediabeam::test::read_file(*moved) == "new", "move replaces existing file");
  ok &= expect(ctx, !storage.move_into((dir / "nope").string(), "x.jpg"), "missing source");

  // Spread the modification times so the ordering is well defined.
  auto now = fs::file_time_type::clock::now();
  std::vector<std::string> ordered;
  for(int i = 0; i < 4; ++i) {
    auto path = write_file(storage.media_dir() / ("item" + std::to_string(i) + ".png"), "x");
    ordered.push_back(path);
  }
  std::error_code ec;
  int step = 10;
  for(const auto& path : storage.list_media()) {
    if(std::find(ordered.begin(), ordered.end(), path) == ordered.end()) {
      fs::last_write_time(path, now - std::chrono::hours(step++), ec);
    }
  }
  for(std::size_t i = 0; i < ordered.size(); ++i) {
    fs::last_write_time(ordered[i], now - std::chrono::hours(4 - static_cast<int>(i)), ec);
  }
  write_file(storage.media_dir() / "notes.txt", "skip");

  auto listed = storage.list_media();
  ok &= expect(ctx, listed.size() == 7, "media files listed, others skipped");
  ok &= expect(ctx, !listed.empty() && listed.back() == ordered.back(), "newest last");

  ok &= expect(ctx, storage.cleanup_old(2) == 5, "old items removed");
  auto kept = storage.list_media();
  ok &= expect(ctx, kept == std::vector<std::string>({ordered[2], ordered[3]}), "two newest kept");
  ok &= expect(ctx, storage.remove_item(ordered[3]) && !storage.file_exists(ordered[3]), "remove item");
  mediabeam::test::remove_directory(dir);
  return ok;
}

// Settings ----------------------------------------------------------------

bool test_settings_validation(TestContext& ctx) {
  SettingsManager settings;
  std::string error;
  bool ok = true;
  ok &= expect(ctx, settings.get<std::string>("role") == "receiver", "receiver by default");
  ok &= expect(ctx, settings.get<int>("discovery_port") == 47800, "default discovery port");
  ok &= expect(ctx, settings.set_from_string("vt", "STREAM", error), "alias and case folded choice");
  ok &= expect(ctx, settings.get<std::string>("video_transport") == "stream", "stored lowercase");
  ok &= expect(ctx, !settings.set_from_string("role", "projector", error), "unknown choice rejected");
  ok &= expect(ctx, !settings.set_from_string("listen_port", "70000", error), "port range checked");
  ok &= expect(ctx, !settings.set_from_string("stream_chunk_size", "12", error), "chunk size floor");
  ok &= expect(ctx, !settings.set_from_string("retry_max", "many", error), "integer parse error");
  ok &= expect(ctx, !settings.set_from_string("no_such_setting", "1", error), "unknown key");

  ok &= expect(ctx, settings.set_from_string("mwr", "0.97", error), "ratio accepted");
  bool threw = false;
  try {
    settings.validate();
  } catch(const std::runtime_error&) {
    threw = true;
  }
  ok &= expect(ctx, threw, "warning above critical rejected");

  auto dir = mediabeam::test::fresh_directory("media_settings");
  settings.set_from_string("mwr", "0.8", error);
  settings.set_from_string("help", "true", error);
  ok &= expect(ctx, settings.save_to_file(dir / "settings.json"), "saved");
  SettingsManager reloaded;
  ok &= expect(ctx, reloaded.load_from_file(dir / "settings.json"), "loaded");
  ok &= expect(ctx, reloaded.get<std::string>("video_transport") == "stream", "persistent value restored");
  ok &= expect(ctx, !reloaded.help_requested(), "help is not persisted");
  mediabeam::test::remove_directory(dir);
  return ok;
}

bool test_command_line_parsing(TestContext& ctx) {
  SettingsManager settings;
  CommandLineParser parser;
  std::vector<std::string> raw{"mediabeam", "sender", "-vt", "stream", "--discovery_port", "5000",
                               "-v", "a.jpg", "b.mp4"};
  std::vector<char*> argv;
  for(auto& s : raw) argv.push_back(arg(s));

  bool ok = true;
  auto files = parser.parse(static_cast<int>(argv.size()), argv.data(), settings);
  ok &= expect(ctx, settings.get<std::string>("role") == "sender", "role from the first positional");
  ok &= expect(ctx, settings.get<std::string>("video_transport") == "stream", "short alias");
  ok &= expect(ctx, settings.get<int>("discovery_port") == 5000, "long option");
  ok &= expect(ctx, settings.get<bool>("verbose"), "bool flag without value");
  ok &= expect(ctx, files == std::vector<std::string>({"a.jpg", "b.mp4"}), "remaining positionals are files");

  auto rejects = [&](std::vector<std::string> tokens){
    std::vector<char*> bad;
    for(auto& s : tokens) bad.push_back(arg(s));
    SettingsManager scratch;
    try {
      parser.parse(static_cast<int>(bad.size()), bad.data(), scratch);
    } catch(const std::runtime_error&) {
      return true;
    }
    return false;
  };
  ok &= expect(ctx, rejects({"mediabeam", "--bogus", "1"}), "unknown long option");
  ok &= expect(ctx, rejects({"mediabeam", "--listen_port"}), "missing value");
  ok &= expect(ctx, rejects({"mediabeam", "tv"}), "invalid role");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"unlocked_items_go_straight_to_library", test_unlocked_items_go_straight_to_library},
    {"scenario_move_mode_queue_drains_on_exit", test_scenario_move_mode_queue_drains_on_exit},
    {"drain_is_exactly_once_in_order", test_drain_is_exactly_once_in_order},
    {"modal_close_drains_after_delay", test_modal_close_drains_after_delay},
    {"modal_close_keeps_arrival_order", test_modal_close_keeps_arrival_order},
    {"modal_reopen_cancels_drain", test_modal_reopen_cancels_drain},
    {"move_mode_exit_with_modal_open_waits", test_move_mode_exit_with_modal_open_waits},
    {"library_operations", test_library_operations},
    {"asset_cache_bounded_lru", test_asset_cache_bounded_lru},
    {"asset_cache_preload_on_workers", test_asset_cache_preload_on_workers},
    {"asset_cache_memory_pressure", test_asset_cache_memory_pressure},
    {"asset_cache_critical_discards_inflight", test_asset_cache_critical_discards_inflight},
    {"replaced_media_drops_cached_asset", test_replaced_media_drops_cached_asset},
    {"thumbnail_cache", test_thumbnail_cache},
    {"meminfo_parsing_and_levels", test_meminfo_parsing_and_levels},
    {"memory_monitor_reports_changes_only", test_memory_monitor_reports_changes_only},
    {"media_probe", test_media_probe},
    {"media_storage", test_media_storage},
    {"settings_validation", test_settings_validation},
    {"command_line_parsing", test_command_line_parsing},
  };
  return mediabeam::test::run_suite("media", "MEDIA", std::move(tests), argc, argv);
}
