#pragma once

#include <cstddef>
#include <string>

#include "media_error.hpp"
#include "media_types.hpp"
#include "transport.hpp"

// Callbacks into the UI collaborator. Components hold a non-owning pointer
// and call it from the coordinating context only.
class EventDelegate {
public:
  virtual ~EventDelegate() = default;

  virtual void on_peer_found(const Peer&) {}
  virtual void on_peer_lost(const Peer&) {}
  virtual void on_connection_state_changed(const Peer&, bool /*connected*/) {}

  // Non-decreasing while the send runs; a failed send ends with one 0% tick
  // right before on_transfer_failed.
  virtual void on_transfer_progress(MediaKind, double /*percent*/) {}
  // Fired once the settle delay after 100% has elapsed; hide transfer UI.
  virtual void on_transfer_settled(MediaKind) {}
  virtual void on_transfer_failed(MediaKind, const MediaError&) {}
  virtual void on_delivery_confirmed(const Peer&) {}

  // The item is stored on disk. It is not in the library yet: either the
  // library change listener fires next, or on_media_queued follows when the
  // consumer is locked. Insert items from the library, not from here.
  virtual void on_media_received(const std::string& /*path*/, MediaKind) {}
  // Received while the consumer was locked; it will be added on drain.
  virtual void on_media_queued(const std::string& /*path*/, MediaKind) {}
  virtual void on_queue_drained(std::size_t /*count*/, std::size_t /*current_index*/) {}

  virtual void on_move_mode_state_changed(bool /*enabled*/) {}
  virtual void on_error(const MediaError&) {}
};
