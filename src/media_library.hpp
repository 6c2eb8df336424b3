#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

// Ordered collection of media paths with a current position. Paths are
// unique; adding a path that is already present is ignored.
class MediaLibrary {
public:
  using ChangeListener = std::function<void(const MediaLibrary&)>;

  void set_change_listener(ChangeListener listener) { listener_ = std::move(listener); }

  bool add(const std::string& path);
  // Returns how many of the paths were new.
  std::size_t add_batch(const std::vector<std::string>& paths);
  bool remove(const std::string& path);
  bool move(std::size_t from, std::size_t to);
  void clear();

  bool contains(const std::string& path) const;
  std::size_t count(const std::string& path) const;
  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  const std::vector<std::string>& items() const { return items_; }

  std::size_t current_index() const { return current_; }
  const std::string* current() const;
  bool select(std::size_t index);
  bool select_last();
  bool next();
  bool previous();

private:
  void notify();
  bool append(const std::string& path);

  std::vector<std::string> items_;
  std::size_t current_ = 0;
  ChangeListener listener_;
};
