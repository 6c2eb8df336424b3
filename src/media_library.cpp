#include "media_library.hpp"

#include <algorithm>

bool MediaLibrary::append(const std::string& path) {
  if(path.empty() || contains(path)) return false;
  items_.push_back(path);
  return true;
}

bool MediaLibrary::add(const std::string& path) {
  if(!append(path)) return false;
  notify();
  return true;
}

std::size_t MediaLibrary::add_batch(const std::vector<std::string>& paths) {
  std::size_t added = 0;
  for(const auto& path : paths) {
    if(append(path)) ++added;
  }
  if(added) notify();
  return added;
}

bool MediaLibrary::remove(const std::string& path) {
  auto it = std::find(items_.begin(), items_.end(), path);
  if(it == items_.end()) return false;
  auto index = static_cast<std::size_t>(it - items_.begin());
  items_.erase(it);
  if(index < current_ || current_ >= items_.size()) {
    current_ = current_ > 0 ? current_ - 1 : 0;
  }
  notify();
  return true;
}

bool MediaLibrary::move(std::size_t from, std::size_t to) {
  if(from >= items_.size() || to >= items_.size()) return false;
  if(from == to) return true;
  std::string selected = items_[current_];
  std::string item = std::move(items_[from]);
  items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(from));
  items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(to), std::move(item));
  auto it = std::find(items_.begin(), items_.end(), selected);
  current_ = static_cast<std::size_t>(it - items_.begin());
  notify();
  return true;
}

void MediaLibrary::clear() {
  if(items_.empty()) return;
  items_.clear();
  current_ = 0;
  notify();
}

bool MediaLibrary::contains(const std::string& path) const {
  return std::find(items_.begin(), items_.end(), path) != items_.end();
}

std::size_t MediaLibrary::count(const std::string& path) const {
  return static_cast<std::size_t>(std::count(items_.begin(), items_.end(), path));
}

const std::string* MediaLibrary::current() const {
  if(items_.empty()) return nullptr;
  return &items_[current_];
}

bool MediaLibrary::select(std::size_t index) {
  if(index >= items_.size()) return false;
  if(current_ == index) return true;
  current_ = index;
  notify();
  return true;
}

bool MediaLibrary::select_last() {
  if(items_.empty()) return false;
  return select(items_.size() - 1);
}

bool MediaLibrary::next() {
  if(current_ + 1 >= items_.size()) return false;
  return select(current_ + 1);
}

bool MediaLibrary::previous() {
  if(current_ == 0 || items_.empty()) return false;
  return select(current_ - 1);
}

void MediaLibrary::notify() {
  if(listener_) listener_(*this);
}
