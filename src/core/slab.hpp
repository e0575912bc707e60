#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ferry {

// Index-addressed collection with slot reuse. Keys are small integers that
// stay valid until the entry is removed; a freed key is handed out again by a
// later insert.
template <typename T>
class Slab {
 public:
  // Key the next insert() will use
  std::size_t vacant_key() const {
    return free_.empty() ? entries_.size() : free_.back();
  }

  std::size_t insert(T value) {
    std::size_t key = vacant_key();
    if (free_.empty()) {
      entries_.emplace_back(std::move(value));
    } else {
      free_.pop_back();
      entries_[key].emplace(std::move(value));
    }
    ++len_;
    return key;
  }

  bool contains(std::size_t key) const {
    return key < entries_.size() && entries_[key].has_value();
  }

  T* get(std::size_t key) {
    return contains(key) ? &*entries_[key] : nullptr;
  }

  const T* get(std::size_t key) const {
    return contains(key) ? &*entries_[key] : nullptr;
  }

  T remove(std::size_t key) {
    if (!contains(key)) {
      throw std::out_of_range("slab: no entry for key " + std::to_string(key));
    }
    T value = std::move(*entries_[key]);
    entries_[key].reset();
    free_.push_back(key);
    --len_;
    return value;
  }

  void clear() {
    entries_.clear();
    free_.clear();
    len_ = 0;
  }

  std::size_t size() const {
    return len_;
  }

  bool empty() const {
    return len_ == 0;
  }

  template <typename F>
  void for_each(F&& fn) {
    for (std::size_t key = 0; key < entries_.size(); ++key) {
      if (entries_[key]) {
        fn(key, *entries_[key]);
      }
    }
  }

 private:
  std::vector<std::optional<T>> entries_;
  std::vector<std::size_t> free_;
  std::size_t len_ = 0;
};

}  // namespace ferry
