#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry {

// Ordered multi-map of HTTP header fields with case-insensitive lookup
class Headers {
 public:
  using Entry = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Entry>::const_iterator;

  Headers() = default;
  Headers(std::initializer_list<Entry> entries) : entries_(entries) {}

  void append(std::string name, std::string value) {
    entries_.emplace_back(std::move(name), std::move(value));
  }

  // Replace every existing value of `name`
  void set(std::string name, std::string value);

  void remove(std::string_view name);

  // First value of `name`
  std::optional<std::string> get(std::string_view name) const;

  std::vector<std::string> get_all(std::string_view name) const;

  bool contains(std::string_view name) const {
    return get(name).has_value();
  }

  void clear() {
    entries_.clear();
  }

  std::size_t size() const {
    return entries_.size();
  }

  bool empty() const {
    return entries_.empty();
  }

  const_iterator begin() const {
    return entries_.begin();
  }

  const_iterator end() const {
    return entries_.end();
  }

 private:
  std::vector<Entry> entries_;
};

bool iequals(std::string_view a, std::string_view b);

}  // namespace ferry
