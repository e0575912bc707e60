#include "ferry/net/headers.hpp"

#include <algorithm>
#include <cctype>

namespace ferry {

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

void Headers::set(std::string name, std::string value) {
  remove(name);
  append(std::move(name), std::move(value));
}

void Headers::remove(std::string_view name) {
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return iequals(e.first, name); }), entries_.end());
}

std::optional<std::string> Headers::get(std::string_view name) const {
  for (const auto &[key, value] : entries_) {
    if (iequals(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

std::vector<std::string> Headers::get_all(std::string_view name) const {
  std::vector<std::string> values;
  for (const auto &[key, value] : entries_) {
    if (iequals(key, name)) {
      values.push_back(value);
    }
  }
  return values;
}

}  // namespace ferry
