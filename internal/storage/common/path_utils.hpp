#pragma once

#include <stdexcept>
#include <string>

namespace circulate::storage::common {

/*
  Object keys are relative '/'-separated paths below the store root.
*/
inline void ValidateObjectKey(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("object key must not be empty");
  }
  if (key.front() == '/' || key.back() == '/') {
    throw std::invalid_argument("object key must not start or end with '/'");
  }

  std::size_t start = 0;
  while (start <= key.size()) {
    auto end = key.find('/', start);
    if (end == std::string::npos) end = key.size();

    const auto segment = key.substr(start, end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      throw std::invalid_argument("object key contains an invalid path segment: " + key);
    }
    start = end + 1;
  }

  for (char c : key) {
    if (c == '\\' || c == '\0') {
      throw std::invalid_argument("object key contains invalid character");
    }
  }
}

inline std::string JoinPath(const std::string& root, const std::string& relative) {
  if (root.empty()) return relative;
  if (root.back() == '/') return root + relative;
  return root + "/" + relative;
}

inline std::string ParentPath(const std::string& path) {
  auto slash = path.find_last_of('/');
  if (slash == std::string::npos) return {};
  return path.substr(0, slash);
}

} // namespace circulate::storage::common
