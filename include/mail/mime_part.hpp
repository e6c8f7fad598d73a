#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mailchunk {
namespace mail {

// One structural unit of a message as produced by the MIME analyzer.
// Offsets are absolute positions in the message byte stream.
struct Part {
  // Dotted position in the MIME tree, "1" for the top level part
  std::string node;
  std::map<std::string, std::vector<std::string>> headers;
  std::size_t starting_pos{0};
  // 0 while the end of the header block has not been seen yet
  std::size_t starting_pos_body{0};

  // First value of a header, or an empty string
  std::string header(const std::string& name) const {
    auto it = headers.find(name);
    if (it == headers.end() || it->second.empty()) {
      return "";
    }
    return it->second.front();
  }

  // Media type without parameters, "text/plain" when absent
  std::string content_type() const {
    std::string value = header("Content-Type");
    auto semi = value.find(';');
    if (semi != std::string::npos) {
      value.erase(semi);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
      value.pop_back();
    }
    return value.empty() ? "text/plain" : value;
  }
};

using PartPtr = std::shared_ptr<Part>;
// The analyzer appends to this list while the message streams in
using PartList = std::vector<PartPtr>;
using PartListPtr = std::shared_ptr<PartList>;

} // namespace mail
} // namespace mailchunk
