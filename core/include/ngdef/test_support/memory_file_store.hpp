// ngdef/test_support/memory_file_store.hpp - In-memory FileStore for tests
//
// Records every path read so tests can assert lookup order.
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ngdef/vfs/file_store.hpp"

namespace ngdef::test_support
{

class MemoryFileStore final : public FileStore
{
public:
  void put(std::string path, std::string contents)
  {
    files_[std::move(path)] = std::move(contents);
  }

  [[nodiscard]] std::optional<std::string> read(const std::string & path) const override
  {
    reads_.push_back(path);
    const auto it = files_.find(path);
    if (it == files_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  [[nodiscard]] const std::vector<std::string> & reads() const noexcept { return reads_; }

private:
  std::map<std::string, std::string> files_;
  mutable std::vector<std::string> reads_;
};

/// Frame a JSON body the way a client would.
[[nodiscard]] inline std::string framed(const std::string & body)
{
  return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

}  // namespace ngdef::test_support
