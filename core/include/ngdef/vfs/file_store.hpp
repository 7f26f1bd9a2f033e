// ngdef/vfs/file_store.hpp - File access used by the definition resolver
//
// The resolver never touches the filesystem directly; it reads through a
// FileStore keyed by local paths. Nothing is cached between calls.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ngdef
{

class FileStore
{
public:
  virtual ~FileStore() = default;

  /// Whole file contents, or nullopt if the file is missing or unreadable.
  [[nodiscard]] virtual std::optional<std::string> read(const std::string & path) const = 0;
};

/// Reads from the local filesystem.
class DiskFileStore final : public FileStore
{
public:
  [[nodiscard]] std::optional<std::string> read(const std::string & path) const override;
};

/**
 * Map a `file://` URI to a local path.
 *
 * The literal `file://` prefix is stripped and percent escapes are decoded.
 * Other schemes and `file://host/...` authorities return nullopt.
 */
[[nodiscard]] std::optional<std::string> file_uri_to_path(std::string_view uri);

/// Inverse of file_uri_to_path for absolute paths.
[[nodiscard]] std::string path_to_file_uri(std::string_view path);

/// Scheme part of a URI (text before the first ':'), empty if none.
[[nodiscard]] std::string_view uri_scheme(std::string_view uri) noexcept;

}  // namespace ngdef
