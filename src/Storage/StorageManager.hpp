#ifndef DLQUEUE_STORAGE_MANAGER_HPP_
#define DLQUEUE_STORAGE_MANAGER_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace dlqueue {

// Filesystem side of a download: where files go, what they are called, and
// removing partial output. Stateless apart from the default directory, so a
// single instance is shared by every worker thread.
class StorageManager {
 public:
  static constexpr size_t kMaxFilenameLength = 200;
  static constexpr const char* kDefaultFilename = "downloaded_file";
  static constexpr const char* kSanitizedFallback = "sanitized_download_file";

  explicit StorageManager(const std::string& defaultDownloadDir = "downloads");

  const std::string& defaultDownloadDir() const { return defaultDownloadDir_; }

  // Free bytes on the filesystem holding `path` (or the default directory).
  // A file path is resolved to its parent. Returns 0 on any error.
  uint64_t freeSpace(const std::optional<std::string>& path = std::nullopt) const;

  // Size of a regular file, 0 if it is missing or not a regular file.
  uint64_t fileSize(const std::string& filepath) const;

  // Deletes `filepath` if it exists and is a regular file.
  bool deleteFile(const std::string& filepath) const;

  // Builds a path for the download of `url`. The filename comes from
  // `filename` or, when absent, the last path segment of the URL.
  std::string suggestFilepath(
      const std::string& url,
      const std::optional<std::string>& filename = std::nullopt,
      const std::optional<std::string>& directory = std::nullopt) const;

  // Removes partial output of a failed or cancelled transfer.
  bool cleanupIncompleteDownload(const std::string& filepath) const;

  bool ensureDirectoryExists(const std::string& directoryPath) const;

  // Keeps [A-Za-z0-9._-], replaces anything else with '_', trims leading and
  // trailing '_', '.', '-' and spaces, and bounds the length while keeping
  // the extension. sanitizeFilename(sanitizeFilename(x)) == sanitizeFilename(x).
  static std::string sanitizeFilename(const std::string& filename);

  static std::string filenameFromUrl(const std::string& url);

 private:
  std::string defaultDownloadDir_;
};

}  // namespace dlqueue

#endif  // DLQUEUE_STORAGE_MANAGER_HPP_
