#ifndef DLQUEUE_MANIFEST_LOADER_HPP_
#define DLQUEUE_MANIFEST_LOADER_HPP_

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace dlqueue {

class StorageManager;

struct DownloadRequest {
  std::string url;
  std::optional<std::string> filename;
  int priority = 0;
  std::string destination;  // filled by resolveDestinations()
  size_t line = 0;
};

// Batch input for the command line front end. One request per line:
//
//   <url> [<filename>|-] [<priority>]
//
// Blank lines and lines starting with '#' are ignored; a '-' filename means
// "derive it from the URL".
class ManifestLoader {
 public:
  explicit ManifestLoader(const StorageManager& storage,
                          std::optional<std::string> directory = std::nullopt);

  static std::vector<DownloadRequest> parse(std::istream& in);

  // Reads and resolves a manifest file. Throws std::runtime_error if the
  // file cannot be opened.
  std::vector<DownloadRequest> load(const std::string& path) const;

  // Fills in `destination` for every request. Name sanitizing and directory
  // creation run in parallel on the "resolve" TBB arena.
  void resolveDestinations(std::vector<DownloadRequest>& requests) const;

 private:
  const StorageManager& storage_;
  std::optional<std::string> directory_;
};

}  // namespace dlqueue

#endif  // DLQUEUE_MANIFEST_LOADER_HPP_
