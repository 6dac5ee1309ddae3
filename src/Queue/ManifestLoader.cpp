#include "ManifestLoader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "Storage/StorageManager.hpp"
#include "logger.hpp"
#include "tbb_manager.hpp"

namespace dlqueue {

ManifestLoader::ManifestLoader(const StorageManager& storage,
                               std::optional<std::string> directory)
    : storage_(storage), directory_(std::move(directory)) {}

std::vector<DownloadRequest> ManifestLoader::parse(std::istream& in) {
  std::vector<DownloadRequest> requests;
  std::string raw;
  size_t lineNo = 0;
  while (std::getline(in, raw)) {
    ++lineNo;
    std::istringstream fields(raw);
    std::vector<std::string> tokens;
    std::string token;
    while (fields >> token) {
      tokens.push_back(token);
    }
    if (tokens.empty() || tokens[0][0] == '#') {
      continue;
    }
    if (tokens.size() > 3) {
      LOG(WARN) << "Manifest line " << lineNo << ": too many fields, skipped.";
      continue;
    }

    DownloadRequest request;
    request.url = tokens[0];
    request.line = lineNo;
    if (tokens.size() >= 2 && tokens[1] != "-") {
      request.filename = tokens[1];
    }
    if (tokens.size() == 3) {
      size_t used = 0;
      try {
        request.priority = std::stoi(tokens[2], &used);
      } catch (const std::exception&) {
        used = 0;
      }
      if (used != tokens[2].size()) {
        LOG(WARN) << "Manifest line " << lineNo << ": bad priority '"
                  << tokens[2] << "', skipped.";
        continue;
      }
    }
    requests.push_back(std::move(request));
  }
  return requests;
}

std::vector<DownloadRequest> ManifestLoader::load(const std::string& path) const {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open manifest: " + path);
  }
  std::vector<DownloadRequest> requests = parse(in);
  resolveDestinations(requests);
  LOG(INFO) << "Loaded " << requests.size() << " request(s) from " << path;
  return requests;
}

void ManifestLoader::resolveDestinations(
    std::vector<DownloadRequest>& requests) const {
  const uint64_t failures = utils::TBBManager::GetInstance().ParallelFor<size_t>(
      "resolve", 0, requests.size(), [this, &requests](size_t i) {
        DownloadRequest& request = requests[i];
        request.destination =
            storage_.suggestFilepath(request.url, request.filename, directory_);
      });
  if (failures > 0) {
    LOG(WARN) << failures << " destination(s) could not be resolved.";
  }
}

}  // namespace dlqueue
