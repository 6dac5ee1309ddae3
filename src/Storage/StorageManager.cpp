#include "StorageManager.hpp"

#include <cctype>
#include <filesystem>
#include <system_error>

#include "logger.hpp"

namespace fs = std::filesystem;

namespace dlqueue {

namespace {

bool isTrimChar(char c) {
  return c == '_' || c == '.' || c == '-' || c == ' ';
}

std::string trimEdges(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && isTrimChar(s[begin])) ++begin;
  while (end > begin && isTrimChar(s[end - 1])) --end;
  return s.substr(begin, end - begin);
}

std::string trimWhitespace(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(begin, end - begin);
}

}  // namespace

StorageManager::StorageManager(const std::string& defaultDownloadDir) {
  std::error_code ec;
  fs::path dir = fs::absolute(defaultDownloadDir, ec);
  defaultDownloadDir_ = ec ? defaultDownloadDir : dir.lexically_normal().string();

  fs::create_directories(defaultDownloadDir_, ec);
  if (ec) {
    LOG(WARN) << "Could not create default download directory '"
              << defaultDownloadDir_ << "': " << ec.message();
  }
}

uint64_t StorageManager::freeSpace(const std::optional<std::string>& path) const {
  std::error_code ec;
  fs::path check = path ? fs::path(*path) : fs::path(defaultDownloadDir_);
  if (fs::is_regular_file(check, ec)) {
    check = check.parent_path();
  }
  if (check.empty()) {
    check = fs::current_path(ec);
  }

  if (!fs::is_directory(check, ec)) {
    if (check == fs::path(defaultDownloadDir_)) {
      fs::create_directories(check, ec);
    } else {
      LOG(ERROR) << "Path '" << check.string()
                 << "' for free space check does not exist or is not a "
                    "directory.";
      return 0;
    }
  }

  const fs::space_info info = fs::space(check, ec);
  if (ec) {
    LOG(ERROR) << "Error getting free space for '" << check.string()
               << "': " << ec.message();
    return 0;
  }
  return static_cast<uint64_t>(info.available);
}

uint64_t StorageManager::fileSize(const std::string& filepath) const {
  std::error_code ec;
  if (!fs::is_regular_file(filepath, ec)) {
    return 0;
  }
  const auto size = fs::file_size(filepath, ec);
  if (ec) {
    LOG(ERROR) << "Error getting size for file " << filepath << ": "
               << ec.message();
    return 0;
  }
  return static_cast<uint64_t>(size);
}

bool StorageManager::deleteFile(const std::string& filepath) const {
  std::error_code ec;
  if (!fs::is_regular_file(filepath, ec)) {
    return false;
  }
  if (!fs::remove(filepath, ec) || ec) {
    LOG(ERROR) << "Error deleting file " << filepath << ": " << ec.message();
    return false;
  }
  LOG(INFO) << "File " << filepath << " deleted.";
  return true;
}

std::string StorageManager::suggestFilepath(
    const std::string& url, const std::optional<std::string>& filename,
    const std::optional<std::string>& directory) const {
  std::string targetDir =
      directory && !directory->empty() ? *directory : defaultDownloadDir_;

  std::error_code ec;
  fs::create_directories(targetDir, ec);
  if (ec) {
    LOG(WARN) << "Could not create target directory '" << targetDir
              << "', using default. Error: " << ec.message();
    targetDir = defaultDownloadDir_;
    fs::create_directories(targetDir, ec);
  }

  std::string name = filename && !filename->empty() ? *filename
                                                    : filenameFromUrl(url);
  return (fs::path(targetDir) / sanitizeFilename(name)).string();
}

bool StorageManager::cleanupIncompleteDownload(const std::string& filepath) const {
  LOG(INFO) << "Cleaning up incomplete download: " << filepath;
  return deleteFile(filepath);
}

bool StorageManager::ensureDirectoryExists(const std::string& directoryPath) const {
  if (directoryPath.empty()) return false;
  std::error_code ec;
  fs::create_directories(directoryPath, ec);
  if (ec) {
    LOG(ERROR) << "Error creating directory " << directoryPath << ": "
               << ec.message();
    return false;
  }
  return fs::is_directory(directoryPath, ec);
}

std::string StorageManager::sanitizeFilename(const std::string& filename) {
  std::string out;
  out.reserve(filename.size());
  for (char c : filename) {
    const bool keep = std::isalnum(static_cast<unsigned char>(c)) ||
                      c == '.' || c == '_' || c == '-';
    out.push_back(keep ? c : '_');
  }
  out = trimEdges(out);
  if (out.empty()) {
    return kSanitizedFallback;
  }

  if (out.size() > kMaxFilenameLength) {
    const size_t dot = out.rfind('.');
    const std::string ext =
        (dot != std::string::npos && dot > 0) ? out.substr(dot) : std::string();
    if (!ext.empty() && ext.size() + 1 < kMaxFilenameLength) {
      out = out.substr(0, kMaxFilenameLength - ext.size() - 1) + ext;
    } else {
      out = out.substr(0, kMaxFilenameLength);
    }
    // 截断后可能在边缘留下 '_' '.' '-'
    out = trimEdges(out);
    if (out.empty()) {
      return kSanitizedFallback;
    }
  }
  return out;
}

std::string StorageManager::filenameFromUrl(const std::string& url) {
  std::string path = url.substr(0, url.find_first_of("?#"));
  const size_t slash = path.rfind('/');
  std::string last = slash == std::string::npos ? path : path.substr(slash + 1);
  last = trimWhitespace(last);
  if (last.empty() || last.back() == '.') {
    return kDefaultFilename;
  }
  return last;
}

}  // namespace dlqueue
