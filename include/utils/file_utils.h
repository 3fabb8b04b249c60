#ifndef FILE_UTILS_H
#define FILE_UTILS_H

#include <string>
#include <vector>

namespace FileUtils {

struct ManifestEntry {
  std::string filePath;
  // Empty when the manifest leaves the dialect to the caller.
  std::string dialect;
};

// Whole file as UTF-8 text with a leading byte-order mark removed. Throws
// std::runtime_error when the path is missing, not a regular file or
// unreadable.
std::string readTextFile(const std::string &path);

// Regular files under dir whose file name matches the glob pattern, sorted.
// Throws std::invalid_argument when dir is not a directory.
std::vector<std::string> listFiles(const std::string &dir,
                                   const std::string &pattern = "*.sql",
                                   bool recursive = false);

// file_path,dialect CSV with a header row. Relative paths are resolved
// against the manifest's directory; rows with an empty file_path are skipped.
std::vector<ManifestEntry> readManifest(const std::string &path);

std::vector<std::string> splitCsvLine(const std::string &line);

std::string absolutePath(const std::string &path);
std::string fileName(const std::string &path);

} // namespace FileUtils

#endif
