#include "utils/file_utils.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <filesystem>
#include <fnmatch.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace FileUtils {

namespace {

bool matches(const std::string &pattern, const std::string &name) {
  return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

} // namespace

std::string readTextFile(const std::string &path) {
  std::error_code ec;
  if (!fs::exists(path, ec))
    throw std::runtime_error("SQL file not found: " + path);
  if (!fs::is_regular_file(path, ec))
    throw std::runtime_error("Path is not a file: " + path);

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    throw std::runtime_error("Cannot read file " + path);

  std::ostringstream buffer;
  buffer << file.rdbuf();
  std::string content = buffer.str();
  if (StringUtils::startsWith(content, "\xEF\xBB\xBF"))
    content.erase(0, 3);
  return content;
}

std::vector<std::string> listFiles(const std::string &dir,
                                   const std::string &pattern, bool recursive) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    throw std::invalid_argument("Not a directory: " + dir);

  std::vector<std::string> files;
  auto consider = [&](const fs::directory_entry &entry) {
    if (entry.is_regular_file() &&
        matches(pattern, entry.path().filename().string()))
      files.push_back(entry.path().string());
  };
  if (recursive) {
    for (const auto &entry : fs::recursive_directory_iterator(dir))
      consider(entry);
  } else {
    for (const auto &entry : fs::directory_iterator(dir))
      consider(entry);
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::vector<std::string> splitCsvLine(const std::string &line) {
  std::vector<std::string> fields;
  std::string field;
  bool inQuotes = false;

  for (size_t i = 0; i < line.length(); ++i) {
    char c = line[i];
    if (c == '"') {
      if (inQuotes && i + 1 < line.length() && line[i + 1] == '"') {
        field += '"';
        ++i;
      } else {
        inQuotes = !inQuotes;
      }
    } else if (c == ',' && !inQuotes) {
      fields.push_back(StringUtils::trim(field));
      field.clear();
    } else {
      field += c;
    }
  }
  fields.push_back(StringUtils::trim(field));
  return fields;
}

std::vector<ManifestEntry> readManifest(const std::string &path) {
  std::error_code ec;
  if (!fs::exists(path, ec))
    throw std::runtime_error("Manifest file not found: " + path);

  std::istringstream stream(readTextFile(path));
  std::string line;
  std::vector<std::string> headers;
  while (headers.empty() && std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (!StringUtils::trim(line).empty())
      headers = splitCsvLine(line);
  }

  auto column = [&](const std::string &name) {
    auto it = std::find(headers.begin(), headers.end(), name);
    return it == headers.end() ? headers.size()
                               : static_cast<size_t>(it - headers.begin());
  };
  const size_t pathColumn = column("file_path");
  const size_t dialectColumn = column("dialect");
  if (pathColumn == headers.size())
    throw std::invalid_argument("Manifest CSV must have a 'file_path' column");

  fs::path baseDir = fs::path(path).parent_path();
  std::vector<ManifestEntry> entries;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    std::vector<std::string> fields = splitCsvLine(line);
    if (pathColumn >= fields.size() || fields[pathColumn].empty())
      continue;

    ManifestEntry entry;
    fs::path filePath(fields[pathColumn]);
    if (filePath.is_relative())
      filePath = baseDir / filePath;
    entry.filePath = absolutePath(filePath.string());
    if (dialectColumn < fields.size())
      entry.dialect = fields[dialectColumn];
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::string absolutePath(const std::string &path) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(fs::absolute(path), ec);
  if (ec)
    return fs::absolute(path).lexically_normal().string();
  return resolved.string();
}

std::string fileName(const std::string &path) {
  return fs::path(path).filename().string();
}

} // namespace FileUtils
