/**
 * @file path_resolver.cpp
 * @brief Output path resolution implementation
 */

#include "transcode_queue/path_resolver.hpp"

#include <filesystem>

#include <fmt/core.h>

namespace transcode_queue {

namespace fs = std::filesystem;

namespace {

bool is_illegal_char(unsigned char c) {
  if (c < 0x20)
    return true;
  switch (c) {
  case '<':
  case '>':
  case ':':
  case '"':
  case '/':
  case '\\':
  case '|':
  case '?':
  case '*':
    return true;
  default:
    return false;
  }
}

/// Largest cut <= limit that does not split a UTF-8 sequence
size_t utf8_cut(const std::string &s, size_t limit) {
  if (limit >= s.size())
    return s.size();
  size_t cut = limit;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80)
    --cut;
  return cut;
}

bool path_exists(const fs::path &p) {
  std::error_code ec;
  return fs::exists(p, ec);
}

} // anonymous namespace

std::string sanitize_filename(const std::string &filename) {
  std::string sanitized = filename;
  for (auto &c : sanitized) {
    if (is_illegal_char(static_cast<unsigned char>(c)))
      c = '_';
  }

  /// Strip leading/trailing whitespace and dots
  size_t first = sanitized.find_first_not_of(". ");
  if (first == std::string::npos) {
    sanitized.clear();
  } else {
    size_t last = sanitized.find_last_not_of(". ");
    sanitized = sanitized.substr(first, last - first + 1);
  }

  if (sanitized.empty()) {
    sanitized = "converted_file";
  }

  if (sanitized.size() > MAX_FILENAME_LENGTH) {
    fs::path as_path(sanitized);
    std::string ext = as_path.extension().string();
    if (ext.size() >= MAX_FILENAME_LENGTH) {
      ext.clear();
    }
    std::string stem = sanitized.substr(0, sanitized.size() - ext.size());
    stem.resize(utf8_cut(stem, MAX_FILENAME_LENGTH - ext.size()));
    sanitized = stem + ext;
  }

  return sanitized;
}

std::string unique_filename(const std::string &directory,
                            const std::string &base_name,
                            const std::string &extension) {
  std::string base = sanitize_filename(base_name);
  fs::path dir(directory);

  fs::path candidate = dir / (base + extension);
  if (!path_exists(candidate)) {
    return candidate.string();
  }

  for (int counter = 1; counter <= MAX_UNIQUE_SUFFIX; ++counter) {
    candidate = dir / fmt::format("{} ({}){}", base, counter, extension);
    if (!path_exists(candidate)) {
      return candidate.string();
    }
  }

  throw PathExhaustionError(
      fmt::format("Could not generate unique filename for {}", base));
}

ResolvedPath resolve_output_path(const std::string &desired_path,
                                 OverwritePolicy policy) {
  fs::path desired(desired_path);
  fs::path sanitized =
      desired.parent_path() / sanitize_filename(desired.filename().string());

  switch (policy) {
  case OverwritePolicy::SKIP:
    return {sanitized.string(), path_exists(sanitized)};

  case OverwritePolicy::REPLACE:
    return {sanitized.string(), false};

  case OverwritePolicy::UNIQUE:
    if (!path_exists(sanitized)) {
      return {sanitized.string(), false};
    }
    return {unique_filename(sanitized.parent_path().string(),
                            sanitized.stem().string(),
                            sanitized.extension().string()),
            false};
  }

  return {sanitized.string(), false};
}

} // namespace transcode_queue
