#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace evo {

class VersionControl;

struct ManifestOptions {
  // Project-relative paths skipped entirely; .git is always skipped.
  std::vector<std::string> excludes;
  size_t history_lines = 10;
  size_t max_files = 5000;
};

struct ManifestEntry {
  std::string path;
  uintmax_t size = 0;
  std::string hash;
};

std::vector<ManifestEntry> collect_manifest_entries(const std::filesystem::path& root, const ManifestOptions& options);

// Markdown summary: HEAD revision, sorted file list with size and content
// hash, and recent history when `vcs` is given.
std::string render_manifest(const std::filesystem::path& root, VersionControl* vcs, const ManifestOptions& options);

} // namespace evo
