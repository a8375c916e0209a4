#include "evo/manifest.h"

#include "evo/data_io.h"
#include "evo/log.h"
#include "evo/vcs.h"

#include <algorithm>
#include <sstream>

namespace evo {
namespace fs = std::filesystem;

namespace {
bool under_any(const fs::path& rel, const std::vector<fs::path>& excludes) {
  for (const auto& ex : excludes) {
    auto r = rel.begin();
    auto e = ex.begin();
    for (; r != rel.end() && e != ex.end(); ++r, ++e) {
      if (*r != *e) break;
    }
    if (e == ex.end()) return true;
  }
  return false;
}
} // namespace

std::vector<ManifestEntry> collect_manifest_entries(const fs::path& root, const ManifestOptions& options) {
  std::vector<ManifestEntry> entries;
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return entries;
  }
  std::vector<fs::path> excludes{".git"};
  for (const auto& ex : options.excludes) {
    if (!ex.empty()) excludes.push_back(fs::path(ex).lexically_normal());
  }

  fs::recursive_directory_iterator it(root, ec);
  fs::recursive_directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    const auto rel = it->path().lexically_relative(root);
    if (under_any(rel, excludes)) {
      if (it->is_directory(ec)) it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file(ec)) continue;
    ManifestEntry entry;
    entry.path = rel.generic_string();
    entry.size = it->file_size(ec);
    entry.hash = data::to_hex(data::fnv1a_64(data::read_text_file(it->path())));
    entries.push_back(entry);
    if (entries.size() >= options.max_files) {
      log::warn("manifest truncated at " + std::to_string(options.max_files) + " files");
      break;
    }
  }
  std::sort(entries.begin(), entries.end(),
            [](const ManifestEntry& a, const ManifestEntry& b) { return a.path < b.path; });
  return entries;
}

std::string render_manifest(const fs::path& root, VersionControl* vcs, const ManifestOptions& options) {
  std::ostringstream out;
  out << "# Project manifest\n\n";
  out << "- root: " << root.generic_string() << "\n";
  const auto head = vcs ? vcs->head_revision() : read_git_head_hash(root);
  out << "- head: " << (head.empty() ? "(none)" : head) << "\n";
  out << "- generated: " << data::now_iso() << "\n\n";

  const auto entries = collect_manifest_entries(root, options);
  out << "## Files (" << entries.size() << ")\n\n";
  for (const auto& entry : entries) {
    out << "- " << entry.path << " (" << entry.size << " bytes, " << entry.hash << ")\n";
  }

  if (vcs && options.history_lines > 0) {
    const auto history = vcs->history(static_cast<int>(options.history_lines));
    if (history.ok && !history.output.empty()) {
      out << "\n## Recent history\n\n" << history.output;
      if (history.output.back() != '\n') out << "\n";
    }
  }
  return out.str();
}

} // namespace evo
