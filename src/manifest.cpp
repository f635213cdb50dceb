#include "manifest.hpp"

#include <algorithm>
#include <system_error>
#include <unordered_map>

#include "path_filter.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

const ManifestEntry* ModpackManifest::find(const std::string& relative_path) const {
  auto it = std::lower_bound(files.begin(), files.end(), relative_path,
                             [](const ManifestEntry& e, const std::string& p){ return e.relative_path < p; });
  if(it == files.end() || it->relative_path != relative_path) return nullptr;
  return &*it;
}

json manifest_to_json(const ModpackManifest& manifest) {
  json files = json::array();
  for(const auto& f : manifest.files) {
    files.push_back({{"path", f.relative_path}, {"size", f.size}, {"sha256", f.sha256}});
  }
  return {
    {"modpack_name", manifest.modpack_name},
    {"files", files},
    {"total_size", manifest.total_size},
    {"version_hash", manifest.version_hash}
  };
}

ModpackManifest manifest_from_json(const json& j) {
  ModpackManifest manifest;
  manifest.modpack_name = j.at("modpack_name").get<std::string>();
  for(const auto& f : j.at("files")) {
    ManifestEntry entry;
    entry.relative_path = f.at("path").get<std::string>();
    entry.size = f.at("size").get<std::uint64_t>();
    entry.sha256 = f.at("sha256").get<std::string>();
    manifest.files.push_back(std::move(entry));
  }
  manifest.version_hash = j.value("version_hash", "");
  std::sort(manifest.files.begin(), manifest.files.end(),
            [](const ManifestEntry& a, const ManifestEntry& b){ return a.relative_path < b.relative_path; });
  manifest.total_size = 0;
  for(const auto& f : manifest.files) manifest.total_size += f.size;
  return manifest;
}

void seal_manifest(ModpackManifest& manifest) {
  std::sort(manifest.files.begin(), manifest.files.end(),
            [](const ManifestEntry& a, const ManifestEntry& b){ return a.relative_path < b.relative_path; });
  std::string lines;
  manifest.total_size = 0;
  for(const auto& f : manifest.files) {
    lines += f.relative_path;
    lines += ':';
    lines += f.sha256;
    lines += '\n';
    manifest.total_size += f.size;
  }
  manifest.version_hash = sha256_hex(lines);
}

ModpackManifest build_manifest(const std::string& modpack_name,
                               const fs::path& root,
                               const std::vector<std::string>& folders,
                               const std::vector<std::string>& ignore_patterns) {
  ModpackManifest manifest;
  manifest.modpack_name = modpack_name;

  for(const auto& folder : folders) {
    std::error_code ec;
    auto dir = root / folder;
    if(!fs::is_directory(dir, ec)) continue;

    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if(ec) continue;
    for(; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if(ec) break;
      if(!it->is_regular_file(ec)) continue;
      auto relative = fs::relative(it->path(), root, ec).generic_string();
      if(ec || relative.empty()) continue;
      if(matches_ignore_pattern(relative, ignore_patterns)) continue;

      ManifestEntry entry;
      entry.relative_path = relative;
      entry.size = static_cast<std::uint64_t>(it->file_size());
      entry.sha256 = sha256_file_hex(it->path());
      manifest.files.push_back(std::move(entry));
    }
  }

  seal_manifest(manifest);
  return manifest;
}

ManifestDiff compute_diff(const ModpackManifest& local, const ModpackManifest& remote) {
  ManifestDiff diff;
  std::unordered_map<std::string, const ManifestEntry*> local_by_path;
  for(const auto& f : local.files) local_by_path.emplace(f.relative_path, &f);

  for(const auto& f : remote.files) {
    auto it = local_by_path.find(f.relative_path);
    if(it == local_by_path.end() || it->second->sha256 != f.sha256) {
      diff.to_download.push_back(f.relative_path);
      diff.download_bytes += f.size;
    } else {
      ++diff.unchanged;
    }
    if(it != local_by_path.end()) local_by_path.erase(it);
  }
  for(const auto& f : local.files) {
    if(local_by_path.count(f.relative_path)) diff.to_delete.push_back(f.relative_path);
  }
  return diff;
}
