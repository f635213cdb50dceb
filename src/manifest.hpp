#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct ManifestEntry {
  std::string relative_path;   // '/' separated, relative to the modpack root
  std::uint64_t size = 0;
  std::string sha256;          // hex
};

struct ModpackManifest {
  std::string modpack_name;
  std::vector<ManifestEntry> files;   // sorted by relative_path
  std::uint64_t total_size = 0;
  std::string version_hash;

  const ManifestEntry* find(const std::string& relative_path) const;
};

nlohmann::json manifest_to_json(const ModpackManifest& manifest);
// Throws nlohmann::json::exception on a malformed document.
ModpackManifest manifest_from_json(const nlohmann::json& j);

// sha256 over the sorted "path:hash" lines. Also sorts files and refreshes total_size.
void seal_manifest(ModpackManifest& manifest);

// Walks the given folders below root. Missing folders are skipped; files whose
// relative path matches an ignore pattern are left out. Throws
// std::runtime_error if a file cannot be hashed.
ModpackManifest build_manifest(const std::string& modpack_name,
                               const std::filesystem::path& root,
                               const std::vector<std::string>& folders,
                               const std::vector<std::string>& ignore_patterns);

struct ManifestDiff {
  std::vector<std::string> to_download;   // missing locally or content differs
  std::vector<std::string> to_delete;     // present locally only
  std::size_t unchanged = 0;
  std::uint64_t download_bytes = 0;

  bool empty() const { return to_download.empty() && to_delete.empty(); }
};

// What local needs to do to match remote.
ManifestDiff compute_diff(const ModpackManifest& local, const ModpackManifest& remote);

// Resolves the local manifest of a modpack by name, or nullopt if it is unknown here.
using ManifestProvider = std::function<std::optional<ModpackManifest>(const std::string& modpack_name)>;
