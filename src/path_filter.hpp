#pragma once

#include <string>
#include <vector>

// Folder names inside a modpack that are watched and synced by default.
std::vector<std::string> default_watch_folders();
// *.log, *.tmp, crash-reports/*, logs/*, .cache/*
std::vector<std::string> default_ignore_patterns();

// Patterns are "*.ext" (suffix), "dir/*" (everything below dir) or an exact
// relative path. Backslashes in either argument are treated as '/'.
bool matches_glob(const std::string& relative_path, const std::string& pattern);
bool matches_ignore_pattern(const std::string& relative_path, const std::vector<std::string>& patterns);
