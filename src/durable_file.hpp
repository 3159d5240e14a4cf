#pragma once

#include <filesystem>
#include <string>

// Throws CrawlError("invalid file path: ...") unless path is already in
// lexically normal form. Guards every write against ../ smuggled in by a
// crafted name.
void ensure_canonical(const std::filesystem::path& path);

// mkdir -p, new directories get mode 0750. Throws CrawlError.
void make_dirs(const std::filesystem::path& dir);

// Create or truncate, write everything, fsync. Throws CrawlError.
void write_and_fsync(const std::filesystem::path& path, const std::string& data);

// rename(2), then fsync of the parent directory. Throws CrawlError.
void durable_rename(const std::filesystem::path& from, const std::filesystem::path& to);
