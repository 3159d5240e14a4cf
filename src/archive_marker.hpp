#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

// An artifact is archived when "<anything>.<id>.html" exists directly in its
// directory. Nothing else records completion.
class ArchiveMarker {
public:
    static std::string marker_suffix(std::uint64_t id);
    static std::string marker_name(const std::string& filename, std::uint64_t id);

    // A missing directory is not an error. Throws CrawlError on other read failures.
    bool is_archived(std::uint64_t id, const std::filesystem::path& dir) const;
};
