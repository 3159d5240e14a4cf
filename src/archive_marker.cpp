#include "archive_marker.hpp"
#include "errors.hpp"
#include "url_utils.hpp"

#include <system_error>

namespace fs = std::filesystem;

std::string ArchiveMarker::marker_suffix(std::uint64_t id) {
    return "." + std::to_string(id) + ".html";
}

std::string ArchiveMarker::marker_name(const std::string& filename, std::uint64_t id) {
    return filename + marker_suffix(id);
}

bool ArchiveMarker::is_archived(std::uint64_t id, const fs::path& dir) const {
    const std::string suffix = marker_suffix(id);

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) return false;
        throw CrawlError("failed to read directory " + dir.string() + ": " + ec.message());
    }
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;
        if (ends_with(it->path().filename().string(), suffix)) return true;
    }
    if (ec) throw CrawlError("failed to read directory " + dir.string() + ": " + ec.message());
    return false;
}
