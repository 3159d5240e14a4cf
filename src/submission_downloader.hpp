#pragma once

#include "archive_marker.hpp"
#include "errors.hpp"
#include "http_client.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

enum class SaveOutcome {
    Saved,
    AlreadyArchived,
    AssetMissing,  // detail page links to a file that 404s; nothing written
};

// The download link on a detail page is missing or not in //host/path form.
class DownloadLinkError : public CrawlError {
public:
    using CrawlError::CrawlError;
};

struct DownloadTarget {
    std::string url;       // absolute https URL
    std::string filename;  // sanitized last path segment
};

class SubmissionDownloader {
public:
    SubmissionDownloader(HttpClient& client, std::string baseUrl);

    bool is_archived(std::uint64_t id, const std::filesystem::path& dir) const;

    // Fetches the detail page and the file it links to, then writes
    //   <dir>/<filename>               (fsync)
    //   <dir>/<filename>.<id>.html.tmp (fsync) -> rename to <filename>.<id>.html
    // The rename is the commit point; an interrupted save leaves no marker
    // and is redone from scratch on the next run. Throws CrawlError.
    SaveOutcome save(std::uint64_t id, const std::filesystem::path& dir);

    // Throws DownloadLinkError.
    static DownloadTarget find_download_target(const std::string& pageHtml);

    std::string view_url(std::uint64_t id) const;

private:
    void write_files(std::uint64_t id, const std::filesystem::path& dir, const std::string& filename,
                     const std::string& fileContent, const std::string& pageContent);

    HttpClient& client_;
    std::string baseUrl_;
    ArchiveMarker marker_;
};
