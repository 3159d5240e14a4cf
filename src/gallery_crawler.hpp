#pragma once

#include "archive_marker.hpp"
#include "config.hpp"
#include "http_client.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct Artifact {
    std::uint64_t id = 0;
    std::filesystem::path directory;

    bool operator==(const Artifact& o) const { return id == o.id && directory == o.directory; }
};

enum class GallerySection { Gallery, Scraps };

class GalleryCrawler {
public:
    GalleryCrawler(HttpClient& client, std::string baseUrl, CrawlSettings settings);

    // Oldest first; scraps (unless skipped) follow the main gallery.
    // Without reCrawl, listing stops at the first artifact that is already
    // archived, since everything after it on the site is older.
    std::vector<Artifact> list(const std::string& creator, const std::filesystem::path& creatorDir,
                               bool includeScraps, bool reCrawl);

    std::vector<Artifact> list_section(const std::string& creator, const std::filesystem::path& creatorDir,
                                       GallerySection section, bool reCrawl);

    // Artifact ids from /view/<id> links wrapping a thumbnail, in page order.
    static std::vector<std::uint64_t> parse_page(const std::string& html);

private:
    std::string page_url(GallerySection section, const std::string& creator, int page) const;

    HttpClient& client_;
    std::string baseUrl_;
    CrawlSettings settings_;
    ArchiveMarker marker_;
};
