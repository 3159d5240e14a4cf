#pragma once

#include "config.hpp"
#include "follow_list_crawler.hpp"
#include "gallery_crawler.hpp"
#include "http_client.hpp"
#include "submission_downloader.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

struct RunSummary {
    size_t creators = 0;
    size_t listed = 0;
    size_t saved = 0;
    size_t alreadyArchived = 0;
    size_t assetMissing = 0;
};

// One pass over the watcher's follow list and the named creators. Stops at
// the first error; a later run picks up where this one stopped because
// listing and saving both consult the archive on disk.
class CrawlOrchestrator {
public:
    CrawlOrchestrator(HttpClient& client, const CrawlConfig& config);

    RunSummary run(const RunSettings& run);

    // Watcher's follow list first, then explicitly named creators.
    std::vector<std::string> resolve_creators(const RunSettings& run);

private:
    static void validate_creator_id(const std::string& id);

    FollowListCrawler followList_;
    GalleryCrawler gallery_;
    SubmissionDownloader downloader_;
};
