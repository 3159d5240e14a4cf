#pragma once

#include "config.hpp"
#include "http_client.hpp"

#include <string>
#include <vector>

class FollowListCrawler {
public:
    FollowListCrawler(HttpClient& client, std::string baseUrl, CrawlSettings settings);

    // Unique creator ids in first-seen order. The site pads every page with
    // old entries, so paging stops once a page adds fewer than
    // minNewPerPage ids rather than on an empty page.
    std::vector<std::string> list(const std::string& watcher);

    // /user/<id>/ occurrences in page order; ids never contain '/', quotes or whitespace.
    static std::vector<std::string> parse_page(const std::string& html);

private:
    HttpClient& client_;
    std::string baseUrl_;
    CrawlSettings settings_;
};
