#include "follow_list_crawler.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <regex>
#include <unordered_set>
#include <utility>

FollowListCrawler::FollowListCrawler(HttpClient& client, std::string baseUrl, CrawlSettings settings)
    : client_(client), baseUrl_(std::move(baseUrl)), settings_(settings) {}

std::vector<std::string> FollowListCrawler::parse_page(const std::string& html) {
    // [^/]+ keeps a crafted id from carrying a path into the output tree
    static const std::regex user_re(R"(/user/([^/"'<>\s]+)/)");
    std::vector<std::string> ids;
    for (std::sregex_iterator it(html.begin(), html.end(), user_re), end; it != end; ++it) {
        std::string id = (*it)[1].str();
        if (id == "." || id == "..") continue;
        ids.push_back(std::move(id));
    }
    return ids;
}

std::vector<std::string> FollowListCrawler::list(const std::string& watcher) {
    log_debug("listing watchlist", {str_field("user", watcher)});

    std::unordered_set<std::string> seen;
    std::vector<std::string> creators;

    for (int page = 1;; ++page) {
        if (page > settings_.maxWatchlistPages) {
            log_error("maximum watchlist pages exceeded",
                      {str_field("user", watcher), int_field("max_pages", settings_.maxWatchlistPages)});
            fatal_invariant("maximum watchlist pages exceeded");
        }

        // watchlist pages carry no online-stats footer, so no load-aware delay
        const std::string url = baseUrl_ + "/watchlist/by/" + watcher + "/" + std::to_string(page);
        FetchResult r = client_.get(url);
        if (!r.ok()) {
            log_error("watchlist page fetch error", {str_field("url", url), str_field("error", r.describe())});
            throw CrawlError("failed to fetch watchlist page " + url + ": " + r.describe());
        }

        const auto matches = parse_page(r.body);
        int added = 0;
        for (const auto& id : matches) {
            if (seen.insert(id).second) {
                creators.push_back(id);
                ++added;
            }
        }

        log_info("watchlist page processed",
                 {str_field("user", watcher), int_field("page", page),
                  int_field("count", static_cast<long long>(matches.size())), int_field("new", added)});

        if (added < settings_.minNewPerPage) break;
    }

    log_info("total watchlist entries found",
             {str_field("user", watcher), int_field("count", static_cast<long long>(creators.size()))});
    return creators;
}
