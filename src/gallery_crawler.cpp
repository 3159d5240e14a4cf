#include "gallery_crawler.hpp"
#include "errors.hpp"
#include "html_scan.hpp"
#include "logging.hpp"
#include "url_utils.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace fs = std::filesystem;

namespace {

const char* section_name(GallerySection s) {
    return s == GallerySection::Scraps ? "scraps" : "gallery";
}

std::uint64_t parse_view_id(const std::string& href) {
    std::string s = href;
    if (ends_with(s, "/")) s.pop_back();
    const size_t prefix = std::string("/view/").size();
    s = s.size() > prefix ? s.substr(prefix) : std::string();

    bool valid = !s.empty() && s.find_first_not_of("0123456789") == std::string::npos;
    std::uint64_t id = 0;
    for (size_t i = 0; valid && i < s.size(); ++i) {
        std::uint64_t digit = static_cast<std::uint64_t>(s[i] - '0');
        if (id > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) valid = false;
        id = id * 10 + digit;
    }
    if (!valid) {
        // view links have always been numeric; anything else means the site changed
        fatal_invariant("unable to extract id from " + href);
    }
    return id;
}

} // namespace

GalleryCrawler::GalleryCrawler(HttpClient& client, std::string baseUrl, CrawlSettings settings)
    : client_(client), baseUrl_(std::move(baseUrl)), settings_(settings) {}

std::string GalleryCrawler::page_url(GallerySection section, const std::string& creator, int page) const {
    return baseUrl_ + "/" + section_name(section) + "/" + creator + "/" + std::to_string(page);
}

std::vector<Artifact> GalleryCrawler::list(const std::string& creator, const fs::path& creatorDir,
                                           bool includeScraps, bool reCrawl) {
    log_debug("listing submissions", {str_field("user", creator), bool_field("recrawl", reCrawl)});
    std::vector<Artifact> artifacts = list_section(creator, creatorDir, GallerySection::Gallery, reCrawl);

    if (includeScraps) {
        log_debug("listing scraps", {str_field("user", creator), bool_field("recrawl", reCrawl)});
        auto scraps = list_section(creator, creatorDir, GallerySection::Scraps, reCrawl);
        artifacts.insert(artifacts.end(), scraps.begin(), scraps.end());
    }

    log_info("total submissions found",
             {str_field("user", creator), int_field("count", static_cast<long long>(artifacts.size()))});
    return artifacts;
}

std::vector<Artifact> GalleryCrawler::list_section(const std::string& creator, const fs::path& creatorDir,
                                                   GallerySection section, bool reCrawl) {
    const fs::path dir = section == GallerySection::Scraps ? creatorDir / "scraps" : creatorDir;
    std::vector<Artifact> artifacts;

    for (int page = 1;; ++page) {
        if (page > settings_.maxGalleryPages) {
            log_error("maximum gallery pages exceeded",
                      {str_field("user", creator), int_field("max_pages", settings_.maxGalleryPages)});
            fatal_invariant("maximum gallery pages exceeded");
        }

        const std::string url = page_url(section, creator, page);
        FetchResult r = client_.get_with_delay(url);
        if (!r.ok()) {
            log_error("gallery page fetch error", {str_field("url", url), str_field("error", r.describe())});
            throw CrawlError("failed to fetch gallery page " + url + ": " + r.describe());
        }

        const auto ids = parse_page(r.body);
        bool stop = false;
        size_t added = 0;
        for (std::uint64_t id : ids) {
            if (!reCrawl && marker_.is_archived(id, dir)) {
                log_debug("submission already saved, stopping crawl",
                          {str_field("user", creator), int_field("id", static_cast<long long>(id))});
                stop = true;
                break;
            }
            artifacts.push_back(Artifact{id, dir});
            ++added;
        }

        log_debug(std::string("listing ") + section_name(section),
                  {str_field("user", creator), int_field("page", page), int_field("count", static_cast<long long>(added))});

        if (ids.empty() || stop) break;
    }

    // the site lists newest first
    std::reverse(artifacts.begin(), artifacts.end());
    return artifacts;
}

std::vector<std::uint64_t> GalleryCrawler::parse_page(const std::string& html) {
    std::vector<std::uint64_t> ids;
    for (const auto& a : extract_anchors(html)) {
        // navigation also links to /view/; only thumbnails wrap an <img>
        if (!a.href || !starts_with(*a.href, "/view/")) continue;
        if (!a.wrapsImage) continue;
        ids.push_back(parse_view_id(*a.href));
    }
    return ids;
}
