#pragma once

#include <optional>
#include <string>
#include <vector>

struct SiteSettings {
    std::string baseUrl = "https://www.furaffinity.net";
    std::string userAgent = "artkeep/" ARTKEEP_VERSION;
};

struct TransportSettings {
    int maxAttempts = 3;
    long long retryIntervalMs = 5000;
    long long timeoutMs = 90000;
    long long highLoadThreshold = 10000;
    long long highLoadDelayMs = 5 * 60 * 1000;
    long long defaultDelayMs = 1000;
    // false: always the default delay, whatever the load figure says
    bool throttle = true;
};

// Tuned to the site's current behaviour.
struct CrawlSettings {
    int minNewPerPage = 2;
    int maxWatchlistPages = 100;
    int maxGalleryPages = 1000;
};

struct RunSettings {
    std::optional<std::string> watcher;
    std::vector<std::string> creators;
    bool recrawl = false;
    bool skipScraps = false;
    std::string outputDir = "dl";
    std::string cookieFile;
    bool debug = false;
};

struct CrawlConfig {
    SiteSettings site;
    TransportSettings transport;
    CrawlSettings crawl;
    RunSettings run;
};

// Overlays the keys present in a JSON config file onto `base`. Throws ConfigError.
CrawlConfig load_config_file(const std::string& path, CrawlConfig base = {});
CrawlConfig parse_config(const std::string& text, CrawlConfig base = {});
