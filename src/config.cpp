#include "config.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <utility>

using nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    out = it->get<T>();
}

const json* section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) throw ConfigError(std::string("config section is not an object: ") + name);
    return &*it;
}

void validate(const CrawlConfig& c) {
    if (c.site.baseUrl.empty()) throw ConfigError("site.base_url must not be empty");
    if (c.transport.maxAttempts < 1) throw ConfigError("transport.max_attempts must be at least 1");
    if (c.transport.retryIntervalMs < 0 || c.transport.timeoutMs <= 0 ||
        c.transport.highLoadDelayMs < 0 || c.transport.defaultDelayMs < 0) {
        throw ConfigError("transport durations must not be negative");
    }
    if (c.crawl.minNewPerPage < 1) throw ConfigError("crawl.min_new_per_page must be at least 1");
    if (c.crawl.maxWatchlistPages < 1 || c.crawl.maxGalleryPages < 1) {
        throw ConfigError("crawl page ceilings must be at least 1");
    }
}

} // namespace

CrawlConfig parse_config(const std::string& text, CrawlConfig c) {
    try {
        json root = json::parse(text);
        if (!root.is_object()) throw ConfigError("config root must be a JSON object");

        if (const json* s = section(root, "site")) {
            read_key(*s, "base_url", c.site.baseUrl);
            read_key(*s, "user_agent", c.site.userAgent);
        }
        if (const json* t = section(root, "transport")) {
            read_key(*t, "max_attempts", c.transport.maxAttempts);
            read_key(*t, "retry_interval_ms", c.transport.retryIntervalMs);
            read_key(*t, "timeout_ms", c.transport.timeoutMs);
            read_key(*t, "high_load_threshold", c.transport.highLoadThreshold);
            read_key(*t, "high_load_delay_ms", c.transport.highLoadDelayMs);
            read_key(*t, "default_delay_ms", c.transport.defaultDelayMs);
            read_key(*t, "throttle", c.transport.throttle);
        }
        if (const json* k = section(root, "crawl")) {
            read_key(*k, "min_new_per_page", c.crawl.minNewPerPage);
            read_key(*k, "max_watchlist_pages", c.crawl.maxWatchlistPages);
            read_key(*k, "max_gallery_pages", c.crawl.maxGalleryPages);
        }
        if (const json* r = section(root, "run")) {
            auto watcher = r->find("watcher");
            if (watcher != r->end() && !watcher->is_null()) c.run.watcher = watcher->get<std::string>();
            read_key(*r, "creators", c.run.creators);
            read_key(*r, "recrawl", c.run.recrawl);
            read_key(*r, "skip_scraps", c.run.skipScraps);
            read_key(*r, "output_dir", c.run.outputDir);
            read_key(*r, "cookie_file", c.run.cookieFile);
            read_key(*r, "debug", c.run.debug);
        }
    } catch (const json::exception& ex) {
        throw ConfigError(std::string("invalid config: ") + ex.what());
    }
    validate(c);
    return c;
}

CrawlConfig load_config_file(const std::string& path, CrawlConfig base) {
    std::ifstream in(path);
    if (!in) throw ConfigError("failed to open config file: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str(), std::move(base));
}
