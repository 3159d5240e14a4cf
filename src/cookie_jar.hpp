#pragma once

#include <chrono>
#include <string>
#include <vector>

struct Cookie {
    std::string domain;
    std::string path;
    bool secure = false;
    long long expires = 0;  // unix seconds
    std::string name;
    std::string value;
};

// Session cookies exported from a browser in Netscape cookies.txt format.
class CookieJar {
public:
    // Records expiring within this window are refused: running on with a
    // dead session would silently skip members-only content.
    static constexpr std::chrono::hours kMinRemainingLifetime{24 * 7};

    // Throws CrawlError if the file can't be read, CookieError on a bad record.
    void load_file(const std::string& filename);

    // Parses one line. Blank and '#' lines are ignored. Throws CookieError.
    void add_line(const std::string& line,
                  std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // "name=value; name2=value2" for cookies applicable to url, or "".
    std::string header_for(const std::string& url) const;

    size_t size() const { return cookies_.size(); }
    const std::vector<Cookie>& cookies() const { return cookies_; }

private:
    static bool domain_matches(const std::string& host, const std::string& cookieDomain);
    static bool path_matches(const std::string& path, const std::string& cookiePath);

    std::vector<Cookie> cookies_;
};
