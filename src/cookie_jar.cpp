#include "cookie_jar.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "url_utils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {
constexpr size_t kCookieFieldCount = 7;
}

void CookieJar::load_file(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) throw CrawlError("failed to open cookies file: " + filename);

    std::string line;
    while (std::getline(in, line)) {
        add_line(line);
    }
    if (in.bad()) throw CrawlError("error reading cookies file: " + filename);

    log_info("loaded cookies from file", {str_field("file", filename), int_field("count", static_cast<long long>(cookies_.size()))});
}

void CookieJar::add_line(const std::string& rawLine, std::chrono::system_clock::time_point now) {
    std::string line = trim(rawLine);
    if (line.empty() || line[0] == '#') return;

    std::vector<std::string> parts;
    size_t pos = 0;
    for (;;) {
        size_t tab = line.find('\t', pos);
        parts.push_back(line.substr(pos, tab == std::string::npos ? std::string::npos : tab - pos));
        if (tab == std::string::npos) break;
        pos = tab + 1;
    }
    if (parts.size() != kCookieFieldCount) {
        throw CookieError("invalid cookie format: " + line, "");
    }

    Cookie c;
    c.domain = to_lower(parts[0]);
    // parts[1], the include-subdomains flag, is not used
    c.path = parts[2].empty() ? "/" : parts[2];
    c.secure = to_lower(parts[3]) == "true";
    c.name = parts[5];
    c.value = parts[6];

    const std::string& expiry = parts[4];
    size_t consumed = 0;
    try {
        c.expires = std::stoll(expiry, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (expiry.empty() || consumed != expiry.size()) {
        throw CookieError("invalid expiration time for cookie " + c.name + ": " + expiry, c.name);
    }

    // compared in seconds; far-future expiries overflow the clock's own duration
    using std::chrono::duration_cast;
    using std::chrono::seconds;
    const long long nowSecs = duration_cast<seconds>(now.time_since_epoch()).count();
    const long long minLifetime = duration_cast<seconds>(kMinRemainingLifetime).count();
    if (c.expires < nowSecs + minLifetime) {
        throw CookieError("cookie is expiring, update your cookies.txt file: " + c.name, c.name);
    }

    cookies_.push_back(std::move(c));
}

std::string CookieJar::header_for(const std::string& url) const {
    auto parts = parse_url(url);
    if (!parts) return {};
    const std::string host = host_name(*parts);
    const bool https = parts->scheme == "https";

    std::ostringstream out;
    bool first = true;
    for (const auto& c : cookies_) {
        if (c.secure && !https) continue;
        if (!domain_matches(host, c.domain)) continue;
        if (!path_matches(parts->path, c.path)) continue;
        if (!first) out << "; ";
        out << c.name << '=' << c.value;
        first = false;
    }
    return out.str();
}

bool CookieJar::domain_matches(const std::string& host, const std::string& cookieDomain) {
    std::string domain = cookieDomain;
    if (!domain.empty() && domain[0] == '.') domain = domain.substr(1);
    if (domain.empty()) return false;
    if (host == domain) return true;
    return ends_with(host, "." + domain);
}

bool CookieJar::path_matches(const std::string& path, const std::string& cookiePath) {
    if (!starts_with(path, cookiePath)) return false;
    if (path.size() == cookiePath.size() || ends_with(cookiePath, "/")) return true;
    return path[cookiePath.size()] == '/';
}
