#include "url_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

std::string to_lower(const std::string& s) {
    std::string r = s;
    for (auto& ch : r) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return r;
}

bool starts_with(const std::string& s, const std::string& pre) {
    return s.rfind(pre, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& suf) {
    if (s.size() < suf.size()) return false;
    return std::equal(s.end() - suf.size(), s.end(), suf.begin());
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n\f\v");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(a, b - a + 1);
}

std::optional<UrlParts> parse_url(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*):\/\/([^\/?#]+)([^#]*)$)");
    std::smatch m;
    if (std::regex_match(url, m, re)) {
        UrlParts p;
        p.scheme = to_lower(m[1].str());
        p.host = m[2].str();
        p.path = m[3].str();
        auto query = p.path.find('?');
        if (query != std::string::npos) p.path.erase(query);
        if (p.path.empty() || p.path[0] != '/') p.path = "/" + p.path;
        return p;
    }
    return std::nullopt;
}

std::string host_name(const UrlParts& parts) {
    auto colon = parts.host.rfind(':');
    std::string host = colon == std::string::npos ? parts.host : parts.host.substr(0, colon);
    return to_lower(host);
}

std::string filename_from_url(const std::string& url) {
    auto slash = url.find_last_of('/');
    std::string name = (slash == std::string::npos) ? url : url.substr(slash + 1);
    return sanitize_filename(name);
}

std::string sanitize_filename(const std::string& name) {
    std::string s = name;
    for (char& c : s) {
        if (c == '<' || c == '>' || c == ':' || c == '"' || c == '\\' || c == '|' || c == '?' || c == '*') c = '_';
    }
    return s;
}
