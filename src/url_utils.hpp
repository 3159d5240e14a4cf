#pragma once

#include <optional>
#include <string>

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string path;
};

std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& pre);
bool ends_with(const std::string& s, const std::string& suf);
std::string trim(const std::string& s);

// scheme://host[/path]; the port, if any, stays on host.
std::optional<UrlParts> parse_url(const std::string& url);

// Host without a trailing :port.
std::string host_name(const UrlParts& parts);

// Last '/' segment with < > : " \ | ? * replaced by '_'.
std::string filename_from_url(const std::string& url);
std::string sanitize_filename(const std::string& name);
