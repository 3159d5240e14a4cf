#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Anticipated failures: the run stops, the caller reports it, a re-run may succeed.
class CrawlError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public CrawlError {
public:
    using CrawlError::CrawlError;
};

class CookieError : public CrawlError {
public:
    CookieError(const std::string& message, std::string cookieName)
        : CrawlError(message), cookieName_(std::move(cookieName)) {}

    const std::string& cookie_name() const { return cookieName_; }

private:
    std::string cookieName_;
};

// The site no longer looks the way the crawler assumes. Never retried or
// caught below main().
class FatalInvariantError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Logs at critical level and throws FatalInvariantError.
[[noreturn]] void fatal_invariant(const std::string& message);
