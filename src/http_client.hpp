#pragma once

#include <string>

enum class FetchError {
    None,
    NotFound,           // 404, never retried
    BadStatus,          // any other non-200
    TransportFailure,   // connect/TLS/timeout
    LoadFigureMissing,  // get_with_delay only; body is still set
};

const char* to_string(FetchError e);

struct FetchResult {
    FetchError error = FetchError::None;
    long status = 0;
    std::string body;
    std::string message;

    bool ok() const { return error == FetchError::None; }
    std::string describe() const;
};

// The only network surface the crawl code sees.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // GET with retries on transient failures.
    virtual FetchResult get(const std::string& url) = 0;

    // get() followed by the load-aware politeness delay.
    virtual FetchResult get_with_delay(const std::string& url) = 0;
};
