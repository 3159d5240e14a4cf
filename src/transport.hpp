#pragma once

#include "config.hpp"
#include "cookie_jar.hpp"
#include "http_client.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

struct RawResponse {
    long status = 0;
    std::string body;
    bool failed = false;  // no HTTP response at all
    std::string error;
};

// One HTTP GET, no retries. The production implementation wraps cpr.
class RawRequester {
public:
    virtual ~RawRequester() = default;
    virtual RawResponse get(const std::string& url,
                            const std::map<std::string, std::string>& headers,
                            std::chrono::milliseconds timeout) = 0;
};

class CprRequester : public RawRequester {
public:
    RawResponse get(const std::string& url,
                    const std::map<std::string, std::string>& headers,
                    std::chrono::milliseconds timeout) override;
};

class Transport : public HttpClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    Transport(TransportSettings settings,
              std::string userAgent,
              std::unique_ptr<RawRequester> requester = std::make_unique<CprRequester>(),
              Sleeper sleeper = {});

    FetchResult get(const std::string& url) override;
    FetchResult get_with_delay(const std::string& url) override;

    void load_cookies(const std::string& filename);
    const CookieJar& cookies() const { return cookies_; }

    // Sleep chosen for an online-user figure.
    std::chrono::milliseconds delay_for(long long registeredUsers) const;

private:
    FetchResult get_once(const std::string& url);

    TransportSettings settings_;
    std::string userAgent_;
    std::unique_ptr<RawRequester> requester_;
    Sleeper sleep_;
    CookieJar cookies_;
};
