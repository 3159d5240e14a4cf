#include "transport.hpp"
#include "html_scan.hpp"
#include "logging.hpp"

#include <cpr/cpr.h>

#include <thread>
#include <utility>

const char* to_string(FetchError e) {
    switch (e) {
        case FetchError::None: return "ok";
        case FetchError::NotFound: return "not found";
        case FetchError::BadStatus: return "bad status";
        case FetchError::TransportFailure: return "transport failure";
        case FetchError::LoadFigureMissing: return "could not find registered users count";
    }
    return "unknown";
}

std::string FetchResult::describe() const {
    std::string d = to_string(error);
    if (status) d += " (HTTP " + std::to_string(status) + ")";
    if (!message.empty()) d += ": " + message;
    return d;
}

// -------------------- cpr --------------------
RawResponse CprRequester::get(const std::string& url,
                              const std::map<std::string, std::string>& headers,
                              std::chrono::milliseconds timeout) {
    cpr::Header hdr;
    for (const auto& kv : headers) hdr[kv.first] = kv.second;

    cpr::Response r = cpr::Get(cpr::Url{url}, hdr, cpr::Timeout{timeout}, cpr::Redirect{true});

    RawResponse out;
    if (r.error) {
        out.failed = true;
        out.error = r.error.message;
        return out;
    }
    out.status = r.status_code;
    out.body = std::move(r.text);
    return out;
}

// -------------------- ctor --------------------
Transport::Transport(TransportSettings settings,
                     std::string userAgent,
                     std::unique_ptr<RawRequester> requester,
                     Sleeper sleeper)
    : settings_(settings),
      userAgent_(std::move(userAgent)),
      requester_(std::move(requester)),
      sleep_(std::move(sleeper)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

void Transport::load_cookies(const std::string& filename) {
    cookies_.load_file(filename);
}

// -------------------- requests --------------------
FetchResult Transport::get(const std::string& url) {
    log_debug("transport GET", {str_field("url", url)});
    FetchResult last;
    for (int attempt = 1; attempt <= settings_.maxAttempts; ++attempt) {
        last = get_once(url);
        if (last.ok() || last.error == FetchError::NotFound) return last;

        log_info("transport GET failed attempt",
                 {str_field("url", url), int_field("attempt", attempt), str_field("error", last.describe())});
        if (attempt < settings_.maxAttempts) {
            sleep_(std::chrono::milliseconds(settings_.retryIntervalMs));
        }
    }
    log_error("transport GET all attempts failed", {str_field("url", url), str_field("error", last.describe())});
    return last;
}

FetchResult Transport::get_with_delay(const std::string& url) {
    FetchResult result = get(url);
    if (!result.ok()) return result;

    auto users = find_registered_users(result.body);
    if (!users) {
        result.error = FetchError::LoadFigureMissing;
        result.message = url;
        return result;
    }

    auto delay = delay_for(*users);
    if (delay.count() > settings_.defaultDelayMs) {
        log_info("high registered user count detected, delaying",
                 {int_field("count", *users), int_field("delay_ms", delay.count())});
    }
    sleep_(delay);
    return result;
}

std::chrono::milliseconds Transport::delay_for(long long registeredUsers) const {
    if (settings_.throttle && registeredUsers > settings_.highLoadThreshold) {
        return std::chrono::milliseconds(settings_.highLoadDelayMs);
    }
    return std::chrono::milliseconds(settings_.defaultDelayMs);
}

FetchResult Transport::get_once(const std::string& url) {
    std::map<std::string, std::string> headers{{"User-Agent", userAgent_}};
    std::string cookie = cookies_.header_for(url);
    if (!cookie.empty()) headers["Cookie"] = cookie;

    RawResponse raw = requester_->get(url, headers, std::chrono::milliseconds(settings_.timeoutMs));

    FetchResult result;
    if (raw.failed) {
        result.error = FetchError::TransportFailure;
        result.message = raw.error;
        return result;
    }
    result.status = raw.status;
    if (raw.status == 404) {
        result.error = FetchError::NotFound;
        result.message = url;
    } else if (raw.status != 200) {
        result.error = FetchError::BadStatus;
        result.message = url;
    } else {
        result.body = std::move(raw.body);
    }
    return result;
}
