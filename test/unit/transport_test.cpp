#include <gtest/gtest.h>

#include "errors.hpp"
#include "test_utils.hpp"
#include "transport.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <memory>

using namespace std::chrono;

namespace {

// Scripted responses per URL; the last one repeats once the script runs out.
class ScriptedRequester : public RawRequester {
public:
    struct Call {
        std::string url;
        std::map<std::string, std::string> headers;
        milliseconds timeout;
    };

    RawResponse get(const std::string& url, const std::map<std::string, std::string>& headers,
                    milliseconds timeout) override {
        calls.push_back(Call{url, headers, timeout});
        auto& q = script[url];
        if (q.empty()) {
            RawResponse r;
            r.status = 404;
            return r;
        }
        RawResponse r = q.front();
        if (q.size() > 1) q.pop_front();
        return r;
    }

    void push(const std::string& url, long status, const std::string& body = "") {
        RawResponse r;
        r.status = status;
        r.body = body;
        script[url].push_back(r);
    }

    void push_failure(const std::string& url, const std::string& error) {
        RawResponse r;
        r.failed = true;
        r.error = error;
        script[url].push_back(r);
    }

    std::map<std::string, std::deque<RawResponse>> script;
    std::vector<Call> calls;
};

struct TransportTest : public ::testing::Test {
    TransportTest() {
        settings.maxAttempts = 3;
        settings.retryIntervalMs = 5000;
        settings.timeoutMs = 90000;
        settings.highLoadThreshold = 10000;
        settings.highLoadDelayMs = 300000;
        settings.defaultDelayMs = 1000;
    }

    std::unique_ptr<Transport> make() {
        auto req = std::make_unique<ScriptedRequester>();
        requester = req.get();
        return std::make_unique<Transport>(settings, "artkeep-test/1.0", std::move(req),
                                           [this](milliseconds d) { sleeps.push_back(d); });
    }

    static std::string page_with_users(long long users) {
        return "<html><body>content<div class=\"online-stats\">99 guests, " + std::to_string(users) +
               " registered</div></body></html>";
    }

    TransportSettings settings;
    ScriptedRequester* requester = nullptr;
    std::vector<milliseconds> sleeps;
};

const std::string kUrl = "https://www.example.net/view/1";

} // namespace

TEST_F(TransportTest, SuccessReturnsBody) {
    auto t = make();
    requester->push(kUrl, 200, "hello");
    FetchResult r = t->get(kUrl);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ("hello", r.body);
    EXPECT_EQ(1u, requester->calls.size());
    EXPECT_TRUE(sleeps.empty());
    EXPECT_EQ("artkeep-test/1.0", requester->calls[0].headers["User-Agent"]);
    EXPECT_EQ(milliseconds(90000), requester->calls[0].timeout);
}

TEST_F(TransportTest, NotFoundIsNeverRetried) {
    auto t = make();
    requester->push(kUrl, 404);
    FetchResult r = t->get(kUrl);
    EXPECT_EQ(FetchError::NotFound, r.error);
    EXPECT_EQ(1u, requester->calls.size());
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(TransportTest, BadStatusRetriedUntilExhausted) {
    auto t = make();
    requester->push(kUrl, 502);
    FetchResult r = t->get(kUrl);
    EXPECT_EQ(FetchError::BadStatus, r.error);
    EXPECT_EQ(502, r.status);
    EXPECT_EQ(3u, requester->calls.size());
    ASSERT_EQ(2u, sleeps.size());
    EXPECT_EQ(milliseconds(5000), sleeps[0]);
}

TEST_F(TransportTest, TransientFailureThenSuccess) {
    auto t = make();
    requester->push_failure(kUrl, "Timeout was reached");
    requester->push(kUrl, 503);
    requester->push(kUrl, 200, "finally");
    FetchResult r = t->get(kUrl);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ("finally", r.body);
    EXPECT_EQ(3u, requester->calls.size());
    EXPECT_EQ(2u, sleeps.size());
}

TEST_F(TransportTest, TransportFailureSurfacedAfterRetries) {
    auto t = make();
    requester->push_failure(kUrl, "Could not resolve host");
    FetchResult r = t->get(kUrl);
    EXPECT_EQ(FetchError::TransportFailure, r.error);
    EXPECT_NE(std::string::npos, r.describe().find("Could not resolve host"));
    EXPECT_EQ(3u, requester->calls.size());
}

TEST_F(TransportTest, LowLoadSleepsDefaultDelay) {
    auto t = make();
    requester->push(kUrl, 200, page_with_users(9000));
    FetchResult r = t->get_with_delay(kUrl);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(1u, sleeps.size());
    EXPECT_EQ(milliseconds(1000), sleeps[0]);
}

TEST_F(TransportTest, HighLoadSleepsCooldown) {
    auto t = make();
    requester->push(kUrl, 200, page_with_users(10001));
    FetchResult r = t->get_with_delay(kUrl);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(1u, sleeps.size());
    EXPECT_EQ(milliseconds(300000), sleeps[0]);
}

TEST_F(TransportTest, ThresholdItselfIsNotHighLoad) {
    auto t = make();
    requester->push(kUrl, 200, page_with_users(10000));
    t->get_with_delay(kUrl);
    ASSERT_EQ(1u, sleeps.size());
    EXPECT_EQ(milliseconds(1000), sleeps[0]);
}

TEST_F(TransportTest, NoThrottleKeepsDefaultDelay) {
    settings.throttle = false;
    auto t = make();
    requester->push(kUrl, 200, page_with_users(50000));
    FetchResult r = t->get_with_delay(kUrl);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(1u, sleeps.size());
    EXPECT_EQ(milliseconds(1000), sleeps[0]);
}

TEST_F(TransportTest, MissingLoadFigureKeepsBody) {
    auto t = make();
    requester->push(kUrl, 200, "<html>no footer</html>");
    FetchResult r = t->get_with_delay(kUrl);
    EXPECT_EQ(FetchError::LoadFigureMissing, r.error);
    EXPECT_EQ("<html>no footer</html>", r.body);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(TransportTest, FetchFailureSkipsDelay) {
    auto t = make();
    requester->push(kUrl, 404);
    FetchResult r = t->get_with_delay(kUrl);
    EXPECT_EQ(FetchError::NotFound, r.error);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(TransportTest, CookiesSentToMatchingDomainOnly) {
    artkeep_test::TempDir tmp;
    long long far = duration_cast<seconds>((system_clock::now() + hours(24 * 365)).time_since_epoch()).count();
    auto path = tmp.path() / "cookies.txt";
    artkeep_test::write_file(path, ".example.net\tTRUE\t/\tTRUE\t" + std::to_string(far) + "\ta\tsecret\n");

    auto t = make();
    t->load_cookies(path.string());
    ASSERT_EQ(1u, t->cookies().size());
    EXPECT_EQ(".example.net", t->cookies().cookies()[0].domain);
    requester->push(kUrl, 200, "ok");
    requester->push("https://elsewhere.org/", 200, "ok");

    t->get(kUrl);
    t->get("https://elsewhere.org/");
    ASSERT_EQ(2u, requester->calls.size());
    EXPECT_EQ("a=secret", requester->calls[0].headers["Cookie"]);
    EXPECT_EQ(0u, requester->calls[1].headers.count("Cookie"));
}

TEST_F(TransportTest, ExpiringCookieFileRejected) {
    artkeep_test::TempDir tmp;
    long long soon = duration_cast<seconds>((system_clock::now() + hours(24)).time_since_epoch()).count();
    auto path = tmp.path() / "cookies.txt";
    artkeep_test::write_file(path, ".example.net\tTRUE\t/\tTRUE\t" + std::to_string(soon) + "\tsess\tx\n");

    auto t = make();
    EXPECT_THROW(t->load_cookies(path.string()), CookieError);
}

TEST_F(TransportTest, DelayFor) {
    auto t = make();
    EXPECT_EQ(milliseconds(1000), t->delay_for(0));
    EXPECT_EQ(milliseconds(300000), t->delay_for(20000));
}
