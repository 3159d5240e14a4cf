#pragma once

#include "http_client.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace artkeep_test {

// Canned responses keyed by URL. Unknown URLs answer NotFound.
class FakeHttpClient : public HttpClient {
public:
    struct Request {
        std::string url;
        bool delayed;
    };

    FetchResult get(const std::string& url) override;
    FetchResult get_with_delay(const std::string& url) override;

    void set_page(const std::string& url, const std::string& body);
    void set_error(const std::string& url, FetchError error, const std::string& message = "");

    size_t count(const std::string& url) const;
    const std::vector<Request>& requests() const { return requests_; }

private:
    FetchResult lookup(const std::string& url, bool delayed);

    std::map<std::string, FetchResult> responses_;
    std::vector<Request> requests_;
};

// mkdtemp()-backed directory, removed with everything in it on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

void write_file(const std::filesystem::path& path, const std::string& content);
std::string read_file(const std::filesystem::path& path);
std::vector<std::string> list_dir(const std::filesystem::path& dir);

std::string gallery_page(const std::vector<uint64_t>& ids);
std::string view_page(const std::string& downloadHref, const std::string& title = "Test Submission");

} // namespace artkeep_test
