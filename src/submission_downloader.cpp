#include "submission_downloader.hpp"
#include "durable_file.hpp"
#include "html_scan.hpp"
#include "logging.hpp"
#include "url_utils.hpp"

#include <optional>
#include <utility>

namespace fs = std::filesystem;

SubmissionDownloader::SubmissionDownloader(HttpClient& client, std::string baseUrl)
    : client_(client), baseUrl_(std::move(baseUrl)) {}

bool SubmissionDownloader::is_archived(std::uint64_t id, const fs::path& dir) const {
    return marker_.is_archived(id, dir);
}

std::string SubmissionDownloader::view_url(std::uint64_t id) const {
    return baseUrl_ + "/view/" + std::to_string(id);
}

SaveOutcome SubmissionDownloader::save(std::uint64_t id, const fs::path& dir) {
    if (is_archived(id, dir)) {
        log_debug("submission already saved, skipping", {int_field("id", static_cast<long long>(id))});
        return SaveOutcome::AlreadyArchived;
    }

    try {
        ensure_canonical(dir);
        make_dirs(dir);
    } catch (const CrawlError& ex) {
        throw CrawlError(std::string("failed to create target directory: ") + ex.what());
    }

    const std::string pageUrl = view_url(id);
    FetchResult page = client_.get_with_delay(pageUrl);
    if (!page.ok()) {
        throw CrawlError("failed to get submission page " + pageUrl + ": " + page.describe());
    }

    DownloadTarget target = find_download_target(page.body);

    FetchResult file = client_.get(target.url);
    if (file.error == FetchError::NotFound) {
        // the site sometimes lists files it no longer serves
        log_error("file download 404s, skipping submission",
                  {int_field("id", static_cast<long long>(id)), str_field("url", target.url)});
        return SaveOutcome::AssetMissing;
    }
    if (!file.ok()) {
        throw CrawlError("failed to download file " + target.url + ": " + file.describe());
    }

    write_files(id, dir, target.filename, file.body, page.body);
    return SaveOutcome::Saved;
}

DownloadTarget SubmissionDownloader::find_download_target(const std::string& pageHtml) {
    std::optional<std::string> href;
    for (const auto& a : extract_anchors(pageHtml)) {
        if (a.href && a.text == "Download") {
            href = a.href;
            break;
        }
    }
    if (!href) throw DownloadLinkError("failed to find download link in HTML");

    // only scheme-relative //host/path links are trusted
    if (!starts_with(*href, "//") || href->size() <= 2 || (*href)[2] == '/') {
        throw DownloadLinkError("unexpected download link format: " + *href);
    }

    DownloadTarget t;
    t.url = "https:" + *href;
    // splitting on '/' keeps any path component out of the name
    t.filename = filename_from_url(t.url);
    if (t.filename.empty()) {
        throw DownloadLinkError("unexpected download link format: " + *href);
    }
    return t;
}

void SubmissionDownloader::write_files(std::uint64_t id, const fs::path& dir, const std::string& filename,
                                       const std::string& fileContent, const std::string& pageContent) {
    const fs::path filePath = dir / filename;
    try {
        write_and_fsync(filePath, fileContent);
    } catch (const CrawlError& ex) {
        throw CrawlError(std::string("failed to save file: ") + ex.what());
    }

    // marker last: only after the file is durable may it appear
    const fs::path htmlPath = dir / ArchiveMarker::marker_name(filename, id);
    const fs::path htmlTemp = htmlPath.string() + ".tmp";
    try {
        write_and_fsync(htmlTemp, pageContent);
    } catch (const CrawlError& ex) {
        throw CrawlError(std::string("failed to save HTML page: ") + ex.what());
    }
    try {
        durable_rename(htmlTemp, htmlPath);
    } catch (const CrawlError& ex) {
        throw CrawlError(std::string("failed to finalize HTML page save: ") + ex.what());
    }

    log_info("saved submission", {int_field("id", static_cast<long long>(id)), str_field("file", filePath.string())});
}
