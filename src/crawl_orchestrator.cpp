#include "crawl_orchestrator.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace fs = std::filesystem;

CrawlOrchestrator::CrawlOrchestrator(HttpClient& client, const CrawlConfig& config)
    : followList_(client, config.site.baseUrl, config.crawl),
      gallery_(client, config.site.baseUrl, config.crawl),
      downloader_(client, config.site.baseUrl) {}

void CrawlOrchestrator::validate_creator_id(const std::string& id) {
    if (id.empty() || id == "." || id == ".." || id.find('/') != std::string::npos) {
        throw CrawlError("invalid creator id: " + id);
    }
}

std::vector<std::string> CrawlOrchestrator::resolve_creators(const RunSettings& run) {
    std::vector<std::string> creators;
    if (run.watcher && !run.watcher->empty()) {
        creators = followList_.list(*run.watcher);
    }
    for (const auto& c : run.creators) {
        validate_creator_id(c);
        creators.push_back(c);
    }
    return creators;
}

RunSummary CrawlOrchestrator::run(const RunSettings& run) {
    log_info("crawl starting",
             {str_field("watcher", run.watcher.value_or("")), int_field("creators", static_cast<long long>(run.creators.size())),
              bool_field("recrawl", run.recrawl), bool_field("skip_scraps", run.skipScraps),
              str_field("output", run.outputDir)});

    fs::path outputDir = fs::path(run.outputDir).lexically_normal();
    if (outputDir == ".") outputDir.clear();
    RunSummary summary;

    for (const auto& creator : resolve_creators(run)) {
        ++summary.creators;
        const auto artifacts = gallery_.list(creator, outputDir / creator, !run.skipScraps, run.recrawl);
        summary.listed += artifacts.size();

        for (const auto& artifact : artifacts) {
            switch (downloader_.save(artifact.id, artifact.directory)) {
                case SaveOutcome::Saved: ++summary.saved; break;
                case SaveOutcome::AlreadyArchived: ++summary.alreadyArchived; break;
                case SaveOutcome::AssetMissing: ++summary.assetMissing; break;
            }
        }
    }

    log_info("crawl finished",
             {int_field("creators", static_cast<long long>(summary.creators)),
              int_field("listed", static_cast<long long>(summary.listed)),
              int_field("saved", static_cast<long long>(summary.saved)),
              int_field("already_saved", static_cast<long long>(summary.alreadyArchived)),
              int_field("missing", static_cast<long long>(summary.assetMissing))});
    return summary;
}
