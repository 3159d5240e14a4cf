#include "cli.hpp"
#include "crawl_orchestrator.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "transport.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv, argv + argc);

    CliOptions opts;
    CrawlConfig config;
    try {
        opts = parse_args(args);
        if (opts.help) {
            std::cout << usage(args[0]);
            return 0;
        }
        if (opts.version) {
            std::cout << "artkeep " << ARTKEEP_VERSION << std::endl;
            return 0;
        }
        config = resolve_config(opts);
    } catch (const ConfigError& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n" << usage(args[0]);
        return 1;
    }

    init_logging(config.run.debug);
    log_info("starting artkeep", {str_field("version", ARTKEEP_VERSION)});

    try {
        Transport transport(config.transport, config.site.userAgent);
        if (!config.run.cookieFile.empty()) {
            transport.load_cookies(config.run.cookieFile);
        }

        CrawlOrchestrator crawler(transport, config);
        crawler.run(config.run);
    } catch (const FatalInvariantError& ex) {
        log_event(spdlog::level::critical, "aborting", {str_field("error", ex.what())});
        return 2;
    } catch (const std::exception& ex) {
        log_error("application error", {str_field("error", ex.what())});
        return 1;
    }

    log_info("done");
    return 0;
}
