#include "cli.hpp"
#include "errors.hpp"
#include "url_utils.hpp"

#include <sstream>

std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos != std::string::npos) {
        size_t comma = list.find(',', pos);
        std::string token = trim((comma == std::string::npos) ? list.substr(pos) : list.substr(pos, comma - pos));
        if (!token.empty()) out.push_back(token);
        pos = (comma == std::string::npos) ? std::string::npos : comma + 1;
    }
    return out;
}

CliOptions parse_args(const std::vector<std::string>& args) {
    CliOptions o;

    auto take_value = [&](size_t& i, const std::string& flag) -> std::string {
        if (i + 1 >= args.size()) throw ConfigError("missing value for " + flag);
        return args[++i];
    };

    auto apply_value = [&](char flag, const std::string& value) {
        switch (flag) {
            case 'u': o.watcher = value; break;
            case 'a': {
                auto list = split_list(value);
                o.creators.insert(o.creators.end(), list.begin(), list.end());
                break;
            }
            case 'o': o.outputDir = value; break;
            case 'c': o.cookieFile = value; break;
            default: break;
        }
    };

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") o.help = true;
        else if (arg == "--version") o.version = true;
        else if (arg == "--debug") o.debug = true;
        else if (arg == "--recrawl") o.recrawl = true;
        else if (arg == "--skip-scraps") o.skipScraps = true;
        else if (arg == "--no-throttle") o.noThrottle = true;
        else if (arg == "--config") o.configFile = take_value(i, arg);
        else if (arg == "--username") apply_value('u', take_value(i, arg));
        else if (arg == "--artists") apply_value('a', take_value(i, arg));
        else if (arg == "--output") apply_value('o', take_value(i, arg));
        else if (arg == "--cookies") apply_value('c', take_value(i, arg));
        else if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') {
            // clustered short flags: -drs, -u name, -uname
            for (size_t k = 1; k < arg.size(); ++k) {
                char f = arg[k];
                if (f == 'd') o.debug = true;
                else if (f == 'r') o.recrawl = true;
                else if (f == 's') o.skipScraps = true;
                else if (f == 'n') o.noThrottle = true;
                else if (f == 'h') o.help = true;
                else if (f == 'u' || f == 'a' || f == 'o' || f == 'c') {
                    std::string value = k + 1 < arg.size() ? arg.substr(k + 1) : take_value(i, std::string("-") + f);
                    apply_value(f, value);
                    break;
                } else {
                    throw ConfigError(std::string("unknown flag: -") + f);
                }
            }
        } else if (starts_with(arg, "--")) {
            throw ConfigError("unknown flag: " + arg);
        } else {
            throw ConfigError("unexpected argument: " + arg);
        }
    }
    return o;
}

CrawlConfig resolve_config(const CliOptions& opts) {
    CrawlConfig c;
    if (opts.configFile) c = load_config_file(*opts.configFile);

    if (opts.debug) c.run.debug = *opts.debug;
    if (opts.recrawl) c.run.recrawl = *opts.recrawl;
    if (opts.skipScraps) c.run.skipScraps = *opts.skipScraps;
    if (opts.noThrottle) c.transport.throttle = !*opts.noThrottle;
    if (opts.watcher) c.run.watcher = *opts.watcher;
    if (!opts.creators.empty()) c.run.creators = opts.creators;
    if (opts.outputDir) c.run.outputDir = *opts.outputDir;
    if (opts.cookieFile) c.run.cookieFile = *opts.cookieFile;

    if ((!c.run.watcher || c.run.watcher->empty()) && c.run.creators.empty()) {
        throw ConfigError("either --username or --artists must be specified");
    }
    return c;
}

std::string usage(const std::string& argv0) {
    std::ostringstream ss;
    ss << "usage: " << argv0
       << " [-drsn] (-u <username> | -a <artist1>[,artist2,...]) [-o <output_dir>] [-c <cookies_file>]"
          " [--config <file.json>]\n\n"
       << "  -d, --debug          Enable debug logging\n"
       << "  -r, --recrawl        Re-crawl galleries looking for missed submissions\n"
       << "  -s, --skip-scraps    Don't download scraps\n"
       << "  -n, --no-throttle    Ignore the online-user count; keep the short delay\n"
       << "  -u, --username NAME  Download all artists in this user's watchlist\n"
       << "  -a, --artists LIST   Download all submissions from comma-separated artists\n"
       << "  -o, --output DIR     Output directory for downloads (default: dl)\n"
       << "  -c, --cookies FILE   Path to cookies.txt file\n"
       << "      --config FILE    JSON settings file\n"
       << "      --version        Print version and exit\n";
    return ss.str();
}
