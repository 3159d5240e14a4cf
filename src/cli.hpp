#pragma once

#include "config.hpp"

#include <optional>
#include <string>
#include <vector>

struct CliOptions {
    bool help = false;
    bool version = false;
    std::optional<std::string> configFile;

    std::optional<bool> debug;
    std::optional<bool> recrawl;
    std::optional<bool> skipScraps;
    std::optional<bool> noThrottle;
    std::optional<std::string> watcher;
    std::vector<std::string> creators;
    std::optional<std::string> outputDir;
    std::optional<std::string> cookieFile;
};

// Throws ConfigError on unknown flags, missing values or positional arguments.
CliOptions parse_args(const std::vector<std::string>& args);

// Flags win over the config file, which wins over built-in defaults.
// Throws ConfigError when neither a watcher nor a creator is given.
CrawlConfig resolve_config(const CliOptions& opts);

std::string usage(const std::string& argv0);

std::vector<std::string> split_list(const std::string& list);
