#include "logging.hpp"
#include "errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <string>

LogField str_field(std::string_view key, std::string_view value) {
    return LogField{std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, std::int64_t value) {
    return LogField{std::string(key), std::to_string(value)};
}

LogField bool_field(std::string_view key, bool value) {
    return LogField{std::string(key), value ? "true" : "false"};
}

void init_logging(bool debug) {
    spdlog::drop("artkeep");
    auto logger = spdlog::stderr_color_mt("artkeep");
    logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%l%$ %v");

    auto level = debug ? spdlog::level::debug : spdlog::level::info;
    if (const char* env = std::getenv("ARTKEEP_LOG_LEVEL")) {
        auto parsed = spdlog::level::from_str(env);
        // from_str maps unknown names to off
        if (parsed != spdlog::level::off || std::string(env) == "off") level = parsed;
    }
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

void log_event(spdlog::level::level_enum level, std::string_view message,
               std::initializer_list<LogField> fields) {
    auto logger = spdlog::default_logger_raw();
    if (!logger->should_log(level)) return;

    std::string line(message);
    for (const auto& f : fields) {
        line += ' ';
        line += f.key;
        line += '=';
        // quote values a reader could otherwise split on
        if (f.value.empty() || f.value.find_first_of(" \t\"=") != std::string::npos) {
            line += '"';
            for (char c : f.value) {
                if (c == '"' || c == '\\') line += '\\';
                line += c;
            }
            line += '"';
        } else {
            line += f.value;
        }
    }
    logger->log(level, line);
}

void fatal_invariant(const std::string& message) {
    log_event(spdlog::level::critical, "fatal invariant violated", {str_field("reason", message)});
    spdlog::default_logger_raw()->flush();
    throw FatalInvariantError(message);
}
