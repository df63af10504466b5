#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <cstdlib>

namespace mermaidgen {
namespace logging {

// Level names accepted in MERMAIDGEN_LOG_LEVEL
inline std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
    if (name == "trace") {
        return spdlog::level::trace;
    } else if (name == "debug") {
        return spdlog::level::debug;
    } else if (name == "info") {
        return spdlog::level::info;
    } else if (name == "warn") {
        return spdlog::level::warn;
    } else if (name == "error") {
        return spdlog::level::err;
    } else if (name == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

// Level for the value of MERMAIDGEN_LOG_LEVEL (null when unset).
// An unrecognized value is reported on `log` and falls back to info.
inline spdlog::level::level_enum level_from_env(const char* value, spdlog::logger& log) {
    if (!value) {
        return spdlog::level::info;
    }
    auto level = parse_level(value);
    if (!level) {
        log.warn("Unknown MERMAIDGEN_LOG_LEVEL '{}', using info "
                 "(expected trace, debug, info, warn, error or off)", value);
        return spdlog::level::info;
    }
    return *level;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("mermaidgen");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(level_from_env(std::getenv("MERMAIDGEN_LOG_LEVEL"), *log));
        return log;
    }();
    return logger;
}

// Override the level chosen at startup, e.g. for a --verbose flag
inline void set_level(spdlog::level::level_enum level) {
    get_logger()->set_level(level);
}

}  // namespace logging
}  // namespace mermaidgen
