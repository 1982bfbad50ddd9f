#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace hexmap::logsys {

struct LogOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::filesystem::path file;   // empty: console only
    bool truncate_file = true;
};

// Creates the "hexmap" logger (colored stderr + optional file), installs it as the
// spdlog default and returns it. Library code logs through the default logger, so
// calling this is optional; without it spdlog's own default is used.
std::shared_ptr<spdlog::logger> init(const LogOptions& opts = {});
std::shared_ptr<spdlog::logger> get();

// "trace", "debug", "info", "warn", "error", "critical", "off"; unknown names map to info.
spdlog::level::level_enum parse_level(const std::string& name);

} // namespace hexmap::logsys
