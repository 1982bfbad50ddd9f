#include "hexmap/core/Log.hpp"

#include <system_error>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace hexmap::logsys {

static std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> init(const LogOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string fileError;
    if (!opts.file.empty()) {
        std::error_code ec;
        if (opts.file.has_parent_path())
            fs::create_directories(opts.file.parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                opts.file.string(), opts.truncate_file));
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    g_logger = std::make_shared<spdlog::logger>("hexmap", sinks.begin(), sinks.end());
    spdlog::set_default_logger(g_logger);
    spdlog::set_level(opts.level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (!fileError.empty())
        spdlog::warn("log file '{}' unavailable, console only: {}", opts.file.string(), fileError);
    return g_logger;
}

std::shared_ptr<spdlog::logger> get() {
    return g_logger ? g_logger : spdlog::default_logger();
}

spdlog::level::level_enum parse_level(const std::string& name) {
    const auto lvl = spdlog::level::from_str(name);
    // from_str returns `off` for anything it does not recognise
    if (lvl == spdlog::level::off && name != "off")
        return spdlog::level::info;
    return lvl;
}

} // namespace hexmap::logsys
