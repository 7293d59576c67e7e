// logging.cpp - Default logger setup
#include "core/logging.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace coderoom::server::core {

bool InitLogging(const std::string& level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    bool ok = true;
    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
        } catch (const spdlog::spdlog_ex& e) {
            ok = false;
            spdlog::error("Failed to open log file {}: {}", log_file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("coderoom", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', using info", level);
        parsed = spdlog::level::info;
    }
    logger->set_level(parsed);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    return ok;
}

} // namespace coderoom::server::core
