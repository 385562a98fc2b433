// ============= src/core/logging.cpp =============
#include "core/logging.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <vector>

namespace photorank {

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError("Cannot open log file " + config.file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("photorank", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    spdlog::set_pattern(config.pattern);
    spdlog::set_level(spdlog::level::from_str(config.level));
}

} // namespace photorank
