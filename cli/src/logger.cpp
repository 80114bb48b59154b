#include "fileq/cli/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace fileq::cli
{

    std::shared_ptr<spdlog::logger> make_logger(const std::optional<std::filesystem::path> &path, bool verbose)
    {
        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console);
        if (path)
        {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
            file->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
            sinks.push_back(file);
        }
        auto logger = std::make_shared<spdlog::logger>("fileq", sinks.begin(), sinks.end());
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        return logger;
    }

} // namespace fileq::cli
