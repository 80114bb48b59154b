#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>

#include "fileq/settings.hpp"

namespace fileq::cli
{

    struct CliConfig
    {
        std::optional<std::filesystem::path> config_path;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::size_t> buffer_size;
        std::optional<std::size_t> history_size;
        bool verify{false};
        bool no_preserve{false};
        bool verbose{false};
    };

    CliConfig parse_arguments(int argc, char *argv[]);

    // Settings file first (when given), then command-line overrides. Throws ConfigError.
    QueueSettings resolve_settings(const CliConfig &config);

} // namespace fileq::cli
