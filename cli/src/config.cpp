#include "fileq/cli/config.hpp"

#include <stdexcept>
#include <string>

namespace fileq::cli
{

    namespace
    {

        std::size_t parse_size(const std::string &flag, const std::string &value)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size())
                {
                    throw std::invalid_argument(value);
                }
                return static_cast<std::size_t>(parsed);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(flag + " expects a non-negative integer, got '" + value + "'");
            }
        }

    } // namespace

    CliConfig parse_arguments(int argc, char *argv[])
    {
        CliConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--config")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--config requires a file path");
                }
                config.config_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--buffer-size")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--buffer-size requires a value (bytes)");
                }
                config.buffer_size = parse_size(arg, argv[index++]);
            }
            else if (arg == "--history")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--history requires a value (entries)");
                }
                config.history_size = parse_size(arg, argv[index++]);
            }
            else if (arg == "--verify")
            {
                config.verify = true;
            }
            else if (arg == "--no-preserve")
            {
                config.no_preserve = true;
            }
            else if (arg == "--verbose")
            {
                config.verbose = true;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg +
                                         "\nUsage: fileq [--config <file>] [--log <file>] [--buffer-size N] "
                                         "[--verify] [--no-preserve] [--history N] [--verbose]");
            }
        }
        return config;
    }

    QueueSettings resolve_settings(const CliConfig &config)
    {
        QueueSettings settings = config.config_path ? load_settings(*config.config_path) : QueueSettings{};
        if (config.buffer_size)
        {
            settings.buffer_size = *config.buffer_size;
        }
        if (config.history_size)
        {
            settings.max_history_size = *config.history_size;
        }
        if (config.verify)
        {
            settings.verify_after_copy = true;
        }
        if (config.no_preserve)
        {
            settings.preserve_timestamps = false;
            settings.preserve_attributes = false;
        }
        validate(settings);
        return settings;
    }

} // namespace fileq::cli
