#include <cstdlib>
#include <iostream>
#include <utility>

#include <spdlog/spdlog.h>

#include "fileq/cli/config.hpp"
#include "fileq/cli/logger.hpp"
#include "fileq/cli/shell.hpp"
#include "fileq/version.hpp"

int main(int argc, char *argv[])
{
    try
    {
        const auto config = fileq::cli::parse_arguments(argc, argv);
        auto logger = fileq::cli::make_logger(config.log_path, config.verbose);
        auto settings = fileq::cli::resolve_settings(config);
        logger->info("Starting fileq {}", fileq::version());
        std::cout << "fileq " << fileq::version() << " - type HELP for commands" << std::endl;

        fileq::cli::Shell shell(std::move(settings), logger);
        return shell.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
