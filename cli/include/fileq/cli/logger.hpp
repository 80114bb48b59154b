#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

namespace fileq::cli
{

    // Console sink shows warnings only unless verbose; the optional file sink gets everything from info up.
    std::shared_ptr<spdlog::logger> make_logger(const std::optional<std::filesystem::path> &path, bool verbose);

} // namespace fileq::cli
