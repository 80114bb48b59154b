#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

#include "fileq/engine/filesystem.hpp"
#include "fileq/engine/operation_control.hpp"
#include "fileq/operation.hpp"

namespace fileq::engine
{

    /**
     * Decides what happens to a source entry whose destination already exists. One resolver
     * lives for one execution run, so *All choices stick to that run only.
     */
    class ConflictResolver
    {
    public:
        ConflictResolver(const Filesystem &filesystem, ConflictResolution default_resolution,
                         std::shared_ptr<spdlog::logger> logger);

        ConflictInfo describe(const std::filesystem::path &source, const std::filesystem::path &destination) const;

        // Returns Skip, Overwrite, Rename or Cancel; std::nullopt when the operation was cancelled while waiting.
        std::optional<ConflictResolution> resolve(OperationControl &control, const std::filesystem::path &source,
                                                  const std::filesystem::path &destination);

        // First free "stem (N)ext" sibling of destination.
        std::filesystem::path unique_name(const std::filesystem::path &destination) const;

    private:
        ConflictResolution apply(ConflictResolution choice, const ConflictInfo &conflict) const;

        const Filesystem &filesystem_;
        ConflictResolution default_resolution_;
        std::optional<ConflictResolution> sticky_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace fileq::engine
