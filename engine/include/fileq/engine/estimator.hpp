#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/logger.h>

#include "fileq/engine/filesystem.hpp"

namespace fileq::engine
{

    struct SizeEstimate
    {
        std::uint64_t total_bytes{};
        std::uint64_t total_files{};

        SizeEstimate &operator+=(const SizeEstimate &other)
        {
            total_bytes += other.total_bytes;
            total_files += other.total_files;
            return *this;
        }
    };

    /**
     * Walks a path set and sums file sizes and counts. Entries that cannot be read are
     * logged and left out of the totals; the walk itself never fails. A directory link
     * back to one of its own ancestors is not descended into.
     */
    class Estimator
    {
    public:
        Estimator(const Filesystem &filesystem, std::shared_ptr<spdlog::logger> logger);

        SizeEstimate estimate(const std::vector<std::filesystem::path> &paths) const;
        SizeEstimate estimate(const std::filesystem::path &path) const;

    private:
        void accumulate(const std::filesystem::path &path, SizeEstimate &estimate,
                        std::vector<FileMetadata> &ancestors) const;

        const Filesystem &filesystem_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace fileq::engine
