#include "fileq/engine/estimator.hpp"

#include <algorithm>

namespace fileq::engine
{

    Estimator::Estimator(const Filesystem &filesystem, std::shared_ptr<spdlog::logger> logger)
        : filesystem_(filesystem), logger_(std::move(logger)) {}

    SizeEstimate Estimator::estimate(const std::vector<std::filesystem::path> &paths) const
    {
        SizeEstimate total{};
        std::vector<FileMetadata> ancestors;
        for (const auto &path : paths)
        {
            accumulate(path, total, ancestors);
        }
        return total;
    }

    SizeEstimate Estimator::estimate(const std::filesystem::path &path) const
    {
        SizeEstimate total{};
        std::vector<FileMetadata> ancestors;
        accumulate(path, total, ancestors);
        return total;
    }

    void Estimator::accumulate(const std::filesystem::path &path, SizeEstimate &estimate,
                               std::vector<FileMetadata> &ancestors) const
    {
        FileMetadata metadata;
        try
        {
            metadata = filesystem_.stat(path);
        }
        catch (const FilesystemError &ex)
        {
            logger_->warn("Skipping {} while estimating: {}", path.string(), ex.what());
            return;
        }

        if (!metadata.is_directory)
        {
            estimate.total_bytes += metadata.size;
            ++estimate.total_files;
            return;
        }
        if (std::any_of(ancestors.begin(), ancestors.end(), [&](const FileMetadata &ancestor)
                        { return ancestor.same_entry(metadata); }))
        {
            logger_->warn("Skipping {} while estimating: links back to a parent directory", path.string());
            return;
        }

        std::vector<std::filesystem::path> children;
        try
        {
            children = filesystem_.list_directory(path);
        }
        catch (const FilesystemError &ex)
        {
            logger_->warn("Skipping contents of {} while estimating: {}", path.string(), ex.what());
            return;
        }
        ancestors.push_back(metadata);
        for (const auto &child : children)
        {
            accumulate(child, estimate, ancestors);
        }
        ancestors.pop_back();
    }

} // namespace fileq::engine
