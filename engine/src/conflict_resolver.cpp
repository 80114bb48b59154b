#include "fileq/engine/conflict_resolver.hpp"

namespace fileq::engine
{

    ConflictResolver::ConflictResolver(const Filesystem &filesystem, ConflictResolution default_resolution,
                                       std::shared_ptr<spdlog::logger> logger)
        : filesystem_(filesystem), default_resolution_(default_resolution), logger_(std::move(logger)) {}

    ConflictInfo ConflictResolver::describe(const std::filesystem::path &source,
                                            const std::filesystem::path &destination) const
    {
        const auto source_meta = filesystem_.stat(source);
        const auto destination_meta = filesystem_.stat(destination);

        ConflictInfo conflict{};
        conflict.source_path = source;
        conflict.destination_path = destination;
        conflict.source_size = source_meta.size;
        conflict.destination_size = destination_meta.size;
        conflict.source_modified = source_meta.times.modified;
        conflict.destination_modified = destination_meta.times.modified;
        conflict.kind = destination_meta.is_directory ? ConflictKind::FolderExists : ConflictKind::FileExists;
        conflict.recommended = source_meta.times.modified > destination_meta.times.modified
                                   ? ConflictResolution::Overwrite
                                   : ConflictResolution::Skip;
        return conflict;
    }

    std::optional<ConflictResolution> ConflictResolver::resolve(OperationControl &control,
                                                                const std::filesystem::path &source,
                                                                const std::filesystem::path &destination)
    {
        const auto conflict = describe(source, destination);
        if (sticky_)
        {
            return apply(*sticky_, conflict);
        }

        ConflictResolution choice = default_resolution_;
        if (choice == ConflictResolution::Prompt)
        {
            logger_->info("Destination {} already exists, waiting for a resolution", destination.string());
            const auto supplied = control.await_resolution(conflict);
            if (!supplied)
            {
                return std::nullopt;
            }
            choice = *supplied == ConflictResolution::Prompt ? conflict.recommended : *supplied;
        }

        if (is_sticky(choice))
        {
            sticky_ = single_entry(choice);
        }
        return apply(single_entry(choice), conflict);
    }

    ConflictResolution ConflictResolver::apply(ConflictResolution choice, const ConflictInfo &conflict) const
    {
        if (choice == ConflictResolution::OverwriteIfNewer)
        {
            return conflict.source_modified > conflict.destination_modified ? ConflictResolution::Overwrite
                                                                            : ConflictResolution::Skip;
        }
        return choice;
    }

    std::filesystem::path ConflictResolver::unique_name(const std::filesystem::path &destination) const
    {
        const auto parent = destination.parent_path();
        const auto stem = destination.stem().string();
        const auto extension = destination.extension().string();
        for (int index = 1;; ++index)
        {
            auto candidate = parent / (stem + " (" + std::to_string(index) + ")" + extension);
            if (!filesystem_.exists(candidate))
            {
                return candidate;
            }
        }
    }

} // namespace fileq::engine
