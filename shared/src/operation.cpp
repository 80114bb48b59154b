#include "fileq/operation.hpp"

#include <array>
#include <cstdio>

namespace fileq
{

    namespace
    {

        struct KindMapping
        {
            OperationKind kind;
            std::string_view label;
        };

        constexpr std::array<KindMapping, 3> kKindMappings{{
            {OperationKind::Copy, "COPY"},
            {OperationKind::Move, "MOVE"},
            {OperationKind::Delete, "DELETE"},
        }};

        struct StatusMapping
        {
            OperationStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 7> kStatusMappings{{
            {OperationStatus::Queued, "QUEUED"},
            {OperationStatus::Running, "RUNNING"},
            {OperationStatus::Paused, "PAUSED"},
            {OperationStatus::Conflict, "CONFLICT"},
            {OperationStatus::Completed, "COMPLETED"},
            {OperationStatus::Failed, "FAILED"},
            {OperationStatus::Cancelled, "CANCELLED"},
        }};

        struct ResolutionMapping
        {
            ConflictResolution resolution;
            std::string_view label;
        };

        constexpr std::array<ResolutionMapping, 10> kResolutionMappings{{
            {ConflictResolution::Prompt, "PROMPT"},
            {ConflictResolution::Skip, "SKIP"},
            {ConflictResolution::SkipAll, "SKIP_ALL"},
            {ConflictResolution::Overwrite, "OVERWRITE"},
            {ConflictResolution::OverwriteAll, "OVERWRITE_ALL"},
            {ConflictResolution::OverwriteIfNewer, "OVERWRITE_IF_NEWER"},
            {ConflictResolution::OverwriteIfNewerAll, "OVERWRITE_IF_NEWER_ALL"},
            {ConflictResolution::Rename, "RENAME"},
            {ConflictResolution::RenameAll, "RENAME_ALL"},
            {ConflictResolution::Cancel, "CANCEL"},
        }};

    } // namespace

    std::string_view to_string(OperationKind kind) noexcept
    {
        for (const auto &mapping : kKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<OperationKind> operation_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kKindMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(OperationStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<OperationStatus> operation_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ConflictKind kind) noexcept
    {
        return kind == ConflictKind::FolderExists ? "FOLDER_EXISTS" : "FILE_EXISTS";
    }

    std::string_view to_string(ConflictResolution resolution) noexcept
    {
        for (const auto &mapping : kResolutionMappings)
        {
            if (mapping.resolution == resolution)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ConflictResolution> conflict_resolution_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResolutionMappings)
        {
            if (mapping.label == value)
            {
                return mapping.resolution;
            }
        }
        return std::nullopt;
    }

    bool is_sticky(ConflictResolution resolution) noexcept
    {
        return resolution == ConflictResolution::SkipAll || resolution == ConflictResolution::OverwriteAll ||
               resolution == ConflictResolution::OverwriteIfNewerAll || resolution == ConflictResolution::RenameAll;
    }

    ConflictResolution single_entry(ConflictResolution resolution) noexcept
    {
        switch (resolution)
        {
        case ConflictResolution::SkipAll:
            return ConflictResolution::Skip;
        case ConflictResolution::OverwriteAll:
            return ConflictResolution::Overwrite;
        case ConflictResolution::OverwriteIfNewerAll:
            return ConflictResolution::OverwriteIfNewer;
        case ConflictResolution::RenameAll:
            return ConflictResolution::Rename;
        default:
            return resolution;
        }
    }

    bool Operation::is_permanent_delete() const
    {
        return kind == OperationKind::Delete && tags.value("permanent", false);
    }

    int Operation::percent_complete() const noexcept
    {
        if (total_bytes == 0)
        {
            return 0;
        }
        return static_cast<int>(processed_bytes * 100 / total_bytes);
    }

    std::chrono::milliseconds Operation::elapsed(TimePoint now) const
    {
        if (!started_at)
        {
            return std::chrono::milliseconds{0};
        }
        const auto end = completed_at.value_or(now);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end - *started_at);
    }

    std::uint64_t to_unix_time(TimePoint time)
    {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        return seconds < 0 ? 0 : static_cast<std::uint64_t>(seconds);
    }

    void to_json(nlohmann::json &json, const ConflictInfo &info)
    {
        json = {
            {"source_path", info.source_path.generic_string()},
            {"destination_path", info.destination_path.generic_string()},
            {"source_size", info.source_size},
            {"destination_size", info.destination_size},
            {"source_modified", to_unix_time(info.source_modified)},
            {"destination_modified", to_unix_time(info.destination_modified)},
            {"kind", to_string(info.kind)},
            {"recommended", to_string(info.recommended)},
        };
    }

    void to_json(nlohmann::json &json, const Operation &operation)
    {
        nlohmann::json sources = nlohmann::json::array();
        for (const auto &source : operation.sources)
        {
            sources.push_back(source.generic_string());
        }

        json = {
            {"id", operation.id},
            {"kind", to_string(operation.kind)},
            {"status", to_string(operation.status)},
            {"priority", operation.priority},
            {"sources", std::move(sources)},
            {"total_bytes", operation.total_bytes},
            {"processed_bytes", operation.processed_bytes},
            {"total_files", operation.total_files},
            {"processed_files", operation.processed_files},
            {"speed_bytes_per_second", operation.speed_bytes_per_second},
            {"estimated_remaining_ms", operation.estimated_remaining.count()},
            {"created_at", to_unix_time(operation.created_at)},
            {"tags", operation.tags},
        };
        if (operation.destination)
        {
            json["destination"] = operation.destination->generic_string();
        }
        if (!operation.current_file.empty())
        {
            json["current_file"] = operation.current_file.generic_string();
        }
        if (operation.started_at)
        {
            json["started_at"] = to_unix_time(*operation.started_at);
        }
        if (operation.completed_at)
        {
            json["completed_at"] = to_unix_time(*operation.completed_at);
        }
        if (operation.error_message)
        {
            json["error"] = *operation.error_message;
        }
        if (operation.pending_conflict)
        {
            json["conflict"] = *operation.pending_conflict;
        }
    }

    void to_json(nlohmann::json &json, const Statistics &statistics)
    {
        json = {
            {"total", statistics.total_operations},
            {"queued", statistics.queued_operations},
            {"running", statistics.running_operations},
            {"paused", statistics.paused_operations},
            {"conflict", statistics.conflict_operations},
            {"completed", statistics.completed_operations},
            {"failed", statistics.failed_operations},
            {"cancelled", statistics.cancelled_operations},
            {"bytes_transferred", statistics.total_bytes_transferred},
            {"average_speed_bytes_per_second", statistics.average_speed_bytes_per_second},
            {"total_operation_time_ms", statistics.total_operation_time.count()},
        };
    }

    std::string format_speed(double bytes_per_second)
    {
        constexpr double kKiB = 1024.0;
        char buffer[32];
        if (bytes_per_second < kKiB)
        {
            std::snprintf(buffer, sizeof(buffer), "%.0f B/s", bytes_per_second);
        }
        else if (bytes_per_second < kKiB * kKiB)
        {
            std::snprintf(buffer, sizeof(buffer), "%.1f KB/s", bytes_per_second / kKiB);
        }
        else if (bytes_per_second < kKiB * kKiB * kKiB)
        {
            std::snprintf(buffer, sizeof(buffer), "%.1f MB/s", bytes_per_second / (kKiB * kKiB));
        }
        else
        {
            std::snprintf(buffer, sizeof(buffer), "%.2f GB/s", bytes_per_second / (kKiB * kKiB * kKiB));
        }
        return buffer;
    }

    std::string format_duration(std::chrono::milliseconds duration)
    {
        const auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
        const auto days = total_seconds / 86400;
        const auto hours = (total_seconds / 3600) % 24;
        const auto minutes = (total_seconds / 60) % 60;
        const auto seconds = total_seconds % 60;
        if (total_seconds < 60)
        {
            return std::to_string(seconds) + "s";
        }
        if (total_seconds < 3600)
        {
            return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
        }
        if (total_seconds < 86400)
        {
            return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
        }
        return std::to_string(days) + "d " + std::to_string(hours) + "h";
    }

} // namespace fileq
