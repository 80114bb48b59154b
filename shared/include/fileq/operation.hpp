/**
 * fileq - Operation records, conflict descriptions and queue statistics.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace fileq
{

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    enum class OperationKind : std::uint8_t
    {
        Copy,
        Move,
        Delete
    };

    std::string_view to_string(OperationKind kind) noexcept;
    std::optional<OperationKind> operation_kind_from_string(std::string_view value) noexcept;

    enum class OperationStatus : std::uint8_t
    {
        Queued,
        Running,
        Paused,
        Conflict,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(OperationStatus status) noexcept;
    std::optional<OperationStatus> operation_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(OperationStatus status) noexcept
    {
        return status == OperationStatus::Completed || status == OperationStatus::Failed ||
               status == OperationStatus::Cancelled;
    }

    enum class ConflictKind : std::uint8_t
    {
        FileExists,
        FolderExists
    };

    std::string_view to_string(ConflictKind kind) noexcept;

    enum class ConflictResolution : std::uint8_t
    {
        Prompt,
        Skip,
        SkipAll,
        Overwrite,
        OverwriteAll,
        OverwriteIfNewer,
        OverwriteIfNewerAll,
        Rename,
        RenameAll,
        Cancel
    };

    std::string_view to_string(ConflictResolution resolution) noexcept;
    std::optional<ConflictResolution> conflict_resolution_from_string(std::string_view value) noexcept;

    // True for the *All variants, which stay in effect for the rest of a run.
    bool is_sticky(ConflictResolution resolution) noexcept;

    // Maps a *All variant to its single-entry counterpart; other values are returned unchanged.
    ConflictResolution single_entry(ConflictResolution resolution) noexcept;

    struct ConflictInfo
    {
        std::filesystem::path source_path;
        std::filesystem::path destination_path;
        std::uint64_t source_size{};
        std::uint64_t destination_size{};
        TimePoint source_modified{};
        TimePoint destination_modified{};
        ConflictKind kind{ConflictKind::FileExists};
        ConflictResolution recommended{ConflictResolution::Skip};
    };

    void to_json(nlohmann::json &json, const ConflictInfo &info);

    struct Operation
    {
        std::string id;
        OperationKind kind{OperationKind::Copy};
        std::vector<std::filesystem::path> sources;
        std::optional<std::filesystem::path> destination;

        std::uint64_t total_bytes{};
        std::uint64_t processed_bytes{};
        std::uint64_t total_files{};
        std::uint64_t processed_files{};
        std::filesystem::path current_file;
        double speed_bytes_per_second{};
        std::chrono::milliseconds estimated_remaining{};

        OperationStatus status{OperationStatus::Queued};
        int priority{};
        TimePoint created_at{};
        std::optional<TimePoint> started_at;
        std::optional<TimePoint> completed_at;
        std::optional<std::string> error_message;
        std::optional<ConflictInfo> pending_conflict;
        std::optional<ConflictResolution> resolution;
        nlohmann::json tags{nlohmann::json::object()};

        bool is_terminal() const noexcept { return fileq::is_terminal(status); }
        bool is_permanent_delete() const;
        int percent_complete() const noexcept;
        std::chrono::milliseconds elapsed(TimePoint now = Clock::now()) const;
    };

    void to_json(nlohmann::json &json, const Operation &operation);

    struct ProgressEvent
    {
        Operation operation;
    };

    struct CompletionEvent
    {
        Operation operation;
        bool success{};
        std::uint64_t files_processed{};
        std::uint64_t files_failed{};
    };

    struct Statistics
    {
        std::size_t total_operations{};
        std::size_t queued_operations{};
        std::size_t running_operations{};
        std::size_t paused_operations{};
        std::size_t conflict_operations{};
        std::size_t completed_operations{};
        std::size_t failed_operations{};
        std::size_t cancelled_operations{};
        std::uint64_t total_bytes_transferred{};
        double average_speed_bytes_per_second{};
        std::chrono::milliseconds total_operation_time{};
    };

    void to_json(nlohmann::json &json, const Statistics &statistics);

    std::string format_speed(double bytes_per_second);
    std::string format_duration(std::chrono::milliseconds duration);

    std::uint64_t to_unix_time(TimePoint time);

} // namespace fileq
