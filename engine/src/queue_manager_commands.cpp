#include "fileq/engine/queue_manager.hpp"

#include <algorithm>

namespace fileq::engine
{

    Operation QueueManager::enqueue(OperationKind kind, std::vector<std::filesystem::path> sources,
                                    std::optional<std::filesystem::path> destination, std::optional<bool> permanent)
    {
        if (sources.empty())
        {
            throw QueueError(fileq::ErrorCode::InvalidArgument, "At least one source path is required");
        }
        if (kind != OperationKind::Delete && (!destination || destination->empty()))
        {
            throw QueueError(fileq::ErrorCode::InvalidArgument,
                             std::string(to_string(kind)) + " requires a destination");
        }
        if (kind == OperationKind::Delete)
        {
            destination.reset();
        }

        const auto estimate = estimator_.estimate(sources);

        Operation snapshot;
        {
            std::lock_guard lock(mutex_);
            Operation operation;
            operation.id = generate_id_locked();
            operation.kind = kind;
            operation.sources = std::move(sources);
            operation.destination = std::move(destination);
            operation.total_bytes = estimate.total_bytes;
            operation.total_files = estimate.total_files;
            operation.status = OperationStatus::Queued;
            operation.priority = static_cast<int>(pending_.size());
            operation.created_at = Clock::now();
            if (kind == OperationKind::Delete)
            {
                operation.tags["permanent"] = permanent.value_or(!settings_.use_recycle_bin);
            }
            const auto id = operation.id;
            operations_.emplace(id, std::move(operation));
            insert_by_priority_locked(id);
            snapshot = operations_.at(id);
        }
        state_changed_.notify_all();

        services_.logger->info("Queued {} operation {} ({} files, {} bytes)", to_string(kind), snapshot.id,
                               snapshot.total_files, snapshot.total_bytes);
        emit_progress(snapshot);
        return snapshot;
    }

    Operation QueueManager::enqueue_copy(std::vector<std::filesystem::path> sources, std::filesystem::path destination)
    {
        return enqueue(OperationKind::Copy, std::move(sources), std::move(destination));
    }

    Operation QueueManager::enqueue_move(std::vector<std::filesystem::path> sources, std::filesystem::path destination)
    {
        return enqueue(OperationKind::Move, std::move(sources), std::move(destination));
    }

    Operation QueueManager::enqueue_delete(std::vector<std::filesystem::path> paths, std::optional<bool> permanent)
    {
        return enqueue(OperationKind::Delete, std::move(paths), std::nullopt, permanent);
    }

    void QueueManager::pause(const std::string &id)
    {
        Operation snapshot;
        {
            std::lock_guard lock(mutex_);
            auto *operation = find_locked(id);
            if (!operation || operation->status != OperationStatus::Running)
            {
                services_.logger->debug("Ignoring pause for {}", id);
                return;
            }
            operation->status = OperationStatus::Paused;
            snapshot = *operation;
        }
        state_changed_.notify_all();
        services_.logger->info("Paused operation {}", id);
        emit_progress(snapshot);
    }

    void QueueManager::resume(const std::string &id)
    {
        Operation snapshot;
        {
            std::lock_guard lock(mutex_);
            auto *operation = find_locked(id);
            if (!operation || operation->status != OperationStatus::Paused)
            {
                services_.logger->debug("Ignoring resume for {}", id);
                return;
            }
            operation->status = OperationStatus::Queued;
            snapshot = *operation;
        }
        state_changed_.notify_all();
        services_.logger->info("Resumed operation {}", id);
        emit_progress(snapshot);
    }

    void QueueManager::cancel(const std::string &id)
    {
        std::optional<CompletionEvent> completion;
        Operation snapshot;
        {
            std::lock_guard lock(mutex_);
            auto *operation = find_locked(id);
            if (!operation || operation->is_terminal())
            {
                services_.logger->debug("Ignoring cancel for {}", id);
                return;
            }
            operation->status = OperationStatus::Cancelled;
            operation->completed_at = Clock::now();
            operation->pending_conflict.reset();
            if (current_ != id)
            {
                // Never started: it leaves the queue here instead of through the worker.
                remove_pending_locked(id);
                completion = CompletionEvent{*operation, false, operation->processed_files, 0};
                file_history_locked(id);
            }
            else
            {
                snapshot = *operation;
            }
        }
        state_changed_.notify_all();
        services_.logger->info("Cancelled operation {}", id);
        if (completion)
        {
            emit_completion(*completion);
        }
        else
        {
            emit_progress(snapshot);
        }
    }

    void QueueManager::retry(const std::string &id)
    {
        Operation snapshot;
        {
            std::lock_guard lock(mutex_);
            auto *operation = find_locked(id);
            if (!operation || current_ == id ||
                (operation->status != OperationStatus::Failed && operation->status != OperationStatus::Cancelled))
            {
                services_.logger->debug("Ignoring retry for {}", id);
                return;
            }
            history_.erase(std::remove(history_.begin(), history_.end(), id), history_.end());

            operation->processed_bytes = 0;
            operation->processed_files = 0;
            operation->current_file.clear();
            operation->speed_bytes_per_second = 0;
            operation->estimated_remaining = std::chrono::milliseconds{0};
            operation->error_message.reset();
            operation->pending_conflict.reset();
            operation->resolution.reset();
            operation->started_at.reset();
            operation->completed_at.reset();
            operation->status = OperationStatus::Queued;
            insert_by_priority_locked(id);
            snapshot = *operation;
        }
        state_changed_.notify_all();
        services_.logger->info("Retrying operation {}", id);
        emit_progress(snapshot);
    }

    void QueueManager::resolve_conflict(const std::string &id, ConflictResolution resolution)
    {
        Operation snapshot;
        {
            std::lock_guard lock(mutex_);
            auto *operation = find_locked(id);
            if (!operation || operation->status != OperationStatus::Conflict)
            {
                services_.logger->debug("Ignoring conflict resolution for {}", id);
                return;
            }
            operation->pending_conflict.reset();
            operation->resolution = resolution;
            operation->status = OperationStatus::Queued;
            snapshot = *operation;
        }
        state_changed_.notify_all();
        services_.logger->info("Resolved conflict for {} with {}", id, to_string(resolution));
        emit_progress(snapshot);
    }

    void QueueManager::change_priority(const std::string &id, int new_position)
    {
        {
            std::lock_guard lock(mutex_);
            const auto it = std::find(pending_.begin(), pending_.end(), id);
            if (it == pending_.end() || new_position < 0 || new_position >= static_cast<int>(pending_.size()))
            {
                services_.logger->debug("Ignoring priority change for {} to {}", id, new_position);
                return;
            }
            pending_.erase(it);
            pending_.insert(pending_.begin() + new_position, id);
            renumber_locked();
        }
        state_changed_.notify_all();
        services_.logger->info("Moved operation {} to position {}", id, new_position);
    }

    void QueueManager::pause_all()
    {
        std::vector<std::string> ids;
        {
            std::lock_guard lock(mutex_);
            ids = pending_;
        }
        for (const auto &id : ids)
        {
            pause(id);
        }
    }

    void QueueManager::resume_all()
    {
        std::vector<std::string> ids;
        {
            std::lock_guard lock(mutex_);
            ids = pending_;
        }
        for (const auto &id : ids)
        {
            resume(id);
        }
    }

    void QueueManager::cancel_all()
    {
        std::vector<std::string> ids;
        {
            std::lock_guard lock(mutex_);
            for (const auto &id : pending_)
            {
                if (id != current_)
                {
                    ids.push_back(id);
                }
            }
            // Last, so the worker cannot pick up a queued entry once the running one unwinds.
            if (current_)
            {
                ids.push_back(*current_);
            }
        }
        for (const auto &id : ids)
        {
            cancel(id);
        }
    }

    std::optional<Operation> QueueManager::find(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        const auto *operation = find_locked(id);
        if (!operation)
        {
            return std::nullopt;
        }
        return *operation;
    }

    std::optional<Operation> QueueManager::current() const
    {
        std::lock_guard lock(mutex_);
        if (!current_)
        {
            return std::nullopt;
        }
        return operations_.at(*current_);
    }

    std::vector<Operation> QueueManager::pending() const
    {
        std::lock_guard lock(mutex_);
        std::vector<Operation> result;
        result.reserve(pending_.size());
        for (const auto &id : pending_)
        {
            result.push_back(operations_.at(id));
        }
        return result;
    }

    std::vector<Operation> QueueManager::operations_by_status(OperationStatus status) const
    {
        std::lock_guard lock(mutex_);
        std::vector<Operation> result;
        for (const auto &id : pending_)
        {
            const auto &operation = operations_.at(id);
            if (operation.status == status)
            {
                result.push_back(operation);
            }
        }
        for (const auto &id : history_)
        {
            const auto &operation = operations_.at(id);
            if (operation.status == status)
            {
                result.push_back(operation);
            }
        }
        return result;
    }

    std::optional<std::chrono::milliseconds> QueueManager::estimated_time_remaining(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        const auto *operation = find_locked(id);
        if (!operation || operation->speed_bytes_per_second <= 0)
        {
            return std::nullopt;
        }
        return operation->estimated_remaining;
    }

    std::vector<Operation> QueueManager::history(std::size_t count) const
    {
        std::vector<Operation> result;
        {
            std::lock_guard lock(mutex_);
            result.reserve(history_.size());
            for (const auto &id : history_)
            {
                result.push_back(operations_.at(id));
            }
        }
        std::stable_sort(result.begin(), result.end(), [](const Operation &lhs, const Operation &rhs)
                         { return lhs.completed_at.value_or(TimePoint{}) > rhs.completed_at.value_or(TimePoint{}); });
        if (result.size() > count)
        {
            result.resize(count);
        }
        return result;
    }

    void QueueManager::clear_history()
    {
        std::lock_guard lock(mutex_);
        for (const auto &id : history_)
        {
            operations_.erase(id);
        }
        services_.logger->info("Cleared {} history entries", history_.size());
        history_.clear();
    }

    Statistics QueueManager::statistics() const
    {
        std::lock_guard lock(mutex_);
        Statistics stats{};
        double completed_seconds = 0;
        const auto count = [&](const Operation &operation)
        {
            ++stats.total_operations;
            switch (operation.status)
            {
            case OperationStatus::Queued:
                ++stats.queued_operations;
                break;
            case OperationStatus::Running:
                ++stats.running_operations;
                break;
            case OperationStatus::Paused:
                ++stats.paused_operations;
                break;
            case OperationStatus::Conflict:
                ++stats.conflict_operations;
                break;
            case OperationStatus::Completed:
                ++stats.completed_operations;
                stats.total_bytes_transferred += operation.processed_bytes;
                if (operation.started_at && operation.completed_at)
                {
                    completed_seconds +=
                        std::chrono::duration<double>(*operation.completed_at - *operation.started_at).count();
                }
                break;
            case OperationStatus::Failed:
                ++stats.failed_operations;
                break;
            case OperationStatus::Cancelled:
                ++stats.cancelled_operations;
                break;
            }
            if (operation.started_at && operation.completed_at)
            {
                stats.total_operation_time += std::chrono::duration_cast<std::chrono::milliseconds>(
                    *operation.completed_at - *operation.started_at);
            }
        };
        for (const auto &id : pending_)
        {
            count(operations_.at(id));
        }
        for (const auto &id : history_)
        {
            count(operations_.at(id));
        }
        if (completed_seconds > 0)
        {
            stats.average_speed_bytes_per_second = static_cast<double>(stats.total_bytes_transferred) / completed_seconds;
        }
        return stats;
    }

    void QueueManager::set_settings(QueueSettings settings)
    {
        validate(settings);
        std::lock_guard lock(mutex_);
        settings_ = std::move(settings);
        while (history_.size() > settings_.max_history_size)
        {
            operations_.erase(history_.front());
            history_.pop_front();
        }
        services_.logger->info("Settings updated (buffer {} bytes, verify {})", settings_.buffer_size,
                               settings_.verify_after_copy);
    }

    QueueSettings QueueManager::settings() const
    {
        std::lock_guard lock(mutex_);
        return settings_;
    }

} // namespace fileq::engine
