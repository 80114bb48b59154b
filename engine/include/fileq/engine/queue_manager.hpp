#pragma once

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "fileq/engine/estimator.hpp"
#include "fileq/engine/executor.hpp"
#include "fileq/engine/filesystem.hpp"
#include "fileq/engine/trash.hpp"
#include "fileq/error_codes.hpp"
#include "fileq/operation.hpp"
#include "fileq/settings.hpp"

namespace fileq::engine
{

    class QueueError : public std::runtime_error
    {
    public:
        QueueError(fileq::ErrorCode code, std::string message);

        fileq::ErrorCode code() const noexcept { return code_; }

    private:
        fileq::ErrorCode code_;
    };

    struct QueueServices
    {
        std::shared_ptr<Filesystem> filesystem;
        std::shared_ptr<Trash> trash;
        std::shared_ptr<spdlog::logger> logger;
    };

    using ProgressHandler = std::function<void(const ProgressEvent &)>;
    using CompletionHandler = std::function<void(const CompletionEvent &)>;
    using SubscriptionId = std::uint64_t;

    /**
     * Background queue of copy, move and delete operations. One worker thread runs at most one
     * operation at a time, in ascending priority order. Callers refer to operations by id and
     * receive snapshots; all mutation happens under the manager's lock.
     *
     * Control calls on operations in the wrong state are ignored. Cancelling a running copy
     * does not remove what was already written to the destination.
     */
    class QueueManager
    {
    public:
        QueueManager(QueueServices services, QueueSettings settings);
        ~QueueManager();

        QueueManager(const QueueManager &) = delete;
        QueueManager &operator=(const QueueManager &) = delete;

        // Throws QueueError(InvalidArgument) for an empty source list or a missing Copy/Move destination.
        // A Delete without an explicit permanent flag follows settings().use_recycle_bin.
        Operation enqueue(OperationKind kind, std::vector<std::filesystem::path> sources,
                          std::optional<std::filesystem::path> destination = std::nullopt,
                          std::optional<bool> permanent = std::nullopt);
        Operation enqueue_copy(std::vector<std::filesystem::path> sources, std::filesystem::path destination);
        Operation enqueue_move(std::vector<std::filesystem::path> sources, std::filesystem::path destination);
        Operation enqueue_delete(std::vector<std::filesystem::path> paths, std::optional<bool> permanent = std::nullopt);

        void pause(const std::string &id);
        void resume(const std::string &id);
        void cancel(const std::string &id);
        void retry(const std::string &id);
        void resolve_conflict(const std::string &id, ConflictResolution resolution);
        void change_priority(const std::string &id, int new_position);

        void pause_all();
        void resume_all();
        void cancel_all();

        std::optional<Operation> find(const std::string &id) const;
        std::optional<Operation> current() const;
        std::vector<Operation> pending() const;
        std::vector<Operation> operations_by_status(OperationStatus status) const;
        std::optional<std::chrono::milliseconds> estimated_time_remaining(const std::string &id) const;

        // Most recently completed first.
        std::vector<Operation> history(std::size_t count = 50) const;
        void clear_history();

        Statistics statistics() const;

        // Throws ConfigError for invalid settings. Applies to operations started afterwards.
        void set_settings(QueueSettings settings);
        QueueSettings settings() const;

        SubscriptionId subscribe_progress(ProgressHandler handler);
        SubscriptionId subscribe_completion(CompletionHandler handler);
        void unsubscribe(SubscriptionId id);

        // Stops dequeuing, cancels the running operation and joins the worker. Safe to call twice.
        void shutdown();

    private:
        class Control;
        friend class Control;

        void process_queue();
        void finish_operation(const std::string &id, const ExecutionResult &result, bool cancelled,
                              const std::optional<std::string> &failure);

        Operation *find_locked(const std::string &id);
        const Operation *find_locked(const std::string &id) const;
        std::optional<std::string> next_queued_locked() const;
        void insert_by_priority_locked(const std::string &id);
        void renumber_locked();
        void remove_pending_locked(const std::string &id);
        void file_history_locked(const std::string &id);
        std::string generate_id_locked() const;
        static void update_speed(Operation &operation, TimePoint now);

        void schedule_speed_tick();
        void on_speed_tick();

        void emit_progress(const Operation &snapshot);
        void emit_completion(const CompletionEvent &event);

        QueueServices services_;
        Estimator estimator_;
        Executor executor_;

        mutable std::mutex mutex_;
        std::condition_variable state_changed_;
        std::unordered_map<std::string, Operation> operations_;
        std::vector<std::string> pending_;
        std::deque<std::string> history_;
        std::optional<std::string> current_;
        QueueSettings settings_;
        bool stopping_{false};

        std::mutex subscribers_mutex_;
        SubscriptionId next_subscription_{1};
        std::map<SubscriptionId, ProgressHandler> progress_handlers_;
        std::map<SubscriptionId, CompletionHandler> completion_handlers_;

        asio::io_context timer_context_;
        asio::steady_timer speed_timer_;
        std::thread timer_thread_;
        std::thread worker_;
        std::once_flag shutdown_once_;
    };

} // namespace fileq::engine
