#include "fileq/engine/queue_manager.hpp"

#include <algorithm>
#include <random>
#include <sstream>

#include <spdlog/spdlog.h>

namespace fileq::engine
{

    namespace
    {
        constexpr auto kIdleInterval = std::chrono::milliseconds(100);
        constexpr auto kPollInterval = std::chrono::milliseconds(100);
        constexpr auto kSpeedInterval = std::chrono::seconds(1);

        QueueServices with_defaults(QueueServices services)
        {
            if (!services.logger)
            {
                services.logger = spdlog::default_logger();
            }
            if (!services.filesystem)
            {
                services.filesystem = std::make_shared<LocalFilesystem>();
            }
            if (!services.trash)
            {
                services.trash = std::make_shared<FreedesktopTrash>(services.filesystem, FreedesktopTrash::default_root(),
                                                                    services.logger);
            }
            return services;
        }

    } // namespace

    QueueError::QueueError(fileq::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    // Bridges the executor to one operation in the table. Every call takes the manager lock.
    class QueueManager::Control : public OperationControl
    {
    public:
        Control(QueueManager &manager, std::string id) : manager_(manager), id_(std::move(id)) {}

        OperationStatus status() const override
        {
            std::lock_guard lock(manager_.mutex_);
            return manager_.operations_.at(id_).status;
        }

        void set_current_file(const std::filesystem::path &path) override
        {
            std::lock_guard lock(manager_.mutex_);
            manager_.operations_.at(id_).current_file = path;
        }

        void add_progress(std::uint64_t bytes, std::uint64_t files) override
        {
            Operation snapshot;
            {
                std::lock_guard lock(manager_.mutex_);
                auto &operation = manager_.operations_.at(id_);
                operation.processed_bytes += bytes;
                operation.processed_files += files;
                update_speed(operation, Clock::now());
                snapshot = operation;
            }
            manager_.emit_progress(snapshot);
        }

        bool wait_while_paused() override
        {
            std::unique_lock lock(manager_.mutex_);
            auto &operation = manager_.operations_.at(id_);
            while (operation.status == OperationStatus::Paused)
            {
                manager_.state_changed_.wait_for(lock, kPollInterval);
            }
            return resume_running(lock, operation);
        }

        std::optional<ConflictResolution> await_resolution(const ConflictInfo &conflict) override
        {
            std::unique_lock lock(manager_.mutex_);
            auto &operation = manager_.operations_.at(id_);
            if (operation.status == OperationStatus::Cancelled)
            {
                return std::nullopt;
            }
            operation.pending_conflict = conflict;
            operation.resolution.reset();
            operation.status = OperationStatus::Conflict;
            Operation snapshot = operation;
            lock.unlock();
            manager_.emit_progress(snapshot);

            lock.lock();
            while (operation.status == OperationStatus::Conflict)
            {
                manager_.state_changed_.wait_for(lock, kPollInterval);
            }
            operation.pending_conflict.reset();
            const auto choice = operation.resolution.value_or(conflict.recommended);
            if (!resume_running(lock, operation))
            {
                return std::nullopt;
            }
            return choice;
        }

    private:
        // Turns a resumed (Queued) operation back into Running. Returns false if it was cancelled.
        bool resume_running(std::unique_lock<std::mutex> &lock, Operation &operation)
        {
            if (operation.status == OperationStatus::Cancelled)
            {
                return false;
            }
            if (operation.status == OperationStatus::Queued)
            {
                operation.status = OperationStatus::Running;
                Operation snapshot = operation;
                lock.unlock();
                manager_.emit_progress(snapshot);
                lock.lock();
            }
            return true;
        }

        QueueManager &manager_;
        std::string id_;
    };

    QueueManager::QueueManager(QueueServices services, QueueSettings settings)
        : services_(with_defaults(std::move(services))),
          estimator_(*services_.filesystem, services_.logger),
          executor_(services_.filesystem, services_.trash, services_.logger),
          settings_(std::move(settings)),
          speed_timer_(timer_context_)
    {
        validate(settings_);
        schedule_speed_tick();
        timer_thread_ = std::thread([this]
                                    { timer_context_.run(); });
        worker_ = std::thread([this]
                              { process_queue(); });
        services_.logger->debug("Operation queue started (buffer {} bytes, history {})", settings_.buffer_size,
                                settings_.max_history_size);
    }

    QueueManager::~QueueManager()
    {
        shutdown();
    }

    void QueueManager::shutdown()
    {
        std::call_once(shutdown_once_, [this]
                       {
            {
                std::lock_guard lock(mutex_);
                stopping_ = true;
                if (current_)
                {
                    auto &operation = operations_.at(*current_);
                    if (!operation.is_terminal())
                    {
                        operation.status = OperationStatus::Cancelled;
                        operation.completed_at = Clock::now();
                    }
                }
            }
            state_changed_.notify_all();
            if (worker_.joinable())
            {
                worker_.join();
            }
            timer_context_.stop();
            if (timer_thread_.joinable())
            {
                timer_thread_.join();
            }
            services_.logger->debug("Operation queue stopped"); });
    }

    void QueueManager::process_queue()
    {
        for (;;)
        {
            std::string id;
            ExecutionRequest request;
            Operation started;
            {
                std::unique_lock lock(mutex_);
                state_changed_.wait_for(lock, kIdleInterval, [this]
                                        { return stopping_ || next_queued_locked().has_value(); });
                if (stopping_)
                {
                    return;
                }
                const auto next = next_queued_locked();
                if (!next)
                {
                    continue;
                }
                id = *next;
                auto &operation = operations_.at(id);
                operation.status = OperationStatus::Running;
                operation.started_at = Clock::now();
                current_ = id;
                request.kind = operation.kind;
                request.sources = operation.sources;
                request.destination = operation.destination;
                request.permanent = operation.is_permanent_delete();
                request.settings = settings_;
                started = operation;
            }

            services_.logger->info("Starting {} operation {} ({} files, {} bytes)", to_string(started.kind), id,
                                   started.total_files, started.total_bytes);
            emit_progress(started);

            Control control(*this, id);
            ExecutionResult result{};
            bool cancelled = false;
            std::optional<std::string> failure;
            try
            {
                result = executor_.run(request, control);
            }
            catch (const OperationCancelled &)
            {
                cancelled = true;
            }
            catch (const std::exception &ex)
            {
                failure = ex.what();
            }
            finish_operation(id, result, cancelled, failure);
        }
    }

    void QueueManager::finish_operation(const std::string &id, const ExecutionResult &result, bool cancelled,
                                        const std::optional<std::string> &failure)
    {
        CompletionEvent event{};
        {
            std::lock_guard lock(mutex_);
            auto &operation = operations_.at(id);
            const auto now = Clock::now();
            if (cancelled || operation.status == OperationStatus::Cancelled)
            {
                operation.status = OperationStatus::Cancelled;
                operation.completed_at = operation.completed_at.value_or(now);
            }
            else if (failure)
            {
                operation.status = OperationStatus::Failed;
                operation.error_message = *failure;
                operation.completed_at = now;
            }
            else
            {
                operation.status = OperationStatus::Completed;
                operation.completed_at = now;
            }
            operation.pending_conflict.reset();
            operation.current_file.clear();
            update_speed(operation, *operation.completed_at);
            operation.estimated_remaining = std::chrono::milliseconds{0};

            remove_pending_locked(id);
            current_.reset();

            event.operation = operation;
            event.success = operation.status == OperationStatus::Completed;
            event.files_processed = operation.processed_files;
            event.files_failed = operation.status == OperationStatus::Failed &&
                                         operation.total_files > operation.processed_files
                                     ? operation.total_files - operation.processed_files
                                     : 0;
            file_history_locked(id);
        }
        state_changed_.notify_all();

        const auto &operation = event.operation;
        switch (operation.status)
        {
        case OperationStatus::Completed:
            services_.logger->info("Completed operation {} in {} ms ({} of {} files)", id,
                                   operation.elapsed().count(), operation.processed_files, operation.total_files);
            if (result.files_failed > 0)
            {
                services_.logger->warn("Operation {} skipped {} entries that could not be deleted", id,
                                       result.files_failed);
            }
            break;
        case OperationStatus::Failed:
            services_.logger->error("Operation {} failed: {}", id, operation.error_message.value_or("unknown error"));
            break;
        default:
            services_.logger->info("Operation {} cancelled", id);
            break;
        }
        emit_completion(event);
    }

    Operation *QueueManager::find_locked(const std::string &id)
    {
        const auto it = operations_.find(id);
        return it == operations_.end() ? nullptr : &it->second;
    }

    const Operation *QueueManager::find_locked(const std::string &id) const
    {
        const auto it = operations_.find(id);
        return it == operations_.end() ? nullptr : &it->second;
    }

    std::optional<std::string> QueueManager::next_queued_locked() const
    {
        if (current_)
        {
            return std::nullopt;
        }
        for (const auto &id : pending_)
        {
            if (operations_.at(id).status == OperationStatus::Queued)
            {
                return id;
            }
        }
        return std::nullopt;
    }

    void QueueManager::insert_by_priority_locked(const std::string &id)
    {
        const int priority = operations_.at(id).priority;
        const auto position = std::find_if(pending_.begin(), pending_.end(), [&](const std::string &other)
                                           { return operations_.at(other).priority > priority; });
        pending_.insert(position, id);
        renumber_locked();
    }

    void QueueManager::renumber_locked()
    {
        for (std::size_t index = 0; index < pending_.size(); ++index)
        {
            operations_.at(pending_[index]).priority = static_cast<int>(index);
        }
    }

    void QueueManager::remove_pending_locked(const std::string &id)
    {
        pending_.erase(std::remove(pending_.begin(), pending_.end(), id), pending_.end());
        renumber_locked();
    }

    void QueueManager::file_history_locked(const std::string &id)
    {
        history_.push_back(id);
        while (history_.size() > settings_.max_history_size)
        {
            operations_.erase(history_.front());
            history_.pop_front();
        }
    }

    std::string QueueManager::generate_id_locked() const
    {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<std::uint64_t> dist;
        for (;;)
        {
            std::ostringstream oss;
            oss << std::hex << dist(rng);
            auto id = oss.str();
            if (!operations_.contains(id))
            {
                return id;
            }
        }
    }

    void QueueManager::update_speed(Operation &operation, TimePoint now)
    {
        if (!operation.started_at)
        {
            return;
        }
        const auto seconds = std::chrono::duration<double>(now - *operation.started_at).count();
        if (seconds > 0)
        {
            operation.speed_bytes_per_second = static_cast<double>(operation.processed_bytes) / seconds;
        }
        if (operation.speed_bytes_per_second > 0 && operation.total_bytes > operation.processed_bytes)
        {
            const auto remaining = static_cast<double>(operation.total_bytes - operation.processed_bytes);
            operation.estimated_remaining = std::chrono::milliseconds(
                static_cast<std::int64_t>(remaining / operation.speed_bytes_per_second * 1000.0));
        }
        else
        {
            operation.estimated_remaining = std::chrono::milliseconds{0};
        }
    }

    void QueueManager::schedule_speed_tick()
    {
        speed_timer_.expires_after(kSpeedInterval);
        speed_timer_.async_wait([this](const std::error_code &ec)
                                {
            if (ec)
            {
                return;
            }
            on_speed_tick();
            schedule_speed_tick(); });
    }

    void QueueManager::on_speed_tick()
    {
        std::optional<Operation> snapshot;
        {
            std::lock_guard lock(mutex_);
            if (current_)
            {
                auto &operation = operations_.at(*current_);
                if (operation.status == OperationStatus::Running)
                {
                    update_speed(operation, Clock::now());
                    snapshot = operation;
                }
            }
        }
        if (snapshot)
        {
            emit_progress(*snapshot);
        }
    }

    void QueueManager::emit_progress(const Operation &snapshot)
    {
        std::vector<ProgressHandler> handlers;
        {
            std::lock_guard lock(subscribers_mutex_);
            for (const auto &[id, handler] : progress_handlers_)
            {
                handlers.push_back(handler);
            }
        }
        const ProgressEvent event{snapshot};
        for (const auto &handler : handlers)
        {
            handler(event);
        }
    }

    void QueueManager::emit_completion(const CompletionEvent &event)
    {
        std::vector<CompletionHandler> handlers;
        {
            std::lock_guard lock(subscribers_mutex_);
            for (const auto &[id, handler] : completion_handlers_)
            {
                handlers.push_back(handler);
            }
        }
        for (const auto &handler : handlers)
        {
            handler(event);
        }
    }

    SubscriptionId QueueManager::subscribe_progress(ProgressHandler handler)
    {
        std::lock_guard lock(subscribers_mutex_);
        const auto id = next_subscription_++;
        progress_handlers_.emplace(id, std::move(handler));
        return id;
    }

    SubscriptionId QueueManager::subscribe_completion(CompletionHandler handler)
    {
        std::lock_guard lock(subscribers_mutex_);
        const auto id = next_subscription_++;
        completion_handlers_.emplace(id, std::move(handler));
        return id;
    }

    void QueueManager::unsubscribe(SubscriptionId id)
    {
        std::lock_guard lock(subscribers_mutex_);
        progress_handlers_.erase(id);
        completion_handlers_.erase(id);
    }

} // namespace fileq::engine
