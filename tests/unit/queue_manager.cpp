#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include "fileq/engine/queue_manager.hpp"

using namespace fileq;
using namespace fileq::engine;

namespace
{

    constexpr auto kTimeout = std::chrono::seconds(20);

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    template <typename Predicate>
    bool wait_until(Predicate predicate)
    {
        const auto deadline = std::chrono::steady_clock::now() + kTimeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

    bool has_status(const QueueManager &manager, const std::string &id, OperationStatus status)
    {
        const auto operation = manager.find(id);
        return operation && operation->status == status;
    }

    Operation wait_terminal(const QueueManager &manager, const std::string &id)
    {
        std::optional<Operation> operation;
        const bool done = wait_until([&]
                                     {
            operation = manager.find(id);
            return operation && operation->is_terminal(); });
        assert(done);
        return *operation;
    }

    // Owns a scratch directory, a captured log and the services a manager needs.
    struct Fixture
    {
        explicit Fixture(const std::string &name, std::shared_ptr<Filesystem> filesystem = nullptr)
            : root(std::filesystem::temp_directory_path() / ("fileq_queue_" + name)),
              sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)),
              logger(std::make_shared<spdlog::logger>(name, sink))
        {
            cleanup_path(root);
            std::filesystem::create_directories(root);
            logger->set_pattern("[%l] %v");
            logger->set_level(spdlog::level::debug);
            services.filesystem = filesystem ? std::move(filesystem) : std::make_shared<LocalFilesystem>();
            services.trash = std::make_shared<FreedesktopTrash>(services.filesystem, root / "Trash", logger);
            services.logger = logger;
        }

        ~Fixture()
        {
            cleanup_path(root);
        }

        bool log_contains(const std::string &needle) const
        {
            const auto lines = sink->last_formatted();
            return std::any_of(lines.begin(), lines.end(), [&](const std::string &line)
                               { return line.find(needle) != std::string::npos; });
        }

        std::filesystem::path root;
        std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
        std::shared_ptr<spdlog::logger> logger;
        QueueServices services;
    };

    QueueSettings small_buffer_settings(std::size_t buffer_size)
    {
        QueueSettings settings;
        settings.buffer_size = buffer_size;
        return settings;
    }

    // Fails every write to a file named b.txt until switched off.
    class FlakyFilesystem : public LocalFilesystem
    {
    public:
        std::unique_ptr<std::ostream> open_write(const std::filesystem::path &path,
                                                 std::size_t buffer_size) const override
        {
            if (failing && path.filename() == "b.txt")
            {
                throw FilesystemError(ErrorCode::PermissionDenied, "Unable to create " + path.string());
            }
            return LocalFilesystem::open_write(path, buffer_size);
        }

        std::atomic<bool> failing{true};
    };

    // Reads of anything under the tampered directory come back altered.
    class TamperingFilesystem : public LocalFilesystem
    {
    public:
        explicit TamperingFilesystem(std::filesystem::path tampered) : tampered_(std::move(tampered)) {}

        std::unique_ptr<std::istream> open_read(const std::filesystem::path &path,
                                                std::size_t buffer_size) const override
        {
            if (path.parent_path() == tampered_)
            {
                return std::make_unique<std::istringstream>("bit rot");
            }
            return LocalFilesystem::open_read(path, buffer_size);
        }

    private:
        std::filesystem::path tampered_;
    };

    void test_copy_reports_every_chunk()
    {
        Fixture fixture("copy_chunks");
        for (const auto *name : {"one.bin", "two.bin", "three.bin"})
        {
            write_file(fixture.root / "src" / name, std::string(100, 'q'));
        }

        std::mutex mutex;
        std::vector<std::uint64_t> seen_bytes;
        std::optional<CompletionEvent> completion;
        QueueManager manager(fixture.services, small_buffer_settings(100));
        manager.subscribe_progress([&](const ProgressEvent &event)
                                   {
            std::lock_guard lock(mutex);
            seen_bytes.push_back(event.operation.processed_bytes); });
        manager.subscribe_completion([&](const CompletionEvent &event)
                                     {
            std::lock_guard lock(mutex);
            completion = event; });

        const auto queued = manager.enqueue_copy(
            {fixture.root / "src" / "one.bin", fixture.root / "src" / "two.bin", fixture.root / "src" / "three.bin"},
            fixture.root / "dst");
        assert(queued.status == OperationStatus::Queued);
        assert(queued.total_bytes == 300);
        assert(queued.total_files == 3);
        assert(queued.priority == 0);

        const auto finished = wait_terminal(manager, queued.id);
        assert(finished.status == OperationStatus::Completed);
        assert(finished.processed_bytes == 300);
        assert(finished.processed_files == 3);
        assert(finished.started_at && finished.completed_at);
        assert(!finished.error_message);
        assert(read_file(fixture.root / "dst" / "two.bin") == std::string(100, 'q'));

        assert(wait_until([&]
                          {
            std::lock_guard lock(mutex);
            return completion.has_value(); }));
        std::lock_guard lock(mutex);
        assert(completion->success);
        assert(completion->files_processed == 3);
        assert(completion->files_failed == 0);
        for (const std::uint64_t expected : {100u, 200u, 300u})
        {
            assert(std::find(seen_bytes.begin(), seen_bytes.end(), expected) != seen_bytes.end());
        }
    }

    void test_delete_skips_failed_paths()
    {
        Fixture fixture("delete_partial");
        write_file(fixture.root / "data" / "present.txt", "gone soon");

        QueueManager manager(fixture.services, QueueSettings{});
        const auto queued =
            manager.enqueue_delete({fixture.root / "data" / "present.txt", fixture.root / "data" / "absent.txt"}, true);
        assert(queued.is_permanent_delete());
        assert(queued.total_files == 1);

        const auto finished = wait_terminal(manager, queued.id);
        assert(finished.status == OperationStatus::Completed);
        assert(finished.processed_files == 1);
        assert(!finished.error_message);
        assert(!std::filesystem::exists(fixture.root / "data" / "present.txt"));
        assert(fixture.log_contains("[warning] Failed to delete"));
        assert(fixture.log_contains("absent.txt"));
    }

    void test_delete_uses_recycle_bin_setting()
    {
        Fixture fixture("delete_trash");
        write_file(fixture.root / "data" / "old.log", "log");

        QueueManager manager(fixture.services, QueueSettings{});
        const auto queued = manager.enqueue_delete({fixture.root / "data" / "old.log"});
        assert(!queued.is_permanent_delete());
        const auto finished = wait_terminal(manager, queued.id);
        assert(finished.status == OperationStatus::Completed);
        assert(std::filesystem::exists(fixture.root / "Trash" / "files" / "old.log"));

        auto settings = manager.settings();
        settings.use_recycle_bin = false;
        manager.set_settings(settings);
        assert(manager.enqueue_delete({fixture.root / "data"}).is_permanent_delete());
    }

    void test_move_conflict_round_trip()
    {
        Fixture fixture("move_conflict");
        write_file(fixture.root / "src" / "a.txt", "mine");
        write_file(fixture.root / "dst" / "a.txt", "theirs");

        std::mutex mutex;
        std::vector<OperationStatus> statuses;
        const auto record = [&](OperationStatus status)
        {
            std::lock_guard lock(mutex);
            if (statuses.empty() || statuses.back() != status)
            {
                statuses.push_back(status);
            }
        };
        QueueManager manager(fixture.services, QueueSettings{});
        manager.subscribe_progress([&](const ProgressEvent &event)
                                   { record(event.operation.status); });
        manager.subscribe_completion([&](const CompletionEvent &event)
                                     { record(event.operation.status); });

        const auto queued = manager.enqueue_move({fixture.root / "src" / "a.txt"}, fixture.root / "dst");
        assert(wait_until([&]
                          { return has_status(manager, queued.id, OperationStatus::Conflict); }));

        const auto blocked = *manager.find(queued.id);
        assert(blocked.pending_conflict);
        assert(blocked.pending_conflict->kind == ConflictKind::FileExists);
        assert(blocked.pending_conflict->destination_path == fixture.root / "dst" / "a.txt");
        assert(manager.statistics().conflict_operations == 1);

        manager.resolve_conflict(queued.id, ConflictResolution::Skip);
        const auto finished = wait_terminal(manager, queued.id);
        assert(finished.status == OperationStatus::Completed);
        assert(finished.processed_files == 0);
        assert(!finished.pending_conflict);
        assert(finished.resolution == ConflictResolution::Skip);
        assert(read_file(fixture.root / "src" / "a.txt") == "mine");
        assert(read_file(fixture.root / "dst" / "a.txt") == "theirs");

        assert(wait_until([&]
                          {
            std::lock_guard lock(mutex);
            return !statuses.empty() && statuses.back() == OperationStatus::Completed; }));
        std::lock_guard lock(mutex);
        const std::vector<OperationStatus> expected{OperationStatus::Running, OperationStatus::Conflict,
                                                    OperationStatus::Queued, OperationStatus::Running,
                                                    OperationStatus::Completed};
        assert(std::search(statuses.begin(), statuses.end(), expected.begin(), expected.end()) != statuses.end());
    }

    void test_move_overwrite_counts_entry()
    {
        Fixture fixture("move_overwrite");
        write_file(fixture.root / "src" / "folder" / "x.txt", "12345");
        write_file(fixture.root / "src" / "folder" / "y.txt", "678");
        write_file(fixture.root / "dst" / "folder" / "stale.txt", "old");

        auto settings = QueueSettings{};
        settings.default_conflict_resolution = ConflictResolution::Overwrite;
        QueueManager manager(fixture.services, settings);
        const auto queued = manager.enqueue_move({fixture.root / "src" / "folder"}, fixture.root / "dst");
        const auto finished = wait_terminal(manager, queued.id);
        assert(finished.status == OperationStatus::Completed);
        assert(finished.processed_bytes == finished.total_bytes);
        assert(finished.processed_files == 2);
        assert(!std::filesystem::exists(fixture.root / "src" / "folder"));
        assert(!std::filesystem::exists(fixture.root / "dst" / "folder" / "stale.txt"));
        assert(read_file(fixture.root / "dst" / "folder" / "x.txt") == "12345");
    }

    void test_pause_and_resume_keep_progress()
    {
        Fixture fixture("pause_resume");
        write_file(fixture.root / "src" / "big.bin", std::string(2 * 1024 * 1024, 'p'));

        std::atomic<bool> pause_requested{false};
        QueueManager manager(fixture.services, small_buffer_settings(4096));
        manager.subscribe_progress([&](const ProgressEvent &event)
                                   {
            if (event.operation.status != OperationStatus::Running || event.operation.processed_bytes < 64 * 1024)
            {
                return;
            }
            if (!pause_requested.exchange(true))
            {
                manager.pause(event.operation.id);
            } });

        const auto queued = manager.enqueue_copy({fixture.root / "src" / "big.bin"}, fixture.root / "dst");

        assert(wait_until([&]
                          { return has_status(manager, queued.id, OperationStatus::Paused); }));
        const auto paused = *manager.find(queued.id);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        const auto still_paused = *manager.find(queued.id);
        assert(still_paused.status == OperationStatus::Paused);
        assert(still_paused.processed_bytes == paused.processed_bytes);
        assert(paused.processed_bytes < paused.total_bytes);

        // Pausing twice and resuming a queued operation are ignored.
        manager.pause(queued.id);
        manager.resume(queued.id);
        manager.resume(queued.id);

        std::uint64_t last = paused.processed_bytes;
        bool monotonic = true;
        const bool done = wait_until([&]
                                     {
            const auto snapshot = manager.find(queued.id);
            if (snapshot->processed_bytes < last)
            {
                monotonic = false;
            }
            last = snapshot->processed_bytes;
            return snapshot->is_terminal(); });
        assert(done);
        assert(monotonic);

        const auto finished = *manager.find(queued.id);
        assert(finished.status == OperationStatus::Completed);
        assert(finished.processed_bytes == 2 * 1024 * 1024);
        assert(fixture.log_contains("Ignoring resume"));
    }

    void test_quick_pause_resume_keeps_running()
    {
        Fixture fixture("quick_pause_resume");
        write_file(fixture.root / "src" / "big.bin", std::string(8 * 1024 * 1024, 'r'));

        std::atomic<int> stage{0};
        std::atomic<std::uint64_t> bounced_at{0};
        QueueManager manager(fixture.services, small_buffer_settings(4096));
        manager.subscribe_progress([&](const ProgressEvent &event)
                                   {
            if (event.operation.status != OperationStatus::Running || event.operation.processed_bytes < 64 * 1024)
            {
                return;
            }
            int expected = 0;
            if (stage.compare_exchange_strong(expected, 1))
            {
                // Both land before the next chunk.
                bounced_at = event.operation.processed_bytes;
                manager.pause(event.operation.id);
                manager.resume(event.operation.id);
                return;
            }
            expected = 1;
            if (stage.compare_exchange_strong(expected, 2))
            {
                manager.pause(event.operation.id);
            } });

        const auto queued = manager.enqueue_copy({fixture.root / "src" / "big.bin"}, fixture.root / "dst");

        // A second pause only takes effect if the operation went back to Running.
        assert(wait_until([&]
                          { return stage == 2 && has_status(manager, queued.id, OperationStatus::Paused); }));
        const auto paused = *manager.find(queued.id);
        assert(paused.processed_bytes >= bounced_at);
        assert(paused.processed_bytes < paused.total_bytes);
        const auto stats = manager.statistics();
        assert(stats.paused_operations == 1);
        assert(stats.queued_operations == 0);

        manager.resume(queued.id);
        const auto finished = wait_terminal(manager, queued.id);
        assert(finished.status == OperationStatus::Completed);
        assert(finished.processed_bytes == 8 * 1024 * 1024);
    }

    void test_cancel_queued_never_runs()
    {
        Fixture fixture("cancel_queued");
        write_file(fixture.root / "src" / "a.txt", "a");
        write_file(fixture.root / "dst" / "a.txt", "existing");
        write_file(fixture.root / "other" / "b.txt", "b");

        std::atomic<int> completions{0};
        QueueManager manager(fixture.services, QueueSettings{});
        manager.subscribe_completion([&](const CompletionEvent &)
                                     { ++completions; });

        const auto blocker = manager.enqueue_move({fixture.root / "src" / "a.txt"}, fixture.root / "dst");
        const auto waiting = manager.enqueue_copy({fixture.root / "other" / "b.txt"}, fixture.root / "copies");
        assert(waiting.priority == 1);
        assert(wait_until([&]
                          { return has_status(manager, blocker.id, OperationStatus::Conflict); }));

        manager.cancel(waiting.id);
        const auto cancelled = *manager.find(waiting.id);
        assert(cancelled.status == OperationStatus::Cancelled);
        assert(!cancelled.started_at);
        assert(cancelled.completed_at);
        assert(manager.pending().size() == 1);
        assert(manager.history().size() == 1);
        assert(!std::filesystem::exists(fixture.root / "copies"));

        // Cancelling a terminal operation changes nothing.
        manager.cancel(waiting.id);
        assert(completions == 1);

        manager.cancel(blocker.id);
        const auto unwound = wait_terminal(manager, blocker.id);
        assert(unwound.status == OperationStatus::Cancelled);
        assert(!unwound.pending_conflict);
        assert(read_file(fixture.root / "src" / "a.txt") == "a");
        assert(wait_until([&]
                          { return completions == 2; }));
        assert(!manager.current());
    }

    void test_priorities_stay_contiguous()
    {
        Fixture fixture("priorities");
        write_file(fixture.root / "src" / "a.txt", "a");
        write_file(fixture.root / "dst" / "a.txt", "existing");

        QueueManager manager(fixture.services, QueueSettings{});
        const auto blocker = manager.enqueue_move({fixture.root / "src" / "a.txt"}, fixture.root / "dst");
        assert(wait_until([&]
                          { return has_status(manager, blocker.id, OperationStatus::Conflict); }));

        std::vector<std::string> ids;
        for (int i = 0; i < 3; ++i)
        {
            ids.push_back(manager.enqueue_delete({fixture.root / ("nothing" + std::to_string(i))}, true).id);
        }

        const auto check_contiguous = [&]
        {
            const auto pending = manager.pending();
            for (std::size_t i = 0; i < pending.size(); ++i)
            {
                assert(pending[i].priority == static_cast<int>(i));
            }
            return pending;
        };

        manager.change_priority(ids[2], 1);
        auto pending = check_contiguous();
        assert(pending.size() == 4);
        assert(pending[1].id == ids[2]);
        assert(pending[2].id == ids[0]);

        manager.change_priority(ids[0], 3);
        pending = check_contiguous();
        assert(pending[3].id == ids[0]);

        manager.change_priority(ids[1], 9);
        manager.change_priority(ids[1], -1);
        manager.change_priority("no-such-id", 0);
        const auto unchanged = check_contiguous();
        for (std::size_t i = 0; i < pending.size(); ++i)
        {
            assert(unchanged[i].id == pending[i].id);
        }

        // The running operation is never preempted by reordering.
        manager.change_priority(ids[1], 0);
        check_contiguous();
        assert(manager.current()->id == blocker.id);

        manager.cancel_all();
        for (const auto &id : ids)
        {
            assert(wait_terminal(manager, id).status == OperationStatus::Cancelled);
        }
        assert(wait_terminal(manager, blocker.id).status == OperationStatus::Cancelled);
        assert(manager.pending().empty());
    }

    void test_single_runner()
    {
        Fixture fixture("single_runner");
        for (int i = 0; i < 5; ++i)
        {
            write_file(fixture.root / "src" / ("f" + std::to_string(i) + ".bin"), std::string(8192, 'r'));
        }

        std::atomic<bool> overlap{false};
        QueueManager manager(fixture.services, small_buffer_settings(512));
        manager.subscribe_progress([&](const ProgressEvent &)
                                   {
            if (manager.statistics().running_operations > 1 ||
                manager.operations_by_status(OperationStatus::Running).size() > 1)
            {
                overlap = true;
            } });

        std::vector<std::string> ids;
        for (int i = 0; i < 5; ++i)
        {
            const auto name = "f" + std::to_string(i) + ".bin";
            ids.push_back(manager.enqueue_copy({fixture.root / "src" / name}, fixture.root / ("dst" + std::to_string(i))).id);
        }
        for (const auto &id : ids)
        {
            assert(wait_terminal(manager, id).status == OperationStatus::Completed);
        }
        assert(!overlap);

        // Strict priority order: each finished no later than the next one started.
        const auto history = manager.history(10);
        assert(history.size() == 5);
        assert(history.front().id == ids.back());
        for (std::size_t i = 0; i + 1 < ids.size(); ++i)
        {
            const auto earlier = *manager.find(ids[i]);
            const auto later = *manager.find(ids[i + 1]);
            assert(*earlier.completed_at <= *later.started_at);
        }

        const auto stats = manager.statistics();
        assert(stats.completed_operations == 5);
        assert(stats.total_bytes_transferred == 5 * 8192);
        assert(stats.running_operations == 0);
    }

    void test_retry_after_failure()
    {
        auto flaky = std::make_shared<FlakyFilesystem>();
        Fixture fixture("retry", flaky);
        write_file(fixture.root / "src" / "a.txt", std::string(30, 'a'));
        write_file(fixture.root / "src" / "b.txt", std::string(20, 'b'));

        auto settings = QueueSettings{};
        settings.default_conflict_resolution = ConflictResolution::Overwrite;
        std::mutex mutex;
        std::vector<CompletionEvent> completions;
        QueueManager manager(fixture.services, settings);
        manager.subscribe_completion([&](const CompletionEvent &event)
                                     {
            std::lock_guard lock(mutex);
            completions.push_back(event); });

        const auto queued =
            manager.enqueue_copy({fixture.root / "src" / "a.txt", fixture.root / "src" / "b.txt"}, fixture.root / "dst");
        const auto failed = wait_terminal(manager, queued.id);
        assert(failed.status == OperationStatus::Failed);
        assert(failed.error_message && failed.error_message->find("b.txt") != std::string::npos);
        assert(failed.processed_files == 1);
        assert(fixture.log_contains("[error] Operation " + queued.id + " failed"));
        assert(manager.statistics().failed_operations == 1);

        assert(wait_until([&]
                          {
            std::lock_guard lock(mutex);
            return completions.size() == 1; }));
        {
            std::lock_guard lock(mutex);
            assert(!completions[0].success);
            assert(completions[0].files_failed == 1);
        }

        // With the cause gone, a retry starts over from zero.
        flaky->failing = false;
        manager.retry(queued.id);
        const auto retried = wait_terminal(manager, queued.id);
        assert(retried.status == OperationStatus::Completed);
        assert(retried.processed_bytes == retried.total_bytes);
        assert(retried.processed_files == 2);
        assert(!retried.error_message);
        assert(read_file(fixture.root / "dst" / "b.txt") == std::string(20, 'b'));
        assert(manager.history().size() == 1);

        manager.retry(queued.id);
        assert(manager.find(queued.id)->status == OperationStatus::Completed);
    }

    void test_verification_failure()
    {
        const auto root = std::filesystem::temp_directory_path() / "fileq_queue_verify";
        Fixture fixture("verify", std::make_shared<TamperingFilesystem>(root / "dst"));
        write_file(fixture.root / "src" / "payload.bin", "precious bytes");

        auto settings = QueueSettings{};
        settings.verify_after_copy = true;
        QueueManager manager(fixture.services, settings);
        const auto queued = manager.enqueue_copy({fixture.root / "src" / "payload.bin"}, fixture.root / "dst");
        const auto finished = wait_terminal(manager, queued.id);
        assert(finished.status == OperationStatus::Failed);
        assert(finished.error_message && finished.error_message->find("Verification failed") != std::string::npos);
    }

    void test_history_and_validation()
    {
        Fixture fixture("history");
        auto settings = QueueSettings{};
        settings.max_history_size = 2;
        QueueManager manager(fixture.services, settings);

        std::vector<std::string> ids;
        for (int i = 0; i < 3; ++i)
        {
            const auto id = manager.enqueue_delete({fixture.root / ("missing" + std::to_string(i))}, true).id;
            wait_terminal(manager, id);
            ids.push_back(id);
        }
        auto history = manager.history();
        assert(history.size() == 2);
        assert(history[0].id == ids[2]);
        assert(history[1].id == ids[1]);
        assert(!manager.find(ids[0]));
        assert(manager.history(1).size() == 1);
        assert(manager.statistics().total_operations == 2);

        manager.clear_history();
        assert(manager.history().empty());
        assert(!manager.find(ids[2]));

        bool caught = false;
        try
        {
            manager.enqueue_copy({}, fixture.root / "dst");
        }
        catch (const QueueError &ex)
        {
            caught = ex.code() == ErrorCode::InvalidArgument;
        }
        assert(caught);

        caught = false;
        try
        {
            manager.enqueue(OperationKind::Move, {fixture.root / "src"});
        }
        catch (const QueueError &ex)
        {
            caught = ex.code() == ErrorCode::InvalidArgument;
        }
        assert(caught);

        caught = false;
        try
        {
            auto invalid = manager.settings();
            invalid.buffer_size = 0;
            manager.set_settings(invalid);
        }
        catch (const ConfigError &)
        {
            caught = true;
        }
        assert(caught);
        assert(manager.settings().buffer_size == 64 * 1024);

        assert(!manager.estimated_time_remaining("unknown").has_value());
        assert(manager.operations_by_status(OperationStatus::Queued).empty());
    }

    void test_shutdown_cancels_blocked_operation()
    {
        Fixture fixture("shutdown");
        write_file(fixture.root / "src" / "a.txt", "a");
        write_file(fixture.root / "dst" / "a.txt", "existing");

        QueueManager manager(fixture.services, QueueSettings{});
        const auto blocker = manager.enqueue_move({fixture.root / "src" / "a.txt"}, fixture.root / "dst");
        assert(wait_until([&]
                          { return has_status(manager, blocker.id, OperationStatus::Conflict); }));

        manager.shutdown();
        manager.shutdown();
        assert(manager.find(blocker.id)->status == OperationStatus::Cancelled);
        assert(read_file(fixture.root / "dst" / "a.txt") == "existing");
    }

} // namespace

void run_queue_manager_tests()
{
    test_copy_reports_every_chunk();
    test_delete_skips_failed_paths();
    test_delete_uses_recycle_bin_setting();
    test_move_conflict_round_trip();
    test_move_overwrite_counts_entry();
    test_pause_and_resume_keep_progress();
    test_quick_pause_resume_keeps_running();
    test_cancel_queued_never_runs();
    test_priorities_stay_contiguous();
    test_single_runner();
    test_retry_after_failure();
    test_verification_failure();
    test_history_and_validation();
    test_shutdown_cancels_blocked_operation();
}
