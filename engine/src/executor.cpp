#include "fileq/engine/executor.hpp"

#include <algorithm>
#include <string>

#include "fileq/crypto.hpp"
#include "fileq/engine/conflict_resolver.hpp"
#include "fileq/engine/estimator.hpp"

namespace fileq::engine
{

    namespace
    {

        std::filesystem::path entry_name(const std::filesystem::path &source)
        {
            auto normal = source.lexically_normal();
            if (normal.filename().empty())
            {
                normal = normal.parent_path();
            }
            return normal.filename();
        }

        bool is_within(const std::filesystem::path &candidate, const std::filesystem::path &root)
        {
            const auto relative = std::filesystem::absolute(candidate).lexically_normal().lexically_relative(
                std::filesystem::absolute(root).lexically_normal());
            return !relative.empty() && *relative.begin() != "..";
        }

        class ExecutionJob
        {
        public:
            ExecutionJob(Filesystem &filesystem, Trash &trash, const std::shared_ptr<spdlog::logger> &logger,
                         const ExecutionRequest &request, OperationControl &control)
                : filesystem_(filesystem),
                  trash_(trash),
                  logger_(logger),
                  request_(request),
                  control_(control),
                  estimator_(filesystem, logger),
                  resolver_(filesystem, request.settings.default_conflict_resolution, logger),
                  buffer_(request.settings.buffer_size == 0 ? 1 : request.settings.buffer_size) {}

            ExecutionResult run()
            {
                switch (request_.kind)
                {
                case OperationKind::Copy:
                    run_copy();
                    break;
                case OperationKind::Move:
                    run_move();
                    break;
                case OperationKind::Delete:
                    run_delete();
                    break;
                }
                return result_;
            }

        private:
            // Called before every chunk write and before every top-level entry.
            void checkpoint()
            {
                const auto status = control_.status();
                if (status == OperationStatus::Cancelled)
                {
                    throw OperationCancelled();
                }
                // Queued here means paused and resumed since the last checkpoint.
                if ((status == OperationStatus::Paused || status == OperationStatus::Queued) &&
                    !control_.wait_while_paused())
                {
                    throw OperationCancelled();
                }
            }

            // Returns the path to write to, or std::nullopt when the entry is skipped.
            std::optional<std::filesystem::path> settle_conflict(const std::filesystem::path &source,
                                                                 const std::filesystem::path &destination,
                                                                 bool replace_directories)
            {
                const auto choice = resolver_.resolve(control_, source, destination);
                if (!choice || *choice == ConflictResolution::Cancel)
                {
                    throw OperationCancelled();
                }
                switch (*choice)
                {
                case ConflictResolution::Skip:
                    logger_->info("Skipping {}: destination {} exists", source.string(), destination.string());
                    return std::nullopt;
                case ConflictResolution::Rename:
                    return resolver_.unique_name(destination);
                case ConflictResolution::Overwrite:
                    if (replace_directories || filesystem_.stat(destination).is_directory)
                    {
                        filesystem_.remove(destination, true);
                    }
                    return destination;
                default:
                    return destination;
                }
            }

            void run_copy()
            {
                const auto &destination_root = *request_.destination;
                filesystem_.create_directories(destination_root);
                for (const auto &source : request_.sources)
                {
                    checkpoint();
                    if (!filesystem_.exists(source))
                    {
                        logger_->warn("Skipping missing source {}", source.string());
                        continue;
                    }
                    const auto target = destination_root / entry_name(source);
                    if (filesystem_.stat(source).is_directory)
                    {
                        if (is_within(target, source))
                        {
                            throw FilesystemError(fileq::ErrorCode::InvalidArgument,
                                                  "Cannot copy " + source.string() + " into itself");
                        }
                        copy_directory(source, target);
                    }
                    else
                    {
                        copy_file(source, target);
                    }
                }
            }

            void copy_directory(const std::filesystem::path &source, const std::filesystem::path &destination)
            {
                checkpoint();
                FileMetadata source_meta;
                std::vector<std::filesystem::path> children;
                try
                {
                    source_meta = filesystem_.stat(source);
                    children = filesystem_.list_directory(source);
                }
                catch (const FilesystemError &ex)
                {
                    logger_->warn("Skipping directory {}: {}", source.string(), ex.what());
                    return;
                }
                if (std::any_of(ancestors_.begin(), ancestors_.end(), [&](const FileMetadata &ancestor)
                                { return ancestor.same_entry(source_meta); }))
                {
                    logger_->warn("Skipping directory {}: links back to a parent directory", source.string());
                    return;
                }

                if (filesystem_.exists(destination) && !filesystem_.stat(destination).is_directory)
                {
                    throw FilesystemError(fileq::ErrorCode::AlreadyExists,
                                          "Cannot copy directory " + source.string() + " over file " +
                                              destination.string());
                }
                filesystem_.create_directories(destination);

                std::sort(children.begin(), children.end());
                std::vector<std::filesystem::path> subdirectories;
                for (const auto &child : children)
                {
                    bool child_is_directory = false;
                    try
                    {
                        child_is_directory = filesystem_.stat(child).is_directory;
                    }
                    catch (const FilesystemError &ex)
                    {
                        logger_->warn("Skipping {}: {}", child.string(), ex.what());
                        continue;
                    }
                    if (child_is_directory)
                    {
                        subdirectories.push_back(child);
                    }
                    else
                    {
                        copy_file(child, destination / child.filename());
                    }
                }
                ancestors_.push_back(source_meta);
                for (const auto &subdirectory : subdirectories)
                {
                    copy_directory(subdirectory, destination / subdirectory.filename());
                }
                ancestors_.pop_back();

                if (request_.settings.preserve_attributes)
                {
                    filesystem_.set_permissions(destination, source_meta.permissions);
                }
            }

            void copy_file(const std::filesystem::path &source, const std::filesystem::path &requested_destination)
            {
                control_.set_current_file(source);
                auto destination = requested_destination;
                if (filesystem_.exists(destination))
                {
                    auto settled = settle_conflict(source, destination, false);
                    if (!settled)
                    {
                        return;
                    }
                    destination = *settled;
                }

                const auto source_meta = filesystem_.stat(source);
                {
                    auto input = filesystem_.open_read(source, buffer_.size());
                    auto output = filesystem_.open_write(destination, buffer_.size());
                    for (;;)
                    {
                        input->read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
                        const auto count = input->gcount();
                        if (input->bad())
                        {
                            throw FilesystemError(fileq::ErrorCode::IoError, "Read failed: " + source.string());
                        }
                        if (count <= 0)
                        {
                            break;
                        }
                        checkpoint();
                        output->write(buffer_.data(), count);
                        if (!*output)
                        {
                            throw FilesystemError(fileq::ErrorCode::IoError, "Write failed: " + destination.string());
                        }
                        control_.add_progress(static_cast<std::uint64_t>(count), 0);
                    }
                    output->flush();
                    if (!*output)
                    {
                        throw FilesystemError(fileq::ErrorCode::IoError, "Write failed: " + destination.string());
                    }
                }

                if (request_.settings.preserve_timestamps)
                {
                    filesystem_.set_times(destination, source_meta.times);
                }
                if (request_.settings.preserve_attributes)
                {
                    filesystem_.set_permissions(destination, source_meta.permissions);
                }
                if (request_.settings.verify_after_copy)
                {
                    verify(source, destination);
                }
                control_.add_progress(0, 1);
            }

            void verify(const std::filesystem::path &source, const std::filesystem::path &destination)
            {
                const auto chunk = buffer_.size();
                auto source_stream = filesystem_.open_read(source, chunk);
                auto destination_stream = filesystem_.open_read(destination, chunk);
                const auto source_digest = crypto::hash_stream(*source_stream, chunk);
                const auto destination_digest = crypto::hash_stream(*destination_stream, chunk);
                if (source_digest != destination_digest)
                {
                    throw FilesystemError(fileq::ErrorCode::VerificationFailed,
                                          "Verification failed for " + destination.string() + ": digests differ");
                }
                logger_->debug("Verified {} ({})", destination.string(), destination_digest);
            }

            void run_move()
            {
                const auto &destination_root = *request_.destination;
                filesystem_.create_directories(destination_root);
                for (const auto &source : request_.sources)
                {
                    checkpoint();
                    if (!filesystem_.exists(source))
                    {
                        logger_->warn("Skipping missing source {}", source.string());
                        continue;
                    }
                    control_.set_current_file(source);

                    auto target = destination_root / entry_name(source);
                    const bool source_is_directory = filesystem_.stat(source).is_directory;
                    if (source_is_directory && is_within(target, source))
                    {
                        throw FilesystemError(fileq::ErrorCode::InvalidArgument,
                                              "Cannot move " + source.string() + " into itself");
                    }
                    if (filesystem_.exists(target))
                    {
                        auto settled = settle_conflict(source, target, true);
                        if (!settled)
                        {
                            continue;
                        }
                        target = *settled;
                    }

                    const auto moved = estimator_.estimate(source);
                    filesystem_.move(source, target);
                    control_.add_progress(moved.total_bytes, moved.total_files);
                }
            }

            void run_delete()
            {
                for (const auto &path : request_.sources)
                {
                    checkpoint();
                    control_.set_current_file(path);
                    try
                    {
                        if (!filesystem_.exists(path))
                        {
                            throw FilesystemError(fileq::ErrorCode::NotFound, "No such file or directory");
                        }
                        const auto removed = estimator_.estimate(path);
                        if (request_.permanent)
                        {
                            filesystem_.remove(path, true);
                        }
                        else if (!trash_.send_to_trash(path))
                        {
                            throw FilesystemError(fileq::ErrorCode::IoError, "Unable to move to trash");
                        }
                        control_.add_progress(removed.total_bytes, removed.total_files);
                    }
                    catch (const FilesystemError &ex)
                    {
                        ++result_.files_failed;
                        logger_->warn("Failed to delete {}: {}", path.string(), ex.what());
                    }
                }
            }

            Filesystem &filesystem_;
            Trash &trash_;
            const std::shared_ptr<spdlog::logger> &logger_;
            const ExecutionRequest &request_;
            OperationControl &control_;
            Estimator estimator_;
            ConflictResolver resolver_;
            std::vector<char> buffer_;
            // Directories on the current copy path.
            std::vector<FileMetadata> ancestors_;
            ExecutionResult result_{};
        };

    } // namespace

    Executor::Executor(std::shared_ptr<Filesystem> filesystem, std::shared_ptr<Trash> trash,
                       std::shared_ptr<spdlog::logger> logger)
        : filesystem_(std::move(filesystem)), trash_(std::move(trash)), logger_(std::move(logger)) {}

    ExecutionResult Executor::run(const ExecutionRequest &request, OperationControl &control)
    {
        if (request.kind != OperationKind::Delete && (!request.destination || request.destination->empty()))
        {
            throw FilesystemError(fileq::ErrorCode::InvalidArgument, "Destination is required");
        }
        ExecutionJob job(*filesystem_, *trash_, logger_, request, control);
        return job.run();
    }

} // namespace fileq::engine
