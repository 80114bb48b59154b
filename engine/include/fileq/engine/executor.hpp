#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include <spdlog/logger.h>

#include "fileq/engine/filesystem.hpp"
#include "fileq/engine/operation_control.hpp"
#include "fileq/engine/trash.hpp"
#include "fileq/operation.hpp"
#include "fileq/settings.hpp"

namespace fileq::engine
{

    // Immutable inputs for one execution run.
    struct ExecutionRequest
    {
        OperationKind kind{OperationKind::Copy};
        std::vector<std::filesystem::path> sources;
        std::optional<std::filesystem::path> destination;
        bool permanent{};
        QueueSettings settings;
    };

    struct ExecutionResult
    {
        std::uint64_t files_failed{};
    };

    // Thrown to unwind a run once the operation is cancelled. Partial output is left in place.
    class OperationCancelled : public std::runtime_error
    {
    public:
        OperationCancelled() : std::runtime_error("Operation cancelled") {}
    };

    class Executor
    {
    public:
        Executor(std::shared_ptr<Filesystem> filesystem, std::shared_ptr<Trash> trash,
                 std::shared_ptr<spdlog::logger> logger);

        /**
         * Performs the request, reporting through control. Copy and Move failures propagate as
         * exceptions (FilesystemError for I/O and verification problems); Delete failures are
         * per path and only counted in the result. Throws OperationCancelled when cancelled.
         */
        ExecutionResult run(const ExecutionRequest &request, OperationControl &control);

    private:
        std::shared_ptr<Filesystem> filesystem_;
        std::shared_ptr<Trash> trash_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace fileq::engine
