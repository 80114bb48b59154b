#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include "fileq/operation.hpp"

namespace fileq::engine
{

    /**
     * The executor's view of the operation it is running. The queue manager implements it
     * so that every progress or status change goes through its lock.
     */
    class OperationControl
    {
    public:
        virtual ~OperationControl() = default;

        virtual OperationStatus status() const = 0;

        virtual void set_current_file(const std::filesystem::path &path) = 0;

        // Advances the counters and publishes a progress event.
        virtual void add_progress(std::uint64_t bytes, std::uint64_t files) = 0;

        // Blocks while the operation is Paused. Returns false if it was cancelled instead of resumed.
        virtual bool wait_while_paused() = 0;

        // Puts the operation in Conflict and blocks until a resolution arrives.
        // Returns std::nullopt if the operation is cancelled while waiting.
        virtual std::optional<ConflictResolution> await_resolution(const ConflictInfo &conflict) = 0;
    };

} // namespace fileq::engine
