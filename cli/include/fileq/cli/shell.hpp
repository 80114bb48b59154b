#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "fileq/cli/config.hpp"
#include "fileq/engine/queue_manager.hpp"
#include "fileq/operation.hpp"

namespace fileq::cli
{

    /**
     * Line-oriented front end for a QueueManager. Each command answers with "OK" or
     * "ERROR: <code>" on its first line; status changes and conflicts reported by the
     * queue are printed as they happen.
     */
    class Shell
    {
    public:
        Shell(QueueSettings settings, std::shared_ptr<spdlog::logger> logger);
        ~Shell();

        int run();

    private:
        void interactive_shell();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);

        bool handle_enqueue(OperationKind kind, const std::vector<std::string> &args);
        bool handle_delete(const std::vector<std::string> &args);
        bool handle_list(const std::vector<std::string> &args);
        bool handle_show(const std::vector<std::string> &args);
        bool handle_control(const std::string &command, const std::vector<std::string> &args);
        bool handle_bulk(const std::string &command);
        bool handle_resolve(const std::vector<std::string> &args);
        bool handle_priority(const std::vector<std::string> &args);
        bool handle_history(const std::vector<std::string> &args);
        bool handle_clear_history();
        bool handle_stats();
        bool handle_settings();

        void on_progress(const ProgressEvent &event);
        void on_completion(const CompletionEvent &event);

        void print_help() const;
        void print_usage(const std::string &usage) const;
        void print_error(ErrorCode code, const std::string &message) const;
        void print_operation_line(const Operation &operation) const;

        std::shared_ptr<spdlog::logger> logger_;
        engine::QueueManager manager_;
        mutable std::mutex output_mutex_;
        std::map<std::string, OperationStatus> last_status_;
        std::vector<engine::SubscriptionId> subscriptions_;
    };

} // namespace fileq::cli
