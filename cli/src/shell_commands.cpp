#include "fileq/cli/shell.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "fileq/error_codes.hpp"

namespace fileq::cli
{

    namespace
    {

        std::string upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::optional<long long> parse_integer(const std::string &value)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoll(value, &consumed);
                if (consumed != value.size())
                {
                    return std::nullopt;
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                return std::nullopt;
            }
        }

        std::filesystem::path absolute_path(const std::string &value)
        {
            return std::filesystem::absolute(std::filesystem::path(value)).lexically_normal();
        }

    } // namespace

    bool Shell::handle_enqueue(OperationKind kind, const std::vector<std::string> &args)
    {
        if (args.size() < 2)
        {
            print_usage(std::string(to_string(kind)) + " <src...> <dst>");
            return true;
        }
        std::vector<std::filesystem::path> sources;
        for (std::size_t i = 0; i + 1 < args.size(); ++i)
        {
            sources.push_back(absolute_path(args[i]));
        }
        const auto operation = manager_.enqueue(kind, std::move(sources), absolute_path(args.back()));

        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        std::cout << operation.id << " queued: " << operation.total_files << " files, "
                  << operation.total_bytes << " bytes" << std::endl;
        return true;
    }

    bool Shell::handle_delete(const std::vector<std::string> &args)
    {
        std::optional<bool> permanent;
        std::vector<std::filesystem::path> paths;
        for (const auto &arg : args)
        {
            if (arg == "--permanent")
            {
                permanent = true;
            }
            else
            {
                paths.push_back(absolute_path(arg));
            }
        }
        if (paths.empty())
        {
            print_usage("DELETE [--permanent] <path...>");
            return true;
        }
        const auto operation = manager_.enqueue_delete(std::move(paths), permanent);

        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        std::cout << operation.id << " queued: " << operation.total_files << " files"
                  << (operation.is_permanent_delete() ? ", permanent" : ", to recycle bin") << std::endl;
        return true;
    }

    bool Shell::handle_list(const std::vector<std::string> &args)
    {
        if (!args.empty())
        {
            print_usage("LIST");
            return true;
        }
        const auto operations = manager_.pending();

        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        if (operations.empty())
        {
            std::cout << "Queue is empty" << std::endl;
        }
        for (const auto &operation : operations)
        {
            std::cout << operation.priority << ". ";
            print_operation_line(operation);
        }
        return true;
    }

    bool Shell::handle_show(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_usage("SHOW <id>");
            return true;
        }
        const auto operation = manager_.find(args[0]);
        if (!operation)
        {
            print_error(ErrorCode::NotFound, "No operation " + args[0]);
            return true;
        }
        const nlohmann::json json = *operation;

        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        std::cout << json.dump(2) << std::endl;
        return true;
    }

    bool Shell::handle_control(const std::string &command, const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_usage(command + " <id>");
            return true;
        }
        const auto &id = args[0];
        const auto before = manager_.find(id);
        if (!before)
        {
            print_error(ErrorCode::NotFound, "No operation " + id);
            return true;
        }

        if (command == "PAUSE")
        {
            manager_.pause(id);
        }
        else if (command == "RESUME")
        {
            manager_.resume(id);
        }
        else if (command == "CANCEL")
        {
            manager_.cancel(id);
        }
        else
        {
            manager_.retry(id);
        }

        const auto after = manager_.find(id);
        if (after && after->status == before->status)
        {
            print_error(ErrorCode::InvalidArgument,
                        command + " has no effect on an operation that is " + std::string(to_string(before->status)));
            return true;
        }
        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_bulk(const std::string &command)
    {
        if (command == "PAUSEALL")
        {
            manager_.pause_all();
        }
        else if (command == "RESUMEALL")
        {
            manager_.resume_all();
        }
        else
        {
            manager_.cancel_all();
        }
        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_resolve(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            print_usage("RESOLVE <id> <SKIP|SKIP_ALL|OVERWRITE|OVERWRITE_ALL|OVERWRITE_IF_NEWER|"
                        "OVERWRITE_IF_NEWER_ALL|RENAME|RENAME_ALL|CANCEL>");
            return true;
        }
        const auto resolution = conflict_resolution_from_string(upper(args[1]));
        if (!resolution || *resolution == ConflictResolution::Prompt)
        {
            print_error(ErrorCode::InvalidArgument, "Unknown resolution " + args[1]);
            return true;
        }
        const auto operation = manager_.find(args[0]);
        if (!operation)
        {
            print_error(ErrorCode::NotFound, "No operation " + args[0]);
            return true;
        }
        if (operation->status != OperationStatus::Conflict)
        {
            print_error(ErrorCode::InvalidArgument, "Operation " + args[0] + " is not waiting on a conflict");
            return true;
        }
        manager_.resolve_conflict(args[0], *resolution);
        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_priority(const std::vector<std::string> &args)
    {
        const auto position = args.size() == 2 ? parse_integer(args[1]) : std::nullopt;
        if (!position)
        {
            print_usage("PRIORITY <id> <position>");
            return true;
        }
        const auto pending = manager_.pending();
        const auto it = std::find_if(pending.begin(), pending.end(), [&](const Operation &operation)
                                     { return operation.id == args[0]; });
        if (it == pending.end())
        {
            print_error(ErrorCode::NotFound, "No pending operation " + args[0]);
            return true;
        }
        if (*position < 0 || *position >= static_cast<long long>(pending.size()))
        {
            print_error(ErrorCode::InvalidArgument,
                        "Position must be between 0 and " + std::to_string(pending.size() - 1));
            return true;
        }
        manager_.change_priority(args[0], static_cast<int>(*position));
        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_history(const std::vector<std::string> &args)
    {
        std::size_t count = 50;
        if (!args.empty())
        {
            const auto parsed = args.size() == 1 ? parse_integer(args[0]) : std::nullopt;
            if (!parsed || *parsed < 0)
            {
                print_usage("HISTORY [n]");
                return true;
            }
            count = static_cast<std::size_t>(*parsed);
        }
        const auto operations = manager_.history(count);

        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        for (const auto &operation : operations)
        {
            print_operation_line(operation);
            if (operation.error_message)
            {
                std::cout << "    " << *operation.error_message << std::endl;
            }
        }
        return true;
    }

    bool Shell::handle_clear_history()
    {
        manager_.clear_history();
        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_stats()
    {
        const auto stats = manager_.statistics();

        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        std::cout << "Operations: " << stats.total_operations << " (" << stats.queued_operations << " queued, "
                  << stats.running_operations << " running, " << stats.paused_operations << " paused, "
                  << stats.conflict_operations << " in conflict)" << std::endl;
        std::cout << "Finished:   " << stats.completed_operations << " completed, " << stats.failed_operations
                  << " failed, " << stats.cancelled_operations << " cancelled" << std::endl;
        std::cout << "Transferred: " << stats.total_bytes_transferred << " bytes at "
                  << format_speed(stats.average_speed_bytes_per_second) << " in "
                  << format_duration(stats.total_operation_time) << std::endl;
        return true;
    }

    bool Shell::handle_settings()
    {
        const nlohmann::json json = manager_.settings();
        std::lock_guard lock(output_mutex_);
        std::cout << "OK" << std::endl;
        std::cout << json.dump(2) << std::endl;
        return true;
    }

} // namespace fileq::cli
