#include "fileq/cli/shell.hpp"

#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "fileq/engine/filesystem.hpp"
#include "fileq/engine/trash.hpp"
#include "fileq/error_codes.hpp"

namespace fileq::cli
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> std::quoted(token))
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        engine::QueueServices make_services(const std::shared_ptr<spdlog::logger> &logger)
        {
            auto filesystem = std::make_shared<engine::LocalFilesystem>();
            auto trash = std::make_shared<engine::FreedesktopTrash>(filesystem, engine::FreedesktopTrash::default_root(),
                                                                    logger);
            return engine::QueueServices{filesystem, trash, logger};
        }

    } // namespace

    Shell::Shell(QueueSettings settings, std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger)),
          manager_(make_services(logger_), std::move(settings))
    {
        subscriptions_.push_back(manager_.subscribe_progress([this](const ProgressEvent &event)
                                                             { on_progress(event); }));
        subscriptions_.push_back(manager_.subscribe_completion([this](const CompletionEvent &event)
                                                               { on_completion(event); }));
    }

    Shell::~Shell()
    {
        for (const auto id : subscriptions_)
        {
            manager_.unsubscribe(id);
        }
        manager_.shutdown();
    }

    int Shell::run()
    {
        try
        {
            interactive_shell();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_->error("fatal: {}", ex.what());
            return 1;
        }
        return 0;
    }

    void Shell::interactive_shell()
    {
        while (true)
        {
            {
                std::lock_guard lock(output_mutex_);
                std::cout << "fileq> " << std::flush;
            }
            std::string line;
            if (!std::getline(std::cin, line))
            {
                std::cout << std::endl;
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            logger_->debug("command: {}", line);

            const auto tokens = split_tokens(line);
            if (tokens.empty())
            {
                continue;
            }
            const auto command = to_upper(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

            if (command == "EXIT" || command == "QUIT")
            {
                std::lock_guard lock(output_mutex_);
                std::cout << "OK" << std::endl;
                break;
            }
            if (command == "HELP")
            {
                print_help();
                continue;
            }

            try
            {
                if (!dispatch(command, args))
                {
                    print_error(ErrorCode::Unsupported, "Unknown command " + tokens[0] + ", try HELP");
                }
            }
            catch (const engine::QueueError &ex)
            {
                print_error(ex.code(), ex.what());
            }
            catch (const ConfigError &ex)
            {
                print_error(ErrorCode::ConfigurationError, ex.what());
            }
            catch (const std::exception &ex)
            {
                print_error(ErrorCode::InternalError, ex.what());
                logger_->error("command failed: {}", ex.what());
            }
        }
    }

    bool Shell::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "COPY")
        {
            return handle_enqueue(OperationKind::Copy, args);
        }
        if (command == "MOVE")
        {
            return handle_enqueue(OperationKind::Move, args);
        }
        if (command == "DELETE")
        {
            return handle_delete(args);
        }
        if (command == "LIST")
        {
            return handle_list(args);
        }
        if (command == "SHOW")
        {
            return handle_show(args);
        }
        if (command == "PAUSE" || command == "RESUME" || command == "CANCEL" || command == "RETRY")
        {
            return handle_control(command, args);
        }
        if (command == "PAUSEALL" || command == "RESUMEALL" || command == "CANCELALL")
        {
            return handle_bulk(command);
        }
        if (command == "RESOLVE")
        {
            return handle_resolve(args);
        }
        if (command == "PRIORITY")
        {
            return handle_priority(args);
        }
        if (command == "HISTORY")
        {
            return handle_history(args);
        }
        if (command == "CLEARHISTORY")
        {
            return handle_clear_history();
        }
        if (command == "STATS")
        {
            return handle_stats();
        }
        if (command == "SETTINGS")
        {
            return handle_settings();
        }
        return false;
    }

    void Shell::on_progress(const ProgressEvent &event)
    {
        const auto &operation = event.operation;
        std::lock_guard lock(output_mutex_);
        const auto previous = last_status_.find(operation.id);
        if (previous != last_status_.end() && previous->second == operation.status)
        {
            return;
        }
        last_status_[operation.id] = operation.status;
        std::cout << "\n[" << operation.id << "] " << to_string(operation.status);
        if (operation.status == OperationStatus::Conflict && operation.pending_conflict)
        {
            const auto &conflict = *operation.pending_conflict;
            std::cout << ": " << conflict.destination_path.string() << " already exists ("
                      << to_string(conflict.kind) << ", suggested " << to_string(conflict.recommended) << ")"
                      << "\n  RESOLVE " << operation.id
                      << " SKIP|SKIP_ALL|OVERWRITE|OVERWRITE_ALL|OVERWRITE_IF_NEWER|RENAME|RENAME_ALL|CANCEL";
        }
        std::cout << std::endl;
    }

    void Shell::on_completion(const CompletionEvent &event)
    {
        const auto &operation = event.operation;
        std::lock_guard lock(output_mutex_);
        last_status_.erase(operation.id);
        std::cout << "\n[" << operation.id << "] " << to_string(operation.status) << ": "
                  << event.files_processed << " files, " << operation.processed_bytes << " bytes";
        if (operation.started_at)
        {
            std::cout << " in " << format_duration(operation.elapsed(operation.completed_at.value_or(Clock::now())));
        }
        if (event.files_failed > 0)
        {
            std::cout << ", " << event.files_failed << " not processed";
        }
        if (operation.error_message)
        {
            std::cout << " (" << *operation.error_message << ")";
        }
        std::cout << std::endl;
    }

    void Shell::print_help() const
    {
        std::lock_guard lock(output_mutex_);
        std::cout << "Available commands:" << std::endl;
        std::cout << "  HELP                         Show this help" << std::endl;
        std::cout << "  EXIT                         Cancel pending work and exit" << std::endl;
        std::cout << "  COPY <src...> <dst>          Queue a copy into directory dst" << std::endl;
        std::cout << "  MOVE <src...> <dst>          Queue a move into directory dst" << std::endl;
        std::cout << "  DELETE [--permanent] <path...>  Queue a delete (recycle bin by default)" << std::endl;
        std::cout << "  LIST                         Show pending operations" << std::endl;
        std::cout << "  SHOW <id>                    Show one operation in detail" << std::endl;
        std::cout << "  PAUSE|RESUME <id>            Pause or resume the running operation" << std::endl;
        std::cout << "  CANCEL|RETRY <id>            Cancel an operation or retry a failed one" << std::endl;
        std::cout << "  PAUSEALL|RESUMEALL|CANCELALL Apply to every pending operation" << std::endl;
        std::cout << "  RESOLVE <id> <resolution>    Answer a conflict (SKIP, OVERWRITE, RENAME, ... or CANCEL)"
                  << std::endl;
        std::cout << "  PRIORITY <id> <position>     Move a pending operation within the queue" << std::endl;
        std::cout << "  HISTORY [n]                  Show the n most recent finished operations" << std::endl;
        std::cout << "  CLEARHISTORY                 Forget finished operations" << std::endl;
        std::cout << "  STATS                        Show queue statistics" << std::endl;
        std::cout << "  SETTINGS                     Show the active settings" << std::endl;
        std::cout << "\nPaths containing spaces can be quoted." << std::endl;
    }

    void Shell::print_usage(const std::string &usage) const
    {
        std::lock_guard lock(output_mutex_);
        std::cout << "ERROR: " << to_string(ErrorCode::InvalidArgument) << std::endl;
        std::cout << "Usage: " << usage << std::endl;
    }

    void Shell::print_error(ErrorCode code, const std::string &message) const
    {
        std::lock_guard lock(output_mutex_);
        std::cout << "ERROR: " << to_string(code) << std::endl;
        if (!message.empty())
        {
            std::cout << message << std::endl;
        }
    }

    void Shell::print_operation_line(const Operation &operation) const
    {
        std::cout << std::left << std::setw(18) << operation.id << std::setw(10) << to_string(operation.kind)
                  << std::setw(11) << to_string(operation.status) << std::right << std::setw(4)
                  << operation.percent_complete() << "%  " << operation.processed_files << '/'
                  << operation.total_files << " files";
        if (operation.status == OperationStatus::Running && operation.speed_bytes_per_second > 0)
        {
            std::cout << "  " << format_speed(operation.speed_bytes_per_second) << "  ETA "
                      << format_duration(operation.estimated_remaining);
        }
        std::cout << std::endl;
    }

} // namespace fileq::cli
