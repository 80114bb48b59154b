/**
 * fileq - Queue settings and their JSON configuration file.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "fileq/operation.hpp"

namespace fileq
{

    struct QueueSettings
    {
        std::size_t buffer_size{64 * 1024};
        bool preserve_timestamps{true};
        bool preserve_attributes{true};
        bool verify_after_copy{false};
        std::size_t max_history_size{100};
        ConflictResolution default_conflict_resolution{ConflictResolution::Prompt};
        bool use_recycle_bin{true};
    };

    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    void to_json(nlohmann::json &json, const QueueSettings &settings);

    // Missing keys keep their defaults; values of the wrong type or out of range throw ConfigError.
    void from_json(const nlohmann::json &json, QueueSettings &settings);

    // Throws ConfigError when buffer_size is zero.
    void validate(const QueueSettings &settings);

    QueueSettings load_settings(const std::filesystem::path &path);

    void save_settings(const std::filesystem::path &path, const QueueSettings &settings);

} // namespace fileq
