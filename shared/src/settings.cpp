#include "fileq/settings.hpp"

#include <fstream>

namespace fileq
{

    namespace
    {

        template <typename T>
        void read_key(const nlohmann::json &json, const char *key, T &target)
        {
            const auto it = json.find(key);
            if (it == json.end())
            {
                return;
            }
            try
            {
                target = it->get<T>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw ConfigError(std::string("Invalid value for '") + key + "': " + ex.what());
            }
        }

    } // namespace

    void to_json(nlohmann::json &json, const QueueSettings &settings)
    {
        json = {
            {"buffer_size", settings.buffer_size},
            {"preserve_timestamps", settings.preserve_timestamps},
            {"preserve_attributes", settings.preserve_attributes},
            {"verify_after_copy", settings.verify_after_copy},
            {"max_history_size", settings.max_history_size},
            {"default_conflict_resolution", to_string(settings.default_conflict_resolution)},
            {"use_recycle_bin", settings.use_recycle_bin},
        };
    }

    void from_json(const nlohmann::json &json, QueueSettings &settings)
    {
        if (!json.is_object())
        {
            throw ConfigError("Settings must be a JSON object");
        }
        read_key(json, "buffer_size", settings.buffer_size);
        read_key(json, "preserve_timestamps", settings.preserve_timestamps);
        read_key(json, "preserve_attributes", settings.preserve_attributes);
        read_key(json, "verify_after_copy", settings.verify_after_copy);
        read_key(json, "max_history_size", settings.max_history_size);
        read_key(json, "use_recycle_bin", settings.use_recycle_bin);

        std::string resolution;
        read_key(json, "default_conflict_resolution", resolution);
        if (!resolution.empty())
        {
            const auto parsed = conflict_resolution_from_string(resolution);
            if (!parsed)
            {
                throw ConfigError("Unknown conflict resolution: " + resolution);
            }
            settings.default_conflict_resolution = *parsed;
        }
        validate(settings);
    }

    void validate(const QueueSettings &settings)
    {
        if (settings.buffer_size == 0)
        {
            throw ConfigError("buffer_size must be greater than zero");
        }
    }

    QueueSettings load_settings(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw ConfigError("Unable to open settings file: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw ConfigError("Malformed settings file " + path.string() + ": " + ex.what());
        }
        return json.get<QueueSettings>();
    }

    void save_settings(const std::filesystem::path &path, const QueueSettings &settings)
    {
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open())
        {
            throw ConfigError("Unable to write settings file: " + path.string());
        }
        out << nlohmann::json(settings).dump(2);
    }

} // namespace fileq
