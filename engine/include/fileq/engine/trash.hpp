#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/logger.h>

#include "fileq/engine/filesystem.hpp"

namespace fileq::engine
{

    class Trash
    {
    public:
        virtual ~Trash() = default;

        // Returns false when the entry could not be moved to the trash; the entry is left in place.
        virtual bool send_to_trash(const std::filesystem::path &path) = 0;
    };

    /**
     * Home trash following the freedesktop.org Trash specification: entries are moved to
     * <root>/files and described by <root>/info/<name>.trashinfo.
     */
    class FreedesktopTrash : public Trash
    {
    public:
        FreedesktopTrash(std::shared_ptr<Filesystem> filesystem, std::filesystem::path root,
                         std::shared_ptr<spdlog::logger> logger);

        // $XDG_DATA_HOME/Trash, or ~/.local/share/Trash when XDG_DATA_HOME is unset.
        static std::filesystem::path default_root();

        bool send_to_trash(const std::filesystem::path &path) override;

        std::filesystem::path files_dir() const;
        std::filesystem::path info_dir() const;

    private:
        std::string reserve_name(const std::filesystem::path &original);

        std::shared_ptr<Filesystem> filesystem_;
        std::filesystem::path root_;
        std::shared_ptr<spdlog::logger> logger_;
        std::mutex mutex_;
    };

} // namespace fileq::engine
