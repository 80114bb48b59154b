#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "fileq/error_codes.hpp"
#include "fileq/operation.hpp"

namespace fileq::engine
{

    struct FileTimes
    {
        TimePoint created{};
        TimePoint modified{};
        TimePoint accessed{};
    };

    struct FileMetadata
    {
        std::filesystem::path path;
        bool is_directory{};
        std::uint64_t size{};
        std::filesystem::perms permissions{std::filesystem::perms::unknown};
        FileTimes times;
        // Zero when the backend cannot identify the entry.
        std::uint64_t device{};
        std::uint64_t inode{};

        bool same_entry(const FileMetadata &other) const noexcept
        {
            return inode != 0 && device == other.device && inode == other.inode;
        }
    };

    class FilesystemError : public std::runtime_error
    {
    public:
        FilesystemError(fileq::ErrorCode code, std::string message);

        fileq::ErrorCode code() const noexcept { return code_; }

    private:
        fileq::ErrorCode code_;
    };

    // Every operation reports failure by throwing FilesystemError.
    class Filesystem
    {
    public:
        virtual ~Filesystem() = default;

        virtual bool exists(const std::filesystem::path &path) const = 0;

        // Direct children only, in no particular order.
        virtual std::vector<std::filesystem::path> list_directory(const std::filesystem::path &path) const = 0;

        // Follows symbolic links.
        virtual FileMetadata stat(const std::filesystem::path &path) const = 0;

        virtual void create_directories(const std::filesystem::path &path) const = 0;
        virtual void remove(const std::filesystem::path &path, bool recursive) const = 0;
        virtual void move(const std::filesystem::path &from, const std::filesystem::path &to) const = 0;

        virtual std::unique_ptr<std::istream> open_read(const std::filesystem::path &path,
                                                        std::size_t buffer_size) const = 0;

        // Creates or truncates the file.
        virtual std::unique_ptr<std::ostream> open_write(const std::filesystem::path &path,
                                                         std::size_t buffer_size) const = 0;

        // Creation time is informational; implementations that cannot set it ignore it.
        virtual void set_times(const std::filesystem::path &path, const FileTimes &times) const = 0;
        virtual void set_permissions(const std::filesystem::path &path, std::filesystem::perms permissions) const = 0;
    };

    class LocalFilesystem : public Filesystem
    {
    public:
        bool exists(const std::filesystem::path &path) const override;
        std::vector<std::filesystem::path> list_directory(const std::filesystem::path &path) const override;
        FileMetadata stat(const std::filesystem::path &path) const override;
        void create_directories(const std::filesystem::path &path) const override;
        void remove(const std::filesystem::path &path, bool recursive) const override;

        // Falls back to copy and remove when the rename crosses filesystems.
        void move(const std::filesystem::path &from, const std::filesystem::path &to) const override;

        std::unique_ptr<std::istream> open_read(const std::filesystem::path &path,
                                                std::size_t buffer_size) const override;
        std::unique_ptr<std::ostream> open_write(const std::filesystem::path &path,
                                                 std::size_t buffer_size) const override;
        void set_times(const std::filesystem::path &path, const FileTimes &times) const override;
        void set_permissions(const std::filesystem::path &path, std::filesystem::perms permissions) const override;
    };

} // namespace fileq::engine
