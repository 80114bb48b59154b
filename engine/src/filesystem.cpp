#include "fileq/engine/filesystem.hpp"

#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <system_error>
#include <vector>

namespace fileq::engine
{

    FilesystemError::FilesystemError(fileq::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {

        FilesystemError make_error(const std::error_code &ec, const std::string &action,
                                   const std::filesystem::path &path)
        {
            return FilesystemError(fileq::error_code_from_errc(ec),
                                   action + " " + path.string() + ": " + ec.message());
        }

        FilesystemError error_from_errno(int error, const std::string &action, const std::filesystem::path &path)
        {
            return make_error(std::error_code(error, std::generic_category()), action, path);
        }

        TimePoint from_statx(const struct statx_timestamp &ts)
        {
            const auto since_epoch = std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec};
            return TimePoint{std::chrono::duration_cast<Clock::duration>(since_epoch)};
        }

        struct timespec to_timespec(TimePoint time)
        {
            const auto since_epoch = time.time_since_epoch();
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
            const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
            struct timespec ts{};
            ts.tv_sec = static_cast<time_t>(seconds.count());
            ts.tv_nsec = static_cast<long>(nanos.count());
            return ts;
        }

        // The buffer must outlive the stream, so it sits in a base constructed first.
        struct StreamBuffer
        {
            explicit StreamBuffer(std::size_t size) : storage(size == 0 ? 1 : size) {}
            std::vector<char> storage;
        };

        template <typename Stream>
        class BufferedFileStream : private StreamBuffer, public Stream
        {
        public:
            BufferedFileStream(const std::filesystem::path &path, std::ios::openmode mode, std::size_t buffer_size)
                : StreamBuffer(buffer_size)
            {
                this->rdbuf()->pubsetbuf(storage.data(), static_cast<std::streamsize>(storage.size()));
                this->open(path, mode);
            }
        };

    } // namespace

    bool LocalFilesystem::exists(const std::filesystem::path &path) const
    {
        std::error_code ec;
        const auto status = std::filesystem::status(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory)
        {
            throw make_error(ec, "Unable to check", path);
        }
        return std::filesystem::exists(status);
    }

    std::vector<std::filesystem::path> LocalFilesystem::list_directory(const std::filesystem::path &path) const
    {
        std::error_code ec;
        std::filesystem::directory_iterator it(path, ec);
        if (ec)
        {
            throw make_error(ec, "Unable to list", path);
        }
        std::vector<std::filesystem::path> entries;
        const auto end = std::filesystem::end(it);
        for (; it != end; it.increment(ec))
        {
            if (ec)
            {
                throw make_error(ec, "Unable to list", path);
            }
            entries.push_back(it->path());
        }
        if (ec)
        {
            throw make_error(ec, "Unable to list", path);
        }
        return entries;
    }

    FileMetadata LocalFilesystem::stat(const std::filesystem::path &path) const
    {
        struct statx stx{};
        if (::statx(AT_FDCWD, path.c_str(), 0, STATX_BASIC_STATS | STATX_BTIME, &stx) != 0)
        {
            throw error_from_errno(errno, "Unable to stat", path);
        }

        FileMetadata metadata{};
        metadata.path = path;
        metadata.is_directory = S_ISDIR(stx.stx_mode);
        metadata.size = metadata.is_directory ? 0 : stx.stx_size;
        metadata.permissions = static_cast<std::filesystem::perms>(stx.stx_mode & 07777);
        metadata.device = (static_cast<std::uint64_t>(stx.stx_dev_major) << 32) | stx.stx_dev_minor;
        metadata.inode = stx.stx_ino;
        metadata.times.modified = from_statx(stx.stx_mtime);
        metadata.times.accessed = from_statx(stx.stx_atime);
        metadata.times.created = (stx.stx_mask & STATX_BTIME) != 0 ? from_statx(stx.stx_btime)
                                                                    : from_statx(stx.stx_ctime);
        return metadata;
    }

    void LocalFilesystem::create_directories(const std::filesystem::path &path) const
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            throw make_error(ec, "Unable to create directory", path);
        }
    }

    void LocalFilesystem::remove(const std::filesystem::path &path, bool recursive) const
    {
        std::error_code ec;
        if (recursive)
        {
            std::filesystem::remove_all(path, ec);
        }
        else
        {
            std::filesystem::remove(path, ec);
        }
        if (ec)
        {
            throw make_error(ec, "Unable to remove", path);
        }
    }

    void LocalFilesystem::move(const std::filesystem::path &from, const std::filesystem::path &to) const
    {
        std::error_code ec;
        std::filesystem::rename(from, to, ec);
        if (!ec)
        {
            return;
        }
        if (ec != std::errc::cross_device_link)
        {
            throw make_error(ec, "Unable to move", from);
        }

        ec.clear();
        std::filesystem::copy(from, to,
                              std::filesystem::copy_options::recursive | std::filesystem::copy_options::copy_symlinks,
                              ec);
        if (ec)
        {
            throw make_error(ec, "Unable to copy across devices", from);
        }
        std::filesystem::remove_all(from, ec);
        if (ec)
        {
            throw make_error(ec, "Unable to remove moved source", from);
        }
    }

    std::unique_ptr<std::istream> LocalFilesystem::open_read(const std::filesystem::path &path,
                                                             std::size_t buffer_size) const
    {
        auto stream = std::make_unique<BufferedFileStream<std::ifstream>>(path, std::ios::binary | std::ios::in,
                                                                          buffer_size);
        if (!stream->is_open())
        {
            throw error_from_errno(errno == 0 ? EIO : errno, "Unable to open", path);
        }
        return stream;
    }

    std::unique_ptr<std::ostream> LocalFilesystem::open_write(const std::filesystem::path &path,
                                                              std::size_t buffer_size) const
    {
        auto stream = std::make_unique<BufferedFileStream<std::ofstream>>(
            path, std::ios::binary | std::ios::out | std::ios::trunc, buffer_size);
        if (!stream->is_open())
        {
            throw error_from_errno(errno == 0 ? EIO : errno, "Unable to create", path);
        }
        return stream;
    }

    void LocalFilesystem::set_times(const std::filesystem::path &path, const FileTimes &times) const
    {
        const struct timespec values[2] = {to_timespec(times.accessed), to_timespec(times.modified)};
        if (::utimensat(AT_FDCWD, path.c_str(), values, 0) != 0)
        {
            throw error_from_errno(errno, "Unable to set timestamps on", path);
        }
    }

    void LocalFilesystem::set_permissions(const std::filesystem::path &path, std::filesystem::perms permissions) const
    {
        std::error_code ec;
        std::filesystem::permissions(path, permissions, std::filesystem::perm_options::replace, ec);
        if (ec)
        {
            throw make_error(ec, "Unable to set permissions on", path);
        }
    }

} // namespace fileq::engine
