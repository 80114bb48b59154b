#include "fileq/engine/trash.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>

namespace fileq::engine
{

    namespace
    {
        constexpr auto kFilesDir = "files";
        constexpr auto kInfoDir = "info";
        constexpr auto kInfoExtension = ".trashinfo";
        constexpr int kMaxNameAttempts = 1000;

        std::string percent_encode(const std::string &value)
        {
            static constexpr char kHexDigits[] = "0123456789ABCDEF";
            std::string encoded;
            encoded.reserve(value.size());
            for (const auto ch : value)
            {
                const auto byte = static_cast<unsigned char>(ch);
                if (std::isalnum(byte) || ch == '/' || ch == '-' || ch == '_' || ch == '.' || ch == '~')
                {
                    encoded.push_back(ch);
                }
                else
                {
                    encoded.push_back('%');
                    encoded.push_back(kHexDigits[(byte >> 4) & 0x0F]);
                    encoded.push_back(kHexDigits[byte & 0x0F]);
                }
            }
            return encoded;
        }

        std::string deletion_date()
        {
            const auto now = std::time(nullptr);
            std::tm local{};
            localtime_r(&now, &local);
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
            return buffer;
        }

        // O_EXCL creation is the reservation; two trashers cannot pick the same name.
        // Returns false only when the name is taken.
        bool create_exclusive(const std::filesystem::path &path)
        {
            const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
            if (fd < 0)
            {
                const int error = errno;
                if (error == EEXIST)
                {
                    return false;
                }
                const std::error_code ec(error, std::generic_category());
                throw FilesystemError(fileq::error_code_from_errc(ec),
                                      "Unable to create " + path.string() + ": " + ec.message());
            }
            ::close(fd);
            return true;
        }

    } // namespace

    FreedesktopTrash::FreedesktopTrash(std::shared_ptr<Filesystem> filesystem, std::filesystem::path root,
                                       std::shared_ptr<spdlog::logger> logger)
        : filesystem_(std::move(filesystem)), root_(std::move(root)), logger_(std::move(logger)) {}

    std::filesystem::path FreedesktopTrash::default_root()
    {
        if (const char *data_home = std::getenv("XDG_DATA_HOME"); data_home && *data_home)
        {
            return std::filesystem::path(data_home) / "Trash";
        }
        if (const char *home = std::getenv("HOME"); home && *home)
        {
            return std::filesystem::path(home) / ".local" / "share" / "Trash";
        }
        return std::filesystem::temp_directory_path() / "fileq-trash";
    }

    std::filesystem::path FreedesktopTrash::files_dir() const
    {
        return root_ / kFilesDir;
    }

    std::filesystem::path FreedesktopTrash::info_dir() const
    {
        return root_ / kInfoDir;
    }

    std::string FreedesktopTrash::reserve_name(const std::filesystem::path &original)
    {
        const auto stem = original.stem().string();
        const auto extension = original.extension().string();
        for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt)
        {
            auto name = attempt == 0 ? original.filename().string()
                                     : stem + "." + std::to_string(attempt) + extension;
            if (filesystem_->exists(files_dir() / name))
            {
                continue;
            }
            if (create_exclusive(info_dir() / (name + kInfoExtension)))
            {
                return name;
            }
        }
        throw FilesystemError(fileq::ErrorCode::AlreadyExists,
                              "No free trash name for " + original.filename().string());
    }

    bool FreedesktopTrash::send_to_trash(const std::filesystem::path &path)
    {
        const auto absolute = std::filesystem::absolute(path).lexically_normal();
        std::string name;
        try
        {
            std::lock_guard lock(mutex_);
            filesystem_->create_directories(files_dir());
            filesystem_->create_directories(info_dir());
            name = reserve_name(absolute);

            const auto info_path = info_dir() / (name + kInfoExtension);
            {
                auto info = filesystem_->open_write(info_path, 4096);
                *info << "[Trash Info]\n"
                      << "Path=" << percent_encode(absolute.string()) << "\n"
                      << "DeletionDate=" << deletion_date() << "\n";
                info->flush();
                if (!*info)
                {
                    throw FilesystemError(fileq::ErrorCode::IoError, "Unable to write " + info_path.string());
                }
            }

            try
            {
                filesystem_->move(absolute, files_dir() / name);
            }
            catch (const FilesystemError &)
            {
                filesystem_->remove(info_path, false);
                throw;
            }
        }
        catch (const FilesystemError &ex)
        {
            logger_->warn("Unable to move {} to trash: {}", path.string(), ex.what());
            return false;
        }

        logger_->debug("Moved {} to trash as {}", path.string(), name);
        return true;
    }

} // namespace fileq::engine
