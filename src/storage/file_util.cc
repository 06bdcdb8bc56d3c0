#include <finbot/storage/file_util.h>

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace finbot::storage
{
    namespace
    {
        bool WriteFull(int fd, const void *buf, std::size_t len)
        {
            const auto *p = static_cast<const std::uint8_t *>(buf);
            std::size_t rem = len;
            while (rem > 0)
            {
                ssize_t w = ::write(fd, p, rem);
                if (w < 0)
                {
                    if (errno == EINTR)
                        continue;
                    return false;
                }
                if (w == 0)
                    return false;
                p += static_cast<std::size_t>(w);
                rem -= static_cast<std::size_t>(w);
            }
            return true;
        }
    } // namespace

    bool EnsureDirExists(const std::string &path)
    {
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
            return std::filesystem::is_directory(path, ec);
        return std::filesystem::create_directories(path, ec);
    }

    bool FsyncDirPath(const std::string &dir)
    {
        int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (dfd < 0)
            return false;
        int rc = ::fsync(dfd);
        ::close(dfd);
        return rc == 0;
    }

    bool AtomicRename(const std::string &tmp_path, const std::string &final_path)
    {
        return ::rename(tmp_path.c_str(), final_path.c_str()) == 0;
    }

    Status ReadFileToString(const std::string &path, std::string *out)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            return Status::NotFound("file not found: " + path);

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            return Status::IoError("cannot open " + path);
        in.seekg(0, std::ios::end);
        auto n = in.tellg();
        in.seekg(0, std::ios::beg);
        if (n <= 0)
        {
            out->clear();
            return Status::Ok();
        }
        out->resize(static_cast<std::size_t>(n));
        if (!in.read(out->data(), n))
            return Status::IoError("short read: " + path);
        return Status::Ok();
    }

    Status WriteStringToFileSync(const std::string &path, const std::string &data)
    {
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0)
            return Status::FromErrno(ErrorCode::kIoError, "open " + path);
        if (!WriteFull(fd, data.data(), data.size()))
        {
            Status st = Status::FromErrno(ErrorCode::kIoError, "write " + path);
            ::close(fd);
            return st;
        }
        if (::fdatasync(fd) != 0)
        {
            Status st = Status::FromErrno(ErrorCode::kIoError, "fdatasync " + path);
            ::close(fd);
            return st;
        }
        if (::close(fd) != 0)
            return Status::FromErrno(ErrorCode::kIoError, "close " + path);
        return Status::Ok();
    }
}
