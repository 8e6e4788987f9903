#include "util/posix_file.h"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace stratum::util
{
    namespace
    {
        static Status ErrnoStatus(const char *op, const std::string &what)
        {
            const int e = errno;
            std::string msg = std::string(op);
            if (!what.empty())
                msg += " " + what;
            msg += ": ";
            msg += std::strerror(e);
            return Status::IOError(std::move(msg));
        }

        static int CloseRetry(int fd)
        {
            int r;
            do
            {
                r = ::close(fd);
            } while (r != 0 && errno == EINTR);
            return r;
        }

        static std::string ParentDir(const std::string &path)
        {
            const auto slash = path.find_last_of('/');
            if (slash == std::string::npos)
                return ".";
            if (slash == 0)
                return "/";
            return path.substr(0, slash);
        }
    } // namespace

    PosixFile::PosixFile(PosixFile &&other) noexcept : fd_(other.fd_)
    {
        other.fd_ = -1;
    }

    PosixFile &PosixFile::operator=(PosixFile &&other) noexcept
    {
        if (this != &other)
        {
            if (fd_ >= 0)
                (void)CloseRetry(fd_);
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    PosixFile::~PosixFile()
    {
        if (fd_ >= 0)
            (void)CloseRetry(fd_);
    }

    Status PosixFile::OpenRead(const std::string &path, PosixFile *out)
    {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
        {
            if (errno == ENOENT)
                return Status::NotFound(path);
            return ErrnoStatus("open", path);
        }
        *out = PosixFile(fd);
        return Status::Ok();
    }

    Status PosixFile::CreateTrunc(const std::string &path, PosixFile *out)
    {
        const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
        if (fd < 0)
            return ErrnoStatus("create", path);
        *out = PosixFile(fd);
        return Status::Ok();
    }

    Status PosixFile::Append(const void *data, std::size_t n)
    {
        if (fd_ < 0)
            return Status::InvalidArgument("append to a closed file");
        const auto *p = static_cast<const std::uint8_t *>(data);
        while (n > 0)
        {
            const ssize_t w = ::write(fd_, p, n);
            if (w < 0)
            {
                if (errno == EINTR)
                    continue;
                return ErrnoStatus("write", "");
            }
            p += w;
            n -= static_cast<std::size_t>(w);
        }
        return Status::Ok();
    }

    Status PosixFile::ReadAll(std::string *out)
    {
        if (fd_ < 0)
            return Status::InvalidArgument("read from a closed file");
        out->clear();
        char buf[4096];
        for (;;)
        {
            const ssize_t r = ::read(fd_, buf, sizeof(buf));
            if (r < 0)
            {
                if (errno == EINTR)
                    continue;
                return ErrnoStatus("read", "");
            }
            if (r == 0)
                return Status::Ok();
            out->append(buf, static_cast<std::size_t>(r));
        }
    }

    Status PosixFile::SyncData()
    {
        if (::fdatasync(fd_) != 0)
            return ErrnoStatus("fdatasync", "");
        return Status::Ok();
    }

    Status PosixFile::Close()
    {
        if (fd_ < 0)
            return Status::Ok();
        const int r = CloseRetry(fd_);
        fd_ = -1;
        if (r != 0)
            return ErrnoStatus("close", "");
        return Status::Ok();
    }

    Status FsyncDir(const std::string &dir_path)
    {
        const int fd = ::open(dir_path.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
        if (fd < 0)
            return ErrnoStatus("open dir", dir_path);
        int r;
        do
        {
            r = ::fsync(fd);
        } while (r != 0 && errno == EINTR);
        const int saved = errno;
        (void)CloseRetry(fd);
        if (r != 0)
        {
            errno = saved;
            return ErrnoStatus("fsync dir", dir_path);
        }
        return Status::Ok();
    }

    Status RenameDurably(const std::string &from, const std::string &to)
    {
        if (std::rename(from.c_str(), to.c_str()) != 0)
            return ErrnoStatus("rename", from + " -> " + to);
        return FsyncDir(ParentDir(to));
    }

} // namespace stratum::util
