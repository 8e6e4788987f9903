#pragma once
#include <cstddef>
#include <string>

#include "stratum/status.h"

namespace stratum::util
{

    // Owning file descriptor for the small sequential records stratum keeps on
    // disk. Reads and writes retry on EINTR and short transfers.
    class PosixFile
    {
    public:
        PosixFile() = default;
        ~PosixFile();

        PosixFile(const PosixFile &) = delete;
        PosixFile &operator=(const PosixFile &) = delete;
        PosixFile(PosixFile &&other) noexcept;
        PosixFile &operator=(PosixFile &&other) noexcept;

        // NotFound when the path does not exist.
        static Status OpenRead(const std::string &path, PosixFile *out);
        static Status CreateTrunc(const std::string &path, PosixFile *out);

        Status Append(const void *data, std::size_t n);
        // Reads from the current position to EOF.
        Status ReadAll(std::string *out);

        Status SyncData();
        Status Close();

        bool is_open() const noexcept { return fd_ >= 0; }

    private:
        explicit PosixFile(int fd) : fd_(fd) {}
        int fd_ = -1;
    };

    Status FsyncDir(const std::string &dir_path);

    // rename(2) followed by an fsync of the destination's directory, so the
    // new name survives a crash.
    Status RenameDurably(const std::string &from, const std::string &to);

} // namespace stratum::util
