#include "util/subprocess.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace stratum::util
{
    namespace
    {
        void AppendLimited(std::string &dst, const char *src, ssize_t n, std::size_t limit)
        {
            if (n <= 0)
                return;
            const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
            const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
            dst.append(src, take);
        }

        // Drains whatever is readable; returns false once the pipe hit EOF.
        bool Drain(int fd, std::string &dst, std::size_t limit)
        {
            char buf[4096];
            while (true)
            {
                ssize_t n = ::read(fd, buf, sizeof(buf));
                if (n > 0)
                {
                    AppendLimited(dst, buf, n, limit);
                    continue;
                }
                if (n == 0)
                    return false;
                if (errno == EINTR)
                    continue;
                return errno == EAGAIN || errno == EWOULDBLOCK;
            }
        }
    } // namespace

    stratum::Status RunProcess(const ProcessSpec &spec, ProcessResult *out)
    {
        if (spec.argv.empty())
            return stratum::Status::InvalidArgument("empty command");

        *out = ProcessResult{};
        int out_pipe[2];
        int err_pipe[2];
        if (::pipe2(out_pipe, O_CLOEXEC) != 0)
            return stratum::Status::IOError(std::string("pipe: ") + std::strerror(errno));
        if (::pipe2(err_pipe, O_CLOEXEC) != 0)
        {
            int saved = errno;
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
            return stratum::Status::IOError(std::string("pipe: ") + std::strerror(saved));
        }

        std::vector<std::string> args = spec.argv;
        std::vector<char *> argv;
        argv.reserve(args.size() + 1);
        for (auto &s : args)
            argv.push_back(s.data());
        argv.push_back(nullptr);

        pid_t pid = ::fork();
        if (pid < 0)
        {
            int saved = errno;
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
            ::close(err_pipe[0]);
            ::close(err_pipe[1]);
            return stratum::Status::IOError(std::string("fork: ") + std::strerror(saved));
        }

        if (pid == 0)
        {
            ::setpgid(0, 0);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0)
                ::dup2(devnull, STDIN_FILENO);
            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        ::close(out_pipe[1]);
        ::close(err_pipe[1]);
        ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
        ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

        const bool has_deadline = spec.timeout_ms > 0;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);

        bool out_open = true;
        bool err_open = true;
        while (out_open || err_open)
        {
            pollfd fds[2];
            nfds_t nfds = 0;
            if (out_open)
                fds[nfds++] = pollfd{out_pipe[0], POLLIN, 0};
            if (err_open)
                fds[nfds++] = pollfd{err_pipe[0], POLLIN, 0};

            int wait_ms = -1;
            if (has_deadline)
            {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (left.count() <= 0)
                {
                    ::kill(-pid, SIGKILL);
                    ::kill(pid, SIGKILL);
                    out->timed_out = true;
                    break;
                }
                wait_ms = static_cast<int>(left.count());
            }

            int r = ::poll(fds, nfds, wait_ms);
            if (r < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (out_open)
                out_open = Drain(out_pipe[0], out->stdout_text, spec.max_output_bytes);
            if (err_open)
                err_open = Drain(err_pipe[0], out->stderr_text, spec.max_output_bytes);
        }
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
                return stratum::Status::IOError(std::string("waitpid: ") + std::strerror(errno));
        }

        if (out->timed_out)
            out->exit_code = 124;
        else if (WIFEXITED(status))
            out->exit_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            out->exit_code = 128 + WTERMSIG(status);
        return stratum::Status::Ok();
    }

    std::vector<std::string> SplitCommandLine(const std::string &line)
    {
        std::vector<std::string> out;
        std::string cur;
        bool in_quotes = false;
        bool have = false;
        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
                have = true;
                continue;
            }
            if (!in_quotes && (c == ' ' || c == '\t'))
            {
                if (have)
                {
                    out.push_back(cur);
                    cur.clear();
                    have = false;
                }
                continue;
            }
            cur += c;
            have = true;
        }
        if (have)
            out.push_back(cur);
        return out;
    }

    std::string JoinCommandLine(const std::vector<std::string> &argv)
    {
        std::string s;
        for (const auto &a : argv)
        {
            if (!s.empty())
                s += ' ';
            if (a.empty() || a.find_first_of(" \t") != std::string::npos)
                s += '"' + a + '"';
            else
                s += a;
        }
        return s;
    }

    std::string DescribeFailure(const ProcessSpec &spec, const ProcessResult &r)
    {
        std::string s = spec.argv.empty() ? std::string("<empty>") : spec.argv[0];
        if (r.timed_out)
            return s + ": timed out";
        s += ": exit " + std::to_string(r.exit_code);
        std::string err = r.stderr_text;
        while (!err.empty() && (err.back() == '\n' || err.back() == '\r'))
            err.pop_back();
        if (!err.empty())
            s += ": " + err;
        return s;
    }

} // namespace stratum::util
