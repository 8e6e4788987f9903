#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "stratum/status.h"

namespace stratum::util
{

    struct ProcessSpec
    {
        // argv[0] is looked up on PATH.
        std::vector<std::string> argv;
        std::uint64_t timeout_ms = 0; // 0: wait for as long as it takes
        std::size_t max_output_bytes = 1 << 20;
    };

    struct ProcessResult
    {
        int exit_code = -1;
        bool timed_out = false;
        std::string stdout_text;
        std::string stderr_text;

        bool succeeded() const { return !timed_out && exit_code == 0; }
    };

    // Runs a command to completion and captures its output. Non-zero status
    // only when the process could not be started; the command's own failure is
    // reported through ProcessResult::exit_code.
    stratum::Status RunProcess(const ProcessSpec &spec, ProcessResult *out);

    // RunProcess or a test double.
    using CommandRunner = std::function<stratum::Status(const ProcessSpec &, ProcessResult *)>;

    // "cmd a b" -> {"cmd","a","b"}; double quotes group words.
    std::vector<std::string> SplitCommandLine(const std::string &line);
    // Inverse of SplitCommandLine, for logs.
    std::string JoinCommandLine(const std::vector<std::string> &argv);

    // Builds a short error text from a failed result.
    std::string DescribeFailure(const ProcessSpec &spec, const ProcessResult &r);

} // namespace stratum::util
