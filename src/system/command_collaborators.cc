#include "system/command_collaborators.h"

#include <filesystem>
#include <unistd.h>
#include <utility>

#include "util/logging.h"

namespace stratum::system
{
    namespace fs = std::filesystem;

    namespace
    {
        // Runs a configured command line; any non-zero exit is an ActionFailure.
        static Status RunConfigured(const util::CommandRunner &runner, const std::string &line, std::string_view what)
        {
            util::ProcessSpec spec;
            spec.argv = util::SplitCommandLine(line);
            if (spec.argv.empty())
                return Status::NotSupported(std::string(what) + ": no command configured");

            STRATUM_LOG_INFO("{}: {}", what, util::JoinCommandLine(spec.argv));
            util::ProcessResult r;
            auto st = runner(spec, &r);
            if (!st.ok())
                return Status::ActionFailure(std::string(what) + ": " + st.ToString());
            if (!r.succeeded())
            {
                STRATUM_LOG_ERROR("{} failed: {}", what, util::DescribeFailure(spec, r));
                return Status::ActionFailure(std::string(what) + ": " + util::DescribeFailure(spec, r));
            }
            return Status::Ok();
        }
    } // namespace

    std::string ExpandCommand(std::string_view tmpl, std::string_view key, std::string_view value)
    {
        const std::string needle = "{" + std::string(key) + "}";
        std::string out(tmpl);
        std::size_t pos = 0;
        while ((pos = out.find(needle, pos)) != std::string::npos)
        {
            out.replace(pos, needle.size(), value);
            pos += value.size();
        }
        return out;
    }

    std::optional<std::string> ParseAvailableRelease(std::string_view text)
    {
        constexpr std::string_view kMarker = "New release '";
        const std::size_t at = text.find(kMarker);
        if (at == std::string_view::npos)
            return std::nullopt;
        const std::size_t begin = at + kMarker.size();
        const std::size_t end = text.find('\'', begin);
        if (end == std::string_view::npos || end == begin)
            return std::nullopt;
        return std::string(text.substr(begin, end - begin));
    }

    CommandPackageSystem::CommandPackageSystem(std::string upgrade_command, std::string check_command,
                                               util::CommandRunner runner)
        : upgrade_command_(std::move(upgrade_command)),
          check_command_(std::move(check_command)),
          runner_(std::move(runner))
    {
    }

    std::optional<std::string> CommandPackageSystem::AvailableTarget()
    {
        util::ProcessSpec spec;
        spec.argv = util::SplitCommandLine(check_command_);
        if (spec.argv.empty())
            return std::nullopt;

        util::ProcessResult r;
        auto st = runner_(spec, &r);
        if (!st.ok())
        {
            STRATUM_LOG_WARN("release check could not run: {}", st.ToString());
            return std::nullopt;
        }
        // The checker signals "nothing new" through its exit status, so only
        // the output matters here.
        if (auto rel = ParseAvailableRelease(r.stdout_text))
            return rel;
        return ParseAvailableRelease(r.stderr_text);
    }

    Status CommandPackageSystem::Upgrade(const std::string &target)
    {
        return RunConfigured(runner_, ExpandCommand(upgrade_command_, "target", target), "upgrade to " + target);
    }

    CommandInitImageSystem::CommandInitImageSystem(std::string regenerate_command, std::string regenerate_all_command,
                                                   CollectorOptions tools, util::CommandRunner runner)
        : regenerate_command_(std::move(regenerate_command)),
          regenerate_all_command_(std::move(regenerate_all_command)),
          tools_(std::move(tools)),
          runner_(std::move(runner))
    {
    }

    Status CommandInitImageSystem::Regenerate(const std::string &kernel_version)
    {
        if (kernel_version.empty())
            return Status::InvalidArgument("regenerate: kernel version unknown");
        return RunConfigured(runner_, ExpandCommand(regenerate_command_, "kernel", kernel_version),
                             "regenerate init image for " + kernel_version);
    }

    Status CommandInitImageSystem::RegenerateAll()
    {
        return RunConfigured(runner_, regenerate_all_command_, "regenerate init images for all kernels");
    }

    std::set<std::string> CommandInitImageSystem::ListInstalledGenerators()
    {
        std::set<std::string> out;
        const fs::path root(tools_.sysroot.empty() ? std::string("/") : tools_.sysroot);
        for (const auto &name : {tools_.init_generator_a, tools_.init_generator_b})
        {
            for (const auto &dir : tools_.tool_path)
            {
                const std::string candidate = (root / fs::path(dir).relative_path() / name).string();
                if (::access(candidate.c_str(), X_OK) == 0)
                {
                    out.insert(name);
                    break;
                }
            }
        }
        return out;
    }

    CommandBootConfigurator::CommandBootConfigurator(std::string sync_command, util::CommandRunner runner)
        : sync_command_(std::move(sync_command)), runner_(std::move(runner))
    {
    }

    Status CommandBootConfigurator::Sync()
    {
        return RunConfigured(runner_, sync_command_, "boot config sync");
    }

} // namespace stratum::system
