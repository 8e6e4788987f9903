#pragma once
#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "stratum/collaborators.h"
#include "util/subprocess.h"

namespace stratum::test
{

    // Collaborators that record their calls and run an optional side effect
    // (usually editing a FakeSysroot) when they succeed.

    class FakePackageSystem final : public PackageSystem
    {
    public:
        std::optional<std::string> offered;
        Status result = Status::Ok();
        std::function<void(const std::string &)> on_upgrade;
        std::vector<std::string> upgrades;

        std::optional<std::string> AvailableTarget() override { return offered; }
        Status Upgrade(const std::string &target) override
        {
            upgrades.push_back(target);
            if (result.ok() && on_upgrade)
                on_upgrade(target);
            return result;
        }
    };

    class FakeInitImageSystem final : public InitImageSystem
    {
    public:
        std::set<std::string> installed = {"update-initramfs", "dracut"};
        Status result = Status::Ok();
        std::function<void(const std::string &)> on_regenerate;
        std::vector<std::string> regenerated;
        int regenerate_all_calls = 0;

        Status Regenerate(const std::string &kernel_version) override
        {
            regenerated.push_back(kernel_version);
            if (result.ok() && on_regenerate)
                on_regenerate(kernel_version);
            return result;
        }
        Status RegenerateAll() override
        {
            ++regenerate_all_calls;
            return result;
        }
        std::set<std::string> ListInstalledGenerators() override { return installed; }
    };

    class FakeBootConfigurator final : public BootConfigurator
    {
    public:
        Status result = Status::Ok();
        int syncs = 0;

        Status Sync() override
        {
            ++syncs;
            return result;
        }
    };

    // CommandRunner double: records each argv and answers from a queue of
    // canned results (the last one repeats).
    class ScriptedRunner
    {
    public:
        struct Reply
        {
            Status status = Status::Ok();
            util::ProcessResult result;
        };

        static Reply Exit(int code, std::string out = "", std::string err = "")
        {
            Reply r;
            r.result.exit_code = code;
            r.result.stdout_text = std::move(out);
            r.result.stderr_text = std::move(err);
            return r;
        }

        void Push(Reply r) { replies_.push_back(std::move(r)); }

        util::CommandRunner Runner()
        {
            return [this](const util::ProcessSpec &spec, util::ProcessResult *out)
            {
                calls.push_back(spec.argv);
                Reply r = replies_.empty() ? Exit(0) : replies_.front();
                if (replies_.size() > 1)
                    replies_.pop_front();
                *out = r.result;
                return r.status;
            };
        }

        std::vector<std::vector<std::string>> calls;

    private:
        std::deque<Reply> replies_;
    };

} // namespace stratum::test
