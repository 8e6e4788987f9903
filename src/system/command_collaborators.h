#pragma once
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "stratum/collaborators.h"
#include "stratum/options.h"
#include "util/subprocess.h"

namespace stratum::system
{

    // Replaces every "{key}" in `tmpl` with `value`.
    std::string ExpandCommand(std::string_view tmpl, std::string_view key, std::string_view value);

    // "New release '25.04' available." -> "25.04"
    std::optional<std::string> ParseAvailableRelease(std::string_view text);

    // Package upgrades through configured commands. `upgrade_command` may use
    // {target}; `check_command` prints the next release when one is offered.
    class CommandPackageSystem final : public PackageSystem
    {
    public:
        CommandPackageSystem(std::string upgrade_command, std::string check_command,
                             util::CommandRunner runner = util::RunProcess);

        std::optional<std::string> AvailableTarget() override;
        Status Upgrade(const std::string &target) override;

    private:
        std::string upgrade_command_;
        std::string check_command_;
        util::CommandRunner runner_;
    };

    // `regenerate_command` may use {kernel}; `regenerate_all_command` covers
    // every installed kernel. Installed generators are looked up on the
    // collector's tool path.
    class CommandInitImageSystem final : public InitImageSystem
    {
    public:
        CommandInitImageSystem(std::string regenerate_command, std::string regenerate_all_command,
                               CollectorOptions tools, util::CommandRunner runner = util::RunProcess);

        Status Regenerate(const std::string &kernel_version) override;
        Status RegenerateAll() override;
        std::set<std::string> ListInstalledGenerators() override;

    private:
        std::string regenerate_command_;
        std::string regenerate_all_command_;
        CollectorOptions tools_;
        util::CommandRunner runner_;
    };

    class CommandBootConfigurator final : public BootConfigurator
    {
    public:
        explicit CommandBootConfigurator(std::string sync_command, util::CommandRunner runner = util::RunProcess);

        Status Sync() override;

    private:
        std::string sync_command_;
        util::CommandRunner runner_;
    };

} // namespace stratum::system
