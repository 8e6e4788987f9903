#pragma once
#include <optional>
#include <set>
#include <string>

#include "stratum/status.h"

namespace stratum
{

    // Capabilities the core consumes. It only looks at identifiers and
    // success/failure; how the work is done is up to the implementation.

    class PackageSystem
    {
    public:
        virtual ~PackageSystem() = default;

        // Next release the package system can upgrade to, if any.
        virtual std::optional<std::string> AvailableTarget() = 0;
        virtual Status Upgrade(const std::string &target) = 0;
    };

    class InitImageSystem
    {
    public:
        virtual ~InitImageSystem() = default;

        virtual Status Regenerate(const std::string &kernel_version) = 0;
        // Rebuilds the boot image of every kernel installed on the running
        // root, whatever generator that root carries.
        virtual Status RegenerateAll() = 0;
        virtual std::set<std::string> ListInstalledGenerators() = 0;
    };

    class BootConfigurator
    {
    public:
        virtual ~BootConfigurator() = default;

        virtual Status Sync() = 0;
    };

} // namespace stratum
