#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "stratum/collaborators.h"
#include "stratum/options.h"
#include "stratum/snapshot_backend.h"
#include "stratum/types.h"

namespace stratum::core
{

    // Side-effect-free read of the running system. Every path is resolved
    // under CollectorOptions::sysroot so a fake root can stand in for "/".
    // A fact that cannot be read is left empty; Collect() never fails.
    class FactCollector
    {
    public:
        FactCollector(CollectorOptions opts, std::shared_ptr<SnapshotBackend> backend,
                      std::shared_ptr<InitImageSystem> init_images = nullptr);

        SystemFacts Collect() const;

        // VERSION_ID from an os-release file.
        static std::optional<std::string> ParseOsRelease(std::string_view text);

    private:
        std::string Under(std::string_view path) const;
        bool FindTool(const std::string &name) const;
        std::optional<uint64_t> BootImageBytes(const std::string &kernel_release) const;

        CollectorOptions opts_;
        std::shared_ptr<SnapshotBackend> backend_;
        std::shared_ptr<InitImageSystem> init_images_;
    };

} // namespace stratum::core
