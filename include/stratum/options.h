#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "stratum/types.h"

namespace stratum
{

    // Release path and thresholds of one migration.
    struct MigrationPlan
    {
        std::string source_release = "24.04";
        std::string interim_release = "25.04"; // empty: single upgrade step
        std::string interim_codename = "plucky";
        std::string target_release = "25.10";
        std::string target_codename = "questing";
        KernelVersion min_kernel{6, 14};
        uint64_t min_free_bytes = 10ull << 30;

        bool HasInterim() const { return !interim_release.empty(); }
        const std::string &FirstRelease() const { return HasInterim() ? interim_release : target_release; }
        const std::string &FirstCodename() const { return HasInterim() ? interim_codename : target_codename; }
    };

    struct CollectorOptions
    {
        std::string sysroot = "/";
        std::vector<std::string> tool_path = {"/usr/local/sbin", "/usr/local/bin", "/usr/sbin",
                                              "/usr/bin", "/sbin", "/bin"};
        std::string init_generator_a = "update-initramfs";
        std::string init_generator_b = "dracut";
        std::string boot_sync_helper = "sync-mirror-boot";
        // Init image of a kernel; {kernel} is the running kernel release.
        std::string boot_image_template = "/boot/initrd.img-{kernel}";
    };

    struct CheckpointStoreOptions
    {
        std::vector<std::string> recognized_prefixes = {"pre-", "before-"};
        std::string safety_label = "before-rollback";
        // Container directly below the pool root that receives sub-units a
        // rollback moves aside. Never captured, never rolled back.
        std::string quarantine_container = "stratum-quarantine";
        // Seconds since epoch; tests substitute a fixed clock.
        std::function<uint64_t()> clock;
    };

    struct OrchestratorOptions
    {
        std::string state_dir = "/var/lib/stratum";
        MigrationPlan plan;
        CollectorOptions collector;
        CheckpointStoreOptions checkpoints;
    };

} // namespace stratum
