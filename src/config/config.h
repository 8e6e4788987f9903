#pragma once
#include <string>

#include "stratum/options.h"
#include "stratum/status.h"

namespace stratum::config
{

    struct Config
    {
        std::string state_dir = "/var/lib/stratum";
        std::string pool = "rpool";

        MigrationPlan plan;
        CollectorOptions collector;

        std::string upgrade_command = "do-release-upgrade -f DistUpgradeViewNonInteractive";
        std::string upgrade_check_command = "do-release-upgrade -c";
        std::string regenerate_command = "dracut --force --kver {kernel}";
        // Run after a rollback, on whatever root was restored.
        std::string regenerate_all_command = "update-initramfs -u -k all";
        std::string boot_sync_command = "sync-mirror-boot";

        std::string log_level = "INFO";
        std::string log_path; // empty: stderr only
    };

    // Parses a "key: value" file over the defaults above. A missing file
    // leaves the defaults; a malformed value is InvalidArgument naming the
    // line. Unknown keys are logged and ignored.
    Status LoadConfigFile(const std::string &path, Config *out);

    // Parses one "key: value" pair into `cfg`. NotFound for unknown keys.
    Status ApplyKey(const std::string &key, const std::string &value, Config *cfg);

    OrchestratorOptions ToOptions(const Config &cfg);

    // Applies log_level / log_path to the process logger.
    Status ApplyLogging(const Config &cfg);

} // namespace stratum::config
