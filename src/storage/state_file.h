#pragma once
#include <string>
#include <string_view>

#include "stratum/status.h"
#include "stratum/types.h"

namespace stratum::storage
{

    // The persisted MigrationState: one versioned text record per state
    // directory, guarded by a CRC32C trailer and replaced atomically
    // (write tmp, fsync, rename, fsync dir).
    class StateFile
    {
    public:
        static constexpr uint32_t kSchemaVersion = 1;

        // NotFound when no record exists yet.
        static Status Load(std::string_view state_dir, MigrationState *out);
        static Status Save(std::string_view state_dir, const MigrationState &state);

        static std::string Path(std::string_view state_dir);

        // Exposed for tests.
        static std::string Serialize(const MigrationState &state);
        static Status Parse(std::string_view content, MigrationState *out);
    };

} // namespace stratum::storage
