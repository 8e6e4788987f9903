#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stratum
{

    // Position in the migration. Declaration order is progress order; kRolledBack
    // sits outside the chain.
    enum class Phase : uint8_t
    {
        kNotStarted = 0,
        kPreflightVerified = 1,
        kCheckpointed = 2,
        kPackagesUpgraded = 3,
        kRebootedStep1 = 4,
        kRebootedStep2 = 5,
        kInitSystemMigrated = 6,
        kBootConfigSynced = 7,
        kValidated = 8,
        kComplete = 9,
        kRolledBack = 10,
    };

    const char *PhaseName(Phase p) noexcept;
    std::optional<Phase> ParsePhase(std::string_view name);

    inline bool IsTerminal(Phase p) noexcept
    {
        return p == Phase::kComplete || p == Phase::kRolledBack;
    }

    // True when `a` is further along the chain than `b`. kRolledBack compares as
    // never ahead of anything.
    inline bool IsAhead(Phase a, Phase b) noexcept
    {
        if (a == Phase::kRolledBack || b == Phase::kRolledBack)
            return false;
        return static_cast<uint8_t>(a) > static_cast<uint8_t>(b);
    }

    enum class PoolHealth : uint8_t
    {
        kHealthy = 0,
        kDegraded = 1,
        kFaulted = 2,
        kAbsent = 3,
    };

    const char *PoolHealthName(PoolHealth h) noexcept;

    inline bool PoolUsable(PoolHealth h) noexcept
    {
        return h == PoolHealth::kHealthy || h == PoolHealth::kDegraded;
    }

    struct KernelVersion
    {
        uint32_t major = 0;
        uint32_t minor = 0;

        // Accepts "6.14", "6.14.0-27-generic" and similar; nullopt when the
        // leading major.minor pair is missing.
        static std::optional<KernelVersion> Parse(std::string_view text);

        std::string ToString() const;

        friend bool operator==(const KernelVersion &, const KernelVersion &) = default;
        friend auto operator<=>(const KernelVersion &, const KernelVersion &) = default;
    };

    struct ToolPresence
    {
        bool init_generator_a = false; // legacy initramfs generator
        bool init_generator_b = false; // replacement initramfs generator
        bool boot_sync_helper = false;
    };

    // Ground truth read from the running system. Missing facts stay empty rather
    // than failing the collection.
    struct SystemFacts
    {
        std::optional<std::string> release;
        std::optional<std::string> kernel_release; // raw uname release
        std::optional<KernelVersion> kernel;
        PoolHealth pool = PoolHealth::kAbsent;
        ToolPresence tools;
        std::optional<std::string> boot_id;
        std::optional<uint64_t> free_bytes;
        // Size of the running kernel's init image; empty when there is none.
        std::optional<uint64_t> boot_image_bytes;

        std::string Summary() const;
    };

    // Key shared by every checkpoint of one group.
    struct CheckpointKey
    {
        std::string label;
        uint64_t created_at = 0;

        std::string ToString() const; // "label@created_at"
        static std::optional<CheckpointKey> Parse(std::string_view text);

        friend bool operator==(const CheckpointKey &, const CheckpointKey &) = default;
    };

    // Capture of one storage unit. Immutable once complete.
    struct Checkpoint
    {
        std::string unit;
        std::string name; // substrate snapshot name, display only
        CheckpointKey key;
        std::string run_id;
        Phase phase = Phase::kNotStarted; // phase when the group was created
        uint32_t unit_count = 0;          // units known when the group was created
        bool complete = false;
    };

    struct CheckpointGroup
    {
        CheckpointKey key;
        std::string run_id;
        Phase phase = Phase::kNotStarted;
        uint32_t expected_units = 0;
        std::vector<Checkpoint> checkpoints;
        bool consistent = false;

        std::vector<std::string> Units() const;
    };

    // A unit that appeared below a checkpointed unit after the capture and was
    // moved out of the way by a rollback, snapshots included.
    struct QuarantinedUnit
    {
        std::string unit;
        std::string moved_to;
    };

    // Three-way result surfaced to front ends.
    enum class Outcome : uint8_t
    {
        kSuccess = 0,
        kUnverified = 1,
        kFailure = 2,
    };

    const char *OutcomeName(Outcome o) noexcept;

    enum class ActionKind : uint8_t
    {
        kNone = 0,
        kUpgradePackages = 1,
        kReboot = 2,
        kRegenerateInitImage = 3,
        kSyncBootConfig = 4,
    };

    const char *ActionKindName(ActionKind k) noexcept;
    std::optional<ActionKind> ParseActionKind(std::string_view name);

    enum class HistoryEvent : uint8_t
    {
        kStarted = 0,
        kAdvanced = 1,
        kReconciled = 2,
        kCheckpointed = 3,
        kActionIssued = 4,
        kActionApplied = 5,
        kPreconditionFailure = 6,
        kCheckpointFailure = 7,
        kActionFailure = 8,
        kUnverified = 9,
        kRolledBack = 10,
        kRollbackUnverified = 11,
        kRollbackFailure = 12,
    };

    const char *HistoryEventName(HistoryEvent e) noexcept;
    std::optional<HistoryEvent> ParseHistoryEvent(std::string_view name);

    struct HistoryEntry
    {
        uint64_t timestamp = 0;
        Phase from = Phase::kNotStarted;
        Phase to = Phase::kNotStarted;
        HistoryEvent event = HistoryEvent::kStarted;
        std::string detail;
        std::string facts; // SystemFacts::Summary() at the time
    };

    // Action issued by Step() and not yet committed.
    struct PendingAction
    {
        ActionKind kind = ActionKind::kNone;
        Phase from = Phase::kNotStarted;
        Phase to = Phase::kNotStarted;
        std::string target;  // release or kernel, depending on kind
        std::string boot_id; // boot id when issued
        uint64_t issued_at = 0;
        bool reboot_after = false;
        bool applied = false; // action reported success; waiting for the reboot
    };

    struct MigrationState
    {
        uint32_t schema_version = 1;
        std::string run_id;
        Phase current_phase = Phase::kNotStarted;
        std::optional<CheckpointKey> last_checkpoint_group;
        std::optional<PendingAction> pending;
        std::vector<HistoryEntry> history;
    };

} // namespace stratum
