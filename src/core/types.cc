#include "stratum/status.h"
#include "stratum/types.h"

#include <array>
#include <charconv>
#include <utility>

#include "util/text.h"

namespace stratum
{
    namespace
    {
        constexpr std::array<std::pair<Phase, const char *>, 11> kPhaseNames = {{
            {Phase::kNotStarted, "NotStarted"},
            {Phase::kPreflightVerified, "PreflightVerified"},
            {Phase::kCheckpointed, "Checkpointed"},
            {Phase::kPackagesUpgraded, "PackagesUpgraded"},
            {Phase::kRebootedStep1, "Rebooted(step1)"},
            {Phase::kRebootedStep2, "Rebooted(step2)"},
            {Phase::kInitSystemMigrated, "InitSystemMigrated"},
            {Phase::kBootConfigSynced, "BootConfigSynced"},
            {Phase::kValidated, "Validated"},
            {Phase::kComplete, "Complete"},
            {Phase::kRolledBack, "RolledBack"},
        }};

        constexpr std::array<std::pair<ActionKind, const char *>, 5> kActionNames = {{
            {ActionKind::kNone, "none"},
            {ActionKind::kUpgradePackages, "upgrade-packages"},
            {ActionKind::kReboot, "reboot"},
            {ActionKind::kRegenerateInitImage, "regenerate-init-image"},
            {ActionKind::kSyncBootConfig, "sync-boot-config"},
        }};

        constexpr std::array<std::pair<HistoryEvent, const char *>, 13> kEventNames = {{
            {HistoryEvent::kStarted, "started"},
            {HistoryEvent::kAdvanced, "advanced"},
            {HistoryEvent::kReconciled, "reconciled"},
            {HistoryEvent::kCheckpointed, "checkpointed"},
            {HistoryEvent::kActionIssued, "action-issued"},
            {HistoryEvent::kActionApplied, "action-applied"},
            {HistoryEvent::kPreconditionFailure, "precondition-failure"},
            {HistoryEvent::kCheckpointFailure, "checkpoint-failure"},
            {HistoryEvent::kActionFailure, "action-failure"},
            {HistoryEvent::kUnverified, "unverified"},
            {HistoryEvent::kRolledBack, "rolled-back"},
            {HistoryEvent::kRollbackUnverified, "rollback-unverified"},
            {HistoryEvent::kRollbackFailure, "rollback-failure"},
        }};

        template <typename E, std::size_t N>
        const char *NameOf(const std::array<std::pair<E, const char *>, N> &table, E v)
        {
            for (const auto &[e, name] : table)
                if (e == v)
                    return name;
            return "unknown";
        }

        template <typename E, std::size_t N>
        std::optional<E> Lookup(const std::array<std::pair<E, const char *>, N> &table, std::string_view name)
        {
            for (const auto &[e, n] : table)
                if (name == n)
                    return e;
            return std::nullopt;
        }

        bool ParseU32Prefix(std::string_view &s, uint32_t *out)
        {
            const char *begin = s.data();
            const char *end = s.data() + s.size();
            auto [ptr, ec] = std::from_chars(begin, end, *out);
            if (ec != std::errc() || ptr == begin)
                return false;
            s.remove_prefix(static_cast<std::size_t>(ptr - begin));
            return true;
        }
    } // namespace

    const char *ErrorCodeName(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "InvalidArgument";
        case ErrorCode::kNotFound:
            return "NotFound";
        case ErrorCode::kAlreadyExists:
            return "AlreadyExists";
        case ErrorCode::kIO:
            return "IOError";
        case ErrorCode::kCorruption:
            return "Corruption";
        case ErrorCode::kNotSupported:
            return "NotSupported";
        case ErrorCode::kInternal:
            return "Internal";
        case ErrorCode::kPreconditionFailure:
            return "PreconditionFailure";
        case ErrorCode::kCheckpointFailure:
            return "CheckpointFailure";
        case ErrorCode::kActionFailure:
            return "ActionFailure";
        case ErrorCode::kPostconditionFailure:
            return "PostconditionFailure";
        case ErrorCode::kRollbackFailure:
            return "RollbackFailure";
        }
        return "Unknown";
    }

    const char *PhaseName(Phase p) noexcept { return NameOf(kPhaseNames, p); }
    std::optional<Phase> ParsePhase(std::string_view name) { return Lookup(kPhaseNames, name); }

    const char *ActionKindName(ActionKind k) noexcept { return NameOf(kActionNames, k); }
    std::optional<ActionKind> ParseActionKind(std::string_view name) { return Lookup(kActionNames, name); }

    const char *HistoryEventName(HistoryEvent e) noexcept { return NameOf(kEventNames, e); }
    std::optional<HistoryEvent> ParseHistoryEvent(std::string_view name) { return Lookup(kEventNames, name); }

    const char *PoolHealthName(PoolHealth h) noexcept
    {
        switch (h)
        {
        case PoolHealth::kHealthy:
            return "healthy";
        case PoolHealth::kDegraded:
            return "degraded";
        case PoolHealth::kFaulted:
            return "faulted";
        case PoolHealth::kAbsent:
            return "absent";
        }
        return "absent";
    }

    const char *OutcomeName(Outcome o) noexcept
    {
        switch (o)
        {
        case Outcome::kSuccess:
            return "success";
        case Outcome::kUnverified:
            return "unverified";
        case Outcome::kFailure:
            return "failure";
        }
        return "failure";
    }

    std::optional<KernelVersion> KernelVersion::Parse(std::string_view text)
    {
        text = util::Trim(text);
        KernelVersion v;
        if (!ParseU32Prefix(text, &v.major))
            return std::nullopt;
        if (text.empty() || text.front() != '.')
            return std::nullopt;
        text.remove_prefix(1);
        if (!ParseU32Prefix(text, &v.minor))
            return std::nullopt;
        return v;
    }

    std::string KernelVersion::ToString() const
    {
        return std::to_string(major) + "." + std::to_string(minor);
    }

    std::string SystemFacts::Summary() const
    {
        std::string s = "release=" + release.value_or("?");
        s += " kernel=" + (kernel ? kernel->ToString() : std::string("?"));
        s += " pool=";
        s += PoolHealthName(pool);
        s += " gen_a=";
        s += tools.init_generator_a ? "1" : "0";
        s += " gen_b=";
        s += tools.init_generator_b ? "1" : "0";
        s += " boot_sync=";
        s += tools.boot_sync_helper ? "1" : "0";
        s += " boot_image=";
        s += boot_image_bytes ? "1" : "0";
        if (free_bytes)
            s += " free_gb=" + std::to_string(*free_bytes >> 30);
        return s;
    }

    std::string CheckpointKey::ToString() const
    {
        return label + "@" + std::to_string(created_at);
    }

    std::optional<CheckpointKey> CheckpointKey::Parse(std::string_view text)
    {
        auto at = text.rfind('@');
        if (at == std::string_view::npos || at == 0)
            return std::nullopt;
        CheckpointKey k;
        k.label = std::string(text.substr(0, at));
        if (!util::ParseU64(text.substr(at + 1), &k.created_at))
            return std::nullopt;
        return k;
    }

    std::vector<std::string> CheckpointGroup::Units() const
    {
        std::vector<std::string> out;
        out.reserve(checkpoints.size());
        for (const auto &c : checkpoints)
            out.push_back(c.unit);
        return out;
    }

} // namespace stratum
