#include "system/action_dispatcher.h"

#include <utility>

#include "util/logging.h"

namespace stratum::system
{

    ActionDispatcher::ActionDispatcher(Collaborators deps, std::function<Status()> reboot)
        : deps_(std::move(deps)), reboot_(std::move(reboot))
    {
    }

    bool ActionDispatcher::CanExecute(const RequiredAction &action) const
    {
        return action.kind != ActionKind::kReboot || static_cast<bool>(reboot_);
    }

    Status ActionDispatcher::Run(const RequiredAction &action)
    {
        switch (action.kind)
        {
        case ActionKind::kNone:
            return Status::Ok();
        case ActionKind::kUpgradePackages:
            if (!deps_.packages)
                return Status::NotSupported("no package system configured");
            if (auto offered = deps_.packages->AvailableTarget(); offered && *offered != action.target)
                STRATUM_LOG_WARN("package system offers {}, upgrading to {} as planned", *offered, action.target);
            return deps_.packages->Upgrade(action.target);
        case ActionKind::kReboot:
            if (!reboot_)
                return Status::NotSupported("reboot must be performed by the operator");
            return reboot_();
        case ActionKind::kRegenerateInitImage:
            if (!deps_.init_images)
                return Status::NotSupported("no init-image system configured");
            return deps_.init_images->Regenerate(action.target);
        case ActionKind::kSyncBootConfig:
            if (!deps_.boot)
                return Status::NotSupported("no boot configurator configured");
            return deps_.boot->Sync();
        }
        return Status::Internal("unknown action kind");
    }

    ActionReport ActionDispatcher::Execute(const RequiredAction &action)
    {
        STRATUM_LOG_INFO("executing {} ({} -> {}){}", ActionKindName(action.kind), PhaseName(action.from),
                         PhaseName(action.to), action.target.empty() ? "" : " target " + action.target);
        auto st = Run(action);
        ActionReport r;
        r.success = st.ok();
        r.detail = st.ok() ? std::string(ActionKindName(action.kind)) + " done" : st.ToString();
        if (!st.ok())
            STRATUM_LOG_ERROR("{} failed: {}", ActionKindName(action.kind), st.ToString());
        return r;
    }

} // namespace stratum::system
