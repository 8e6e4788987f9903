#pragma once
#include <functional>

#include "stratum/orchestrator.h"

namespace stratum::system
{

    // Runs a RequiredAction against the collaborators and turns the result
    // into the report Commit() expects. Reboots are left to the operator
    // unless a reboot hook is supplied.
    class ActionDispatcher
    {
    public:
        explicit ActionDispatcher(Collaborators deps, std::function<Status()> reboot = nullptr);

        ActionReport Execute(const RequiredAction &action);

        // False for actions this process cannot finish itself (a reboot with
        // no hook).
        bool CanExecute(const RequiredAction &action) const;

    private:
        Status Run(const RequiredAction &action);

        Collaborators deps_;
        std::function<Status()> reboot_;
    };

} // namespace stratum::system
