#pragma once

namespace policy {

enum class GateState {
    Generated,
    Classified,
    AutoApproved,
    PendingConfirmation,
    Approved,
    Denied,
    Failed,
    Logged,
};

inline const char* ToString(GateState state) {
    switch (state) {
    case GateState::Generated:
        return "generated";
    case GateState::Classified:
        return "classified";
    case GateState::AutoApproved:
        return "auto-approved";
    case GateState::PendingConfirmation:
        return "pending-confirmation";
    case GateState::Approved:
        return "approved";
    case GateState::Denied:
        return "denied";
    case GateState::Failed:
        return "failed";
    case GateState::Logged:
        return "logged";
    }

    return "failed";
}

} // namespace policy
