#include "thermo/job/JobState.hpp"

namespace thermo::job {

const char* toString(JobPhase phase) {
    switch (phase) {
        case JobPhase::Queued:       return "queued";
        case JobPhase::Started:      return "started";
        case JobPhase::Rendering:    return "rendering";
        case JobPhase::Transmitting: return "transmitting";
        case JobPhase::Completed:    return "completed";
        case JobPhase::Cancelled:    return "cancelled";
        case JobPhase::Failed:       return "failed";
    }
    return "unknown";
}

std::string JobState::describe() const {
    std::string out = toString(phase);
    if (phase == JobPhase::Rendering || phase == JobPhase::Transmitting) {
        out += '(' + std::to_string(pageIndex) + ')';
    } else if (phase == JobPhase::Failed) {
        out += "(" + reason + ")";
    }
    return out;
}

bool isValidTransition(const JobState& from, const JobState& to) {
    if (from.isTerminal()) {
        return false;
    }
    if (to.phase == JobPhase::Cancelled || to.phase == JobPhase::Failed) {
        return true;
    }

    switch (from.phase) {
        case JobPhase::Queued:
            return to.phase == JobPhase::Started;
        case JobPhase::Started:
            return to.phase == JobPhase::Rendering && to.pageIndex == 0;
        case JobPhase::Rendering:
            return to.phase == JobPhase::Transmitting && to.pageIndex == from.pageIndex;
        case JobPhase::Transmitting:
            return (to.phase == JobPhase::Rendering && to.pageIndex == from.pageIndex + 1)
                || to.phase == JobPhase::Completed;
        default:
            return false;
    }
}

} // namespace thermo::job
