#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace thermo::job {

enum class JobPhase : std::uint8_t {
    Queued,
    Started,
    Rendering,
    Transmitting,
    Completed,
    Cancelled,
    Failed
};

const char* toString(JobPhase phase);

/**
 * @brief Where a print job is in its lifecycle.
 *
 * Rendering and Transmitting carry the zero-based page index; Failed carries
 * the human-readable reason. Completed, Cancelled and Failed are terminal.
 */
struct JobState {
    JobPhase phase = JobPhase::Queued;
    int pageIndex = -1;
    std::string reason;

    static JobState queued() { return {}; }
    static JobState started() { return {JobPhase::Started, -1, {}}; }
    static JobState rendering(int page) { return {JobPhase::Rendering, page, {}}; }
    static JobState transmitting(int page) { return {JobPhase::Transmitting, page, {}}; }
    static JobState completed() { return {JobPhase::Completed, -1, {}}; }
    static JobState cancelled() { return {JobPhase::Cancelled, -1, {}}; }
    static JobState failed(std::string why) { return {JobPhase::Failed, -1, std::move(why)}; }

    bool isTerminal() const {
        return phase == JobPhase::Completed || phase == JobPhase::Cancelled || phase == JobPhase::Failed;
    }

    std::string describe() const;
};

/**
 * @brief Lifecycle rule: forward only, one page at a time.
 *
 * Queued -> Started -> Rendering(0) -> Transmitting(0) -> Rendering(1) ...
 * -> Completed after the last Transmitting. Cancelled and Failed are
 * reachable from every non-terminal state. Nothing leaves a terminal state.
 */
bool isValidTransition(const JobState& from, const JobState& to);

} // namespace thermo::job
