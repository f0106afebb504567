#include "tracker.hpp"

#include <spdlog/spdlog.h>

WorkTracker::WorkTracker(TimeService &service) : m_Service(service) {}

// ─────────────────────────────────────
void WorkTracker::LoadTags() {
    auto tags = m_Service.GetTags();

    std::lock_guard<std::mutex> lock(m_Mutex);
    m_TagIds.clear();
    spdlog::info("Available Tags:");
    for (const auto &tag : tags) {
        spdlog::info(" - {}", tag.name);
        m_TagIds[tag.name] = tag.id;
    }
}

// ─────────────────────────────────────
Decision WorkTracker::Update(Signal signal, bool value) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    switch (signal) {
    case Signal::AtWork:
        m_State.at_work = value;
        break;
    case Signal::OnLaptop:
        m_State.on_laptop = value;
        break;
    case Signal::OnPhone:
        m_State.on_phone = value;
        break;
    }

    spdlog::info("{} = {} -> state {{at_work: {}, on_laptop: {}, on_phone: {}}}",
                 SignalName(signal), value, m_State.at_work, m_State.on_laptop,
                 m_State.on_phone);

    Decision decision = EvaluateState(m_State);
    spdlog::debug("Decision: {}", ActionName(decision.action));
    Apply(decision);
    return decision;
}

// ─────────────────────────────────────
void WorkTracker::Apply(const Decision &decision) {
    switch (decision.action) {
    case Action::ClockIn: {
        spdlog::info("Clock in: '{}' {}", decision.label, decision.tag);
        std::string tagId;
        auto it = m_TagIds.find(decision.tag);
        if (it != m_TagIds.end()) {
            tagId = it->second;
        } else {
            spdlog::warn("Tag '{}' is not defined in the workspace, starting entry without tags",
                         decision.tag);
        }
        m_LastEntry = m_Service.StartTimeEntry(decision.label, tagId);
        break;
    }
    case Action::ClockOut:
        spdlog::info("Clock out");
        if (!m_LastEntry) {
            spdlog::warn("Nothing to clock out, no time entry was opened since startup");
            break;
        }
        m_Service.StopRunningTimeEntry(*m_LastEntry);
        break;
    case Action::None:
        spdlog::debug("No activity mapped for this state");
        break;
    }
}

// ─────────────────────────────────────
WorkingState WorkTracker::State() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_State;
}

// ─────────────────────────────────────
std::optional<TimeEntryRef> WorkTracker::LastTimeEntry() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_LastEntry;
}

// ─────────────────────────────────────
std::unordered_map<std::string, std::string> WorkTracker::Tags() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_TagIds;
}
