#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "common.hpp"
#include "evaluator.hpp"
#include "timeservice.hpp"

// Owns the working state and turns each change into upstream clock in/out calls.
// Update() is serialized, including the upstream call it makes.
class WorkTracker {
  public:
    explicit WorkTracker(TimeService &service);

    void LoadTags();

    //! Sets one field, re-evaluates the whole state and applies the result.
    //! Upstream errors propagate; the field keeps its new value.
    Decision Update(Signal signal, bool value);

    WorkingState State() const;
    std::optional<TimeEntryRef> LastTimeEntry() const;
    std::unordered_map<std::string, std::string> Tags() const;

  private:
    void Apply(const Decision &decision);

    TimeService &m_Service;

    mutable std::mutex m_Mutex;
    WorkingState m_State;
    std::unordered_map<std::string, std::string> m_TagIds; // name -> id
    std::optional<TimeEntryRef> m_LastEntry;
};
