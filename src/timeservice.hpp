#pragma once

#include <string>
#include <vector>

#include "common.hpp"

// Upstream time-tracking service as seen by WorkTracker.
class TimeService {
  public:
    virtual ~TimeService() = default;

    virtual std::vector<Tag> GetTags() = 0;

    //! Opens a new entry starting now. An empty tagId starts the entry without tags.
    virtual TimeEntryRef StartTimeEntry(const std::string &description, const std::string &tagId) = 0;

    //! Stops whatever entry is running for ref.user_id, ending it now.
    virtual void StopRunningTimeEntry(const TimeEntryRef &ref) = 0;
};
