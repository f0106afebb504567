#pragma once

#include <string>

#include "common.hpp"

enum class Action { ClockIn, ClockOut, None };

struct Decision {
    Action action = Action::None;
    std::string label;
    std::string tag;
};

// Maps the three observed booleans to what should happen upstream.
// (at_work, on_laptop, on_phone) = (true, false, true) has no mapping and yields Action::None.
Decision EvaluateState(const WorkingState &state);

const char *ActionName(Action action);
