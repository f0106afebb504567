#include "evaluator.hpp"

#include <array>

namespace {
struct Row {
    Action action;
    const char *label;
    const char *tag;
};

// Indexed by at_work << 2 | on_laptop << 1 | on_phone
constexpr std::array<Row, 8> kTable = {{
    {Action::ClockOut, "", ""},                     // F F F
    {Action::ClockIn, "Remote Work/Call", "@Phone"}, // F F T
    {Action::ClockIn, "Remote Work", "@PC"},         // F T F
    {Action::ClockIn, "Remote Work", "@Phone"},      // F T T
    {Action::ClockIn, "Normal Work", "@Work"},       // T F F
    {Action::None, "", ""},                         // T F T
    {Action::ClockIn, "Normal Work", "@PC"},         // T T F
    {Action::ClockIn, "Normal Work", "@Phone"},      // T T T
}};
} // namespace

// ─────────────────────────────────────
Decision EvaluateState(const WorkingState &state) {
    const size_t index = (state.at_work ? 4u : 0u) | (state.on_laptop ? 2u : 0u) |
                         (state.on_phone ? 1u : 0u);
    const Row &row = kTable[index];
    return Decision{row.action, row.label, row.tag};
}

// ─────────────────────────────────────
const char *ActionName(Action action) {
    switch (action) {
    case Action::ClockIn:
        return "clock in";
    case Action::ClockOut:
        return "clock out";
    case Action::None:
        return "none";
    }
    return "none";
}

