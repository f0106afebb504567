#include "common.hpp"

// ─────────────────────────────────────
const char *SignalName(Signal signal) {
    switch (signal) {
    case Signal::AtWork:
        return "at_work";
    case Signal::OnLaptop:
        return "on_laptop";
    case Signal::OnPhone:
        return "on_phone";
    }
    return "unknown";
}
