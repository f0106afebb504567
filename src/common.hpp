#pragma once

#include <string>

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

enum class Signal { AtWork, OnLaptop, OnPhone };

struct WorkingState {
    bool at_work = false;
    bool on_laptop = false;
    bool on_phone = false;
};

struct Tag {
    std::string id;
    std::string name;
};

// Last opened entry, kept so it can be closed later
struct TimeEntryRef {
    std::string id;
    std::string user_id;
};

const char *SignalName(Signal signal);
