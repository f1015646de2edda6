#include "entities/trade_event.hpp"
#include <stdexcept>

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Entry:       return "entry";
        case EventKind::Exit:        return "exit";
        case EventKind::Opportunity: return "opportunity";
        case EventKind::Error:       return "error";
    }
    return "error";
}

EventKind event_kind_from_name(const std::string& name) {
    if (name == "entry") return EventKind::Entry;
    if (name == "exit") return EventKind::Exit;
    if (name == "opportunity") return EventKind::Opportunity;
    if (name == "error") return EventKind::Error;
    throw std::invalid_argument("unknown event type: " + name);
}
