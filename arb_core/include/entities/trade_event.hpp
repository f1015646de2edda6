#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "position.hpp"

enum class EventKind {
    Entry,
    Exit,
    Opportunity,
    Error
};

const char* event_kind_name(EventKind kind);
EventKind event_kind_from_name(const std::string& name);

struct TradeEvent {
    std::string timestamp; // ISO-8601 local time
    EventKind kind = EventKind::Error;
    std::string message;
    nlohmann::json details = nlohmann::json::object();
};

struct EventStats {
    long long trades_executed = 0;
    double total_pnl = 0.0;
    std::optional<Position> current_position;
};
