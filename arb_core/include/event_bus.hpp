#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "entities/trade_event.hpp"
#include "entities/position.hpp"

// Durable record of trade events and running stats, shared with the
// dashboard through a JSON file:
//   {events:[...], trades_executed, total_pnl, current_position|null, last_update}
//
// Every record_* call appends one event and rewrites the whole file before
// returning. Reads reload the file first so a writer in another process is
// visible. If the file cannot be written the bus keeps going in memory.
class EventBus {
public:
    static constexpr std::size_t kMaxEvents = 100;

    explicit EventBus(std::string path);

    void record_entry(double size, double spot_price, double perp_price, double spread);
    void record_exit(double size, double spot_price, double perp_price, double net_pnl);
    void record_error(const std::string& message, const nlohmann::json& details = nlohmann::json::object());
    void record_opportunity(const std::string& message, const nlohmann::json& details = nlohmann::json::object());

    // Drop all events and stats
    void reset();

    std::vector<TradeEvent> list_recent(std::size_t limit = 50);
    EventStats get_stats();

    bool is_degraded() const;
    const std::string& path() const { return path_; }

private:
    void append(EventKind kind, std::string message, nlohmann::json details);
    bool load();
    void persist();

    std::string path_;
    mutable std::mutex mutex_;

    std::vector<TradeEvent> events_;
    long long trades_executed_ = 0;
    double total_pnl_ = 0.0;
    std::optional<Position> current_position_;
    bool degraded_ = false;
};

void to_json(nlohmann::json& j, const TradeEvent& e);
void from_json(const nlohmann::json& j, TradeEvent& e);
void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);
