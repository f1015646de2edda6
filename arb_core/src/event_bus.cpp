#include "event_bus.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "time_utils.hpp"

void to_json(nlohmann::json& j, const TradeEvent& e) {
    j = nlohmann::json{
        {"timestamp", e.timestamp},
        {"event_type", event_kind_name(e.kind)},
        {"message", e.message},
        {"details", e.details.is_null() ? nlohmann::json::object() : e.details}
    };
}

void from_json(const nlohmann::json& j, TradeEvent& e) {
    e.timestamp = j.at("timestamp").get<std::string>();
    e.kind = event_kind_from_name(j.at("event_type").get<std::string>());
    e.message = j.at("message").get<std::string>();
    e.details = j.contains("details") && !j["details"].is_null() ? j["details"] : nlohmann::json::object();
}

// Key names are what the dashboard reads
void to_json(nlohmann::json& j, const Position& p) {
    j = nlohmann::json{
        {"size", p.size},
        {"entry_spot", p.entry_spot_price},
        {"entry_perp", p.entry_perp_price},
        {"entry_spread", p.entry_spread},
        {"entry_time", p.entry_time}
    };
}

void from_json(const nlohmann::json& j, Position& p) {
    p.size = j.at("size").get<double>();
    p.entry_spot_price = j.at("entry_spot").get<double>();
    p.entry_perp_price = j.at("entry_perp").get<double>();
    p.entry_spread = j.value("entry_spread", 0.0);
    p.entry_time = j.value("entry_time", std::string());
}

static std::string money(double v, int decimals, bool sign = false) {
    std::ostringstream ss;
    if (sign) ss << std::showpos;
    ss << std::fixed << std::setprecision(decimals) << v;
    return ss.str();
}

EventBus::EventBus(std::string path)
    : path_(std::move(path))
{
    std::lock_guard<std::mutex> lock(mutex_);
    load();
}

bool EventBus::is_degraded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return degraded_;
}

void EventBus::record_entry(double size, double spot_price, double perp_price, double spread) {
    Position position;
    position.size = size;
    position.entry_spot_price = spot_price;
    position.entry_perp_price = perp_price;
    position.entry_spread = spread;
    position.entry_time = iso_now();

    std::string message = "ENTRY: " + money(size, 4) + " @ Spot $" + money(spot_price, 4)
                        + ", Perp $" + money(perp_price, 4);
    nlohmann::json details = {
        {"size", size}, {"spot_price", spot_price}, {"perp_price", perp_price}, {"spread", spread}
    };

    std::lock_guard<std::mutex> lock(mutex_);
    current_position_ = position;
    append(EventKind::Entry, std::move(message), std::move(details));
}

void EventBus::record_exit(double size, double spot_price, double perp_price, double net_pnl) {
    std::string message = "EXIT: " + money(size, 4) + " @ Spot $" + money(spot_price, 4)
                        + ", Perp $" + money(perp_price, 4) + " | P&L: $" + money(net_pnl, 4, true);
    nlohmann::json details = {
        {"size", size}, {"spot_price", spot_price}, {"perp_price", perp_price}, {"net_pnl", net_pnl}
    };

    std::lock_guard<std::mutex> lock(mutex_);
    trades_executed_ += 1;
    total_pnl_ += net_pnl;
    current_position_.reset();
    append(EventKind::Exit, std::move(message), std::move(details));
}

void EventBus::record_error(const std::string& message, const nlohmann::json& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    append(EventKind::Error, "ERROR: " + message, details);
}

void EventBus::record_opportunity(const std::string& message, const nlohmann::json& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    append(EventKind::Opportunity, message, details);
}

void EventBus::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
    trades_executed_ = 0;
    total_pnl_ = 0.0;
    current_position_.reset();
    persist();
}

std::vector<TradeEvent> EventBus::list_recent(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    load();
    std::size_t n = std::min(limit, events_.size());
    return std::vector<TradeEvent>(events_.end() - n, events_.end());
}

EventStats EventBus::get_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    load();
    EventStats stats;
    stats.trades_executed = trades_executed_;
    stats.total_pnl = total_pnl_;
    stats.current_position = current_position_;
    return stats;
}

// Caller holds mutex_
void EventBus::append(EventKind kind, std::string message, nlohmann::json details) {
    TradeEvent event;
    event.timestamp = iso_now();
    event.kind = kind;
    event.message = std::move(message);
    event.details = details.is_null() ? nlohmann::json::object() : std::move(details);
    events_.push_back(std::move(event));
    persist();
}

// Caller holds mutex_. Returns false if nothing was loaded.
bool EventBus::load() {
    // In-memory state is the only good copy once a write has failed
    if (degraded_) return false;

    std::ifstream in(path_);
    if (!in.is_open()) return false;

    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        std::cerr << "[C++] EventBus ignoring unreadable " << path_ << std::endl;
        return false;
    }

    try {
        std::vector<TradeEvent> events;
        if (doc.contains("events")) {
            events = doc["events"].get<std::vector<TradeEvent>>();
        }
        if (events.size() > kMaxEvents) {
            events.erase(events.begin(), events.end() - kMaxEvents);
        }

        std::optional<Position> position;
        if (doc.contains("current_position") && !doc["current_position"].is_null()) {
            position = doc["current_position"].get<Position>();
        }

        long long trades = doc.value("trades_executed", 0LL);
        double pnl = doc.value("total_pnl", 0.0);

        events_ = std::move(events);
        trades_executed_ = trades;
        total_pnl_ = pnl;
        current_position_ = std::move(position);
    } catch (const std::exception& e) {
        std::cerr << "[C++] EventBus ignoring malformed " << path_ << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

// Caller holds mutex_
void EventBus::persist() {
    if (events_.size() > kMaxEvents) {
        events_.erase(events_.begin(), events_.end() - kMaxEvents);
    }

    nlohmann::json doc;
    doc["events"] = events_;
    doc["trades_executed"] = trades_executed_;
    doc["total_pnl"] = total_pnl_;
    doc["current_position"] = current_position_ ? nlohmann::json(*current_position_) : nlohmann::json(nullptr);
    doc["last_update"] = iso_now();

    // Write a sibling and rename so readers never see half a file
    const std::string tmp_path = path_ + ".tmp";
    try {
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out.is_open()) {
                throw std::runtime_error("cannot open " + tmp_path);
            }
            out << doc.dump(2);
            out.flush();
            if (!out) {
                throw std::runtime_error("write failed for " + tmp_path);
            }
        }
        std::filesystem::rename(tmp_path, path_);

        if (degraded_) {
            std::cout << "[C++] EventBus persisting again to " << path_ << std::endl;
        }
        degraded_ = false;
    } catch (const std::exception& e) {
        if (!degraded_) {
            std::cerr << "[C++] EventBus write failed, keeping events in memory: " << e.what() << std::endl;
        }
        degraded_ = true;
    }
}
