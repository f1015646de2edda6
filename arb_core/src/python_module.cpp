#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "entities/price_state.hpp"
#include "entities/position.hpp"
#include "entities/trade_event.hpp"
#include "event_bus.hpp"

namespace py = pybind11;

// Read side for the dashboard process
PYBIND11_MODULE(arb_core, m) {
    // --- OrderBookState ---
    py::class_<OrderBookState>(m, "OrderBookState")
        .def(py::init<>())
        .def_readwrite("symbol", &OrderBookState::symbol)
        .def_readwrite("best_bid", &OrderBookState::best_bid)
        .def_readwrite("best_ask", &OrderBookState::best_ask)
        .def_readwrite("bid_size", &OrderBookState::bid_size)
        .def_readwrite("ask_size", &OrderBookState::ask_size)
        .def_readwrite("last_update", &OrderBookState::last_update)
        .def("is_valid", &OrderBookState::is_valid);

    // --- PriceState ---
    py::class_<PriceState>(m, "PriceState")
        .def(py::init<>())
        .def_readwrite("spot", &PriceState::spot)
        .def_readwrite("perp", &PriceState::perp)
        .def("is_ready", &PriceState::is_ready)
        .def("entry_spread", &PriceState::entry_spread)
        .def("exit_spread", &PriceState::exit_spread);

    // --- Position ---
    py::class_<Position>(m, "Position")
        .def_readonly("size", &Position::size)
        .def_readonly("entry_spot_price", &Position::entry_spot_price)
        .def_readonly("entry_perp_price", &Position::entry_perp_price)
        .def_readonly("entry_spread", &Position::entry_spread)
        .def_readonly("entry_time", &Position::entry_time);

    // --- TradeEvent ---
    // details is handed over as a JSON string
    py::class_<TradeEvent>(m, "TradeEvent")
        .def_readonly("timestamp", &TradeEvent::timestamp)
        .def_readonly("message", &TradeEvent::message)
        .def_property_readonly("event_type", [](const TradeEvent& e) { return std::string(event_kind_name(e.kind)); })
        .def_property_readonly("details", [](const TradeEvent& e) { return e.details.dump(); });

    // --- EventStats ---
    py::class_<EventStats>(m, "EventStats")
        .def_readonly("trades_executed", &EventStats::trades_executed)
        .def_readonly("total_pnl", &EventStats::total_pnl)
        .def_readonly("current_position", &EventStats::current_position);

    // --- EventBus (reader) ---
    py::class_<EventBus>(m, "EventBus")
        .def(py::init<std::string>(), py::arg("path") = "trade_events.json")
        .def("list_recent", &EventBus::list_recent, py::arg("limit") = 50)
        .def("get_stats", &EventBus::get_stats)
        .def_property_readonly("path", &EventBus::path);
}
